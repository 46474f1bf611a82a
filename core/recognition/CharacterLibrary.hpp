#pragma once
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Bitmap.hpp"
#include "ShapeComparator.hpp"
#include "utils/Logger.hpp"

namespace sm {

// A named reference drawing.
class Character {
public:
    Character(std::string name, Bitmap bitmap)
        : m_name(std::move(name)), m_bitmap(std::move(bitmap)) {}

    const std::string& name() const { return m_name; }
    const Bitmap& bitmap() const { return m_bitmap; }

private:
    friend class CharacterLibrary;
    std::string m_name;
    Bitmap m_bitmap;
};

struct MapWeights {
    double grid{1.0};
    double circle{1.0};
    double horizontal{1.0};
    double vertical{1.0};
};

struct MatchResult {
    std::string name;
    double rawScore{0.0};
    double percent{0.0};
};

// Raw distance between two bitmaps, lower is closer. Grid and circle errors
// are scaled by 100 to sit on the same range as the flat map fractions.
inline double scoreBitmaps(const Bitmap& shape, const Bitmap& reference, const MapWeights& w) {
    double grid = 100.0 * gridDifference(shape, reference);
    double circle = 100.0 * circleDifference(shape, reference, CircleCenter::Median);
    double horizontal = flatMapDifference(shape, reference, Axis::Horizontal);
    double vertical = flatMapDifference(shape, reference, Axis::Vertical);
    biasCorrect(grid, circle);
    return horizontal * w.horizontal + vertical * w.vertical + circle * w.circle +
           grid * w.grid;
}

// Rewrites raw scores, sorted ascending, as percentages of the mean score:
// 100 for a perfect match, 0 at or above the mean. Truncated to two decimals.
inline void scoresToPercent(std::vector<MatchResult>& results) {
    if (results.empty())
        return;
    double total = 0.0;
    for (const auto& r : results)
        total += r.rawScore;
    double mean = total / static_cast<double>(results.size());
    if (mean == 0.0)
        mean = 1.0;
    for (auto& r : results) {
        double ratio = std::min(r.rawScore / mean, 1.0);
        double percent = 100.0 - 100.0 * ratio;
        r.percent = std::trunc(percent * 100.0) / 100.0;
    }
}

// CharacterLibrary holds reference drawings keyed by name, in insertion
// order, and ranks input bitmaps against them. A reserved "Empty" character
// is always present after construction and after clear().
class CharacterLibrary {
public:
    static constexpr const char* kEmptyName = "Empty";

    explicit CharacterLibrary(std::string name, int precision = 4)
        : m_name(std::move(name)), m_precision(precision < 1 ? 1 : precision) {
        addEmpty();
    }

    const std::string& name() const { return m_name; }
    void setName(const std::string& name) { m_name = name; }
    int precision() const { return m_precision; }
    const MapWeights& weights() const { return m_weights; }
    const std::vector<Character>& characters() const { return m_characters; }
    size_t size() const { return m_characters.size(); }

    // Replaces a character of the same name in place, otherwise appends.
    void add(Character character) {
        for (auto& existing : m_characters) {
            if (existing.name() == character.name()) {
                SM_LOG(LogLevel::Debug, "Replacing character '" + character.name() + "' in " + m_name);
                existing = std::move(character);
                return;
            }
        }
        SM_LOG(LogLevel::Debug, "Adding character '" + character.name() + "' to " + m_name);
        m_characters.push_back(std::move(character));
    }

    void add(const std::string& name, Bitmap bitmap) { add(Character(name, std::move(bitmap))); }

    bool remove(const std::string& name) {
        auto it = std::find_if(m_characters.begin(), m_characters.end(),
                               [&](const Character& c) { return c.name() == name; });
        if (it == m_characters.end())
            return false;
        m_characters.erase(it);
        return true;
    }

    bool remove(const Character& character) { return remove(character.name()); }

    void clear() {
        m_characters.clear();
        addEmpty();
    }

    const Character* find(const std::string& name) const {
        for (const auto& c : m_characters)
            if (c.name() == name)
                return &c;
        return nullptr;
    }

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Weights must be non-negative; otherwise nothing changes.
    bool setWeights(double grid, double circle, double horizontal, double vertical) {
        if (grid < 0.0 || circle < 0.0 || horizontal < 0.0 || vertical < 0.0) {
            SM_LOG(LogLevel::Warn, "Ignoring negative map weights for library " + m_name);
            return false;
        }
        m_weights = {grid, circle, horizontal, vertical};
        return true;
    }

    bool setWeights(const MapWeights& w) {
        return setWeights(w.grid, w.circle, w.horizontal, w.vertical);
    }

    // Rebuilds every stored bitmap, "Empty" included, at the new precision.
    void setPrecision(int precision) {
        if (precision < 1)
            precision = 1;
        m_precision = precision;
        for (auto& c : m_characters)
            c.m_bitmap.setPrecision(precision);
    }

    double score(const Bitmap& shape, const Character& reference) const {
        return scoreBitmaps(shape, reference.bitmap(), m_weights);
    }

    // Score between two stored characters; 100 when either is missing.
    double compareCharacters(const std::string& first, const std::string& second) const {
        const Character* a = find(first);
        const Character* b = find(second);
        if (!a || !b) {
            SM_LOG(LogLevel::Warn, "compareCharacters: no character named '" +
                                       (a ? second : first) + "' in " + m_name);
            return kIncomparableDifference;
        }
        return scoreBitmaps(a->bitmap(), b->bitmap(), m_weights);
    }

    // Every character, closest first, with percentages relative to the
    // library's mean score. Equal scores keep insertion order.
    std::vector<MatchResult> rank(const Bitmap& shape) const {
        std::vector<MatchResult> results;
        results.reserve(m_characters.size());
        for (const auto& c : m_characters) {
            double raw = score(shape, c);
            if (logEnabled(LogLevel::Debug))
                SM_LOG(LogLevel::Debug, "Compared to '" + c.name() + "' score: " + std::to_string(raw));
            results.push_back({c.name(), raw, 0.0});
        }
        std::stable_sort(results.begin(), results.end(),
                         [](const MatchResult& a, const MatchResult& b) {
                             return a.rawScore < b.rawScore;
                         });
        scoresToPercent(results);
        return results;
    }

    std::optional<MatchResult> bestMatch(const Bitmap& shape) const {
        std::vector<MatchResult> results = rank(shape);
        if (results.empty())
            return std::nullopt;
        return results.front();
    }

private:
    void addEmpty() { add(Character(kEmptyName, Bitmap(std::vector<Point>(), m_precision))); }

    std::string m_name;
    int m_precision;
    MapWeights m_weights;
    std::vector<Character> m_characters;
};

} // namespace sm
