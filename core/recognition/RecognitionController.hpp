#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "CharacterLibrary.hpp"
#include "core/config/RecognitionConfig.hpp"
#include "utils/Logger.hpp"

namespace sm {

// Owns the set of character libraries the user can switch between and keeps
// their precision and weights in step with the configuration.
class RecognitionController {
public:
    explicit RecognitionController(const RecognitionConfig& config = RecognitionConfig())
        : m_precision(config.precision < 1 ? 1 : config.precision), m_weights(config.weights) {
        const int count = config.libraryCount < 1 ? 1 : config.libraryCount;
        for (int i = 0; i < count; ++i)
            addLibrary("Library " + std::to_string(i));
    }

    int precision() const { return m_precision; }
    const MapWeights& weights() const { return m_weights; }

    const std::vector<CharacterLibrary>& libraries() const { return m_libraries; }
    size_t currentIndex() const { return m_current; }
    CharacterLibrary& currentLibrary() { return m_libraries[m_current]; }
    const CharacterLibrary& currentLibrary() const { return m_libraries[m_current]; }

    bool setLibrary(size_t index) {
        if (index >= m_libraries.size()) {
            SM_LOG(LogLevel::Warn, "No library at index " + std::to_string(index));
            return false;
        }
        m_current = index;
        SM_LOG(LogLevel::Info, "Selected library " + std::to_string(index) + " (" +
                                   m_libraries[index].name() + ")");
        return true;
    }

    CharacterLibrary& addLibrary(const std::string& name) {
        CharacterLibrary lib(name, m_precision);
        lib.setWeights(m_weights);
        m_libraries.push_back(std::move(lib));
        return m_libraries.back();
    }

    // Takes over libraries read from storage, bringing them to the current
    // precision and weights. An empty list leaves the existing libraries alone.
    void replaceLibraries(std::vector<CharacterLibrary> libraries) {
        if (libraries.empty()) {
            SM_LOG(LogLevel::Warn, "Refusing to replace libraries with an empty set");
            return;
        }
        m_libraries = std::move(libraries);
        for (auto& lib : m_libraries) {
            if (lib.precision() != m_precision)
                lib.setPrecision(m_precision);
            lib.setWeights(m_weights);
        }
        m_current = 0;
    }

    Bitmap encode(const std::vector<Point>& points) const { return Bitmap(points, m_precision); }

    void addDrawing(const std::string& name, const std::vector<Point>& points) {
        currentLibrary().add(name, encode(points));
        SM_LOG(LogLevel::Info, "Added symbol '" + name + "' to " + currentLibrary().name());
    }

    std::optional<MatchResult> match(const std::vector<Point>& points) const {
        return currentLibrary().bestMatch(encode(points));
    }

    std::vector<MatchResult> rank(const std::vector<Point>& points) const {
        return currentLibrary().rank(encode(points));
    }

    void setPrecision(int precision) {
        m_precision = precision < 1 ? 1 : precision;
        for (auto& lib : m_libraries)
            lib.setPrecision(m_precision);
    }

    bool setWeights(const MapWeights& weights) {
        if (weights.grid < 0.0 || weights.circle < 0.0 || weights.horizontal < 0.0 ||
            weights.vertical < 0.0)
            return false;
        m_weights = weights;
        for (auto& lib : m_libraries)
            lib.setWeights(weights);
        return true;
    }

private:
    int m_precision;
    MapWeights m_weights;
    std::vector<CharacterLibrary> m_libraries;
    size_t m_current{0};
};

} // namespace sm
