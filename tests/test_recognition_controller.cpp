#include "core/recognition/RecognitionController.hpp"
#include <cassert>
#include <vector>

static std::vector<sm::Point> hook() {
    std::vector<sm::Point> pts;
    for (int i = 0; i < 15; ++i)
        pts.push_back({100.f, 200.f - i * 10.f});
    for (int i = 1; i < 8; ++i)
        pts.push_back({100.f - i * 8.f, 60.f - i * 4.f});
    return pts;
}

int main() {
    sm::RecognitionConfig config;
    config.libraryCount = 3;
    sm::RecognitionController controller(config);
    assert(controller.precision() == 5);
    assert(controller.libraries().size() == 3);
    assert(controller.libraries()[2].name() == "Library 2");
    assert(controller.currentIndex() == 0);

    assert(!controller.setLibrary(5));
    assert(controller.currentIndex() == 0);
    assert(controller.setLibrary(2));
    assert(controller.currentLibrary().name() == "Library 2");

    controller.addDrawing("hook", hook());
    assert(controller.currentLibrary().contains("hook"));
    assert(!controller.libraries()[0].contains("hook"));
    auto match = controller.match(hook());
    assert(match && match->name == "hook");
    assert(match->percent == 100.0);
    assert(controller.rank(hook()).size() == 2);

    controller.setPrecision(7);
    assert(controller.precision() == 7);
    for (const auto& lib : controller.libraries()) {
        assert(lib.precision() == 7);
        for (const auto& c : lib.characters())
            assert(c.bitmap().precision() == 7);
    }
    assert(controller.encode(hook()).precision() == 7);

    sm::MapWeights bad;
    bad.circle = -1.0;
    assert(!controller.setWeights(bad));
    sm::MapWeights gridOnly{1.0, 0.0, 0.0, 0.0};
    assert(controller.setWeights(gridOnly));
    for (const auto& lib : controller.libraries())
        assert(lib.weights().circle == 0.0);

    // an empty replacement is ignored
    controller.replaceLibraries({});
    assert(controller.libraries().size() == 3);
    assert(controller.currentIndex() == 2);

    std::vector<sm::CharacterLibrary> stored;
    stored.emplace_back("Stored", 4);
    stored.back().add("hook", sm::Bitmap(hook(), 4));
    controller.replaceLibraries(std::move(stored));
    assert(controller.libraries().size() == 1);
    assert(controller.currentIndex() == 0);
    assert(controller.currentLibrary().precision() == 7);
    assert(controller.currentLibrary().find("hook")->bitmap().precision() == 7);
    // loaded libraries follow the controller's weights, not their own
    assert(controller.currentLibrary().weights().grid == 1.0);
    assert(controller.currentLibrary().weights().circle == 0.0);
    assert(controller.currentLibrary().weights().horizontal == 0.0);

    sm::RecognitionConfig weighted;
    weighted.weights.grid = 2.0;
    sm::RecognitionController heavy(weighted);
    std::vector<sm::CharacterLibrary> fresh;
    fresh.emplace_back("Fresh");
    heavy.replaceLibraries(std::move(fresh));
    assert(heavy.weights().grid == 2.0);
    assert(heavy.currentLibrary().weights().grid == 2.0);
    assert(heavy.currentLibrary().weights().circle == 1.0);

    sm::RecognitionConfig tiny;
    tiny.libraryCount = 0;
    tiny.precision = 0;
    sm::RecognitionController fallback(tiny);
    assert(fallback.libraries().size() == 1);
    assert(fallback.precision() == 1);
    return 0;
}
