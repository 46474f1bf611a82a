#pragma once
#include <string>
#include "core/recognition/CharacterLibrary.hpp"
#include "utils/Logger.hpp"

namespace sm {

// Runtime settings shared by the controller, the capture layer and the app.
// Defaults match config/recognition.json.
struct RecognitionConfig {
    int precision{5};
    MapWeights weights;
    float drawDistance{2.f};
    float overlapDistance{10.f};
    std::string libraryFile{"data/libraries.json"};
    int libraryCount{1};
    LogLevel logLevel{LogLevel::Info};
};

} // namespace sm
