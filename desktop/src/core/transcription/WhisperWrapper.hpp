#pragma once

#include <memory>
#include <vector>
#include <QtCore/QString>
#include "../common/Expected.hpp"

// Forward declare whisper.cpp types to avoid including the header here
struct whisper_context;
struct whisper_full_params;

namespace Parley {

enum class WhisperError {
    InitializationFailed,
    ModelLoadFailed,
    InferenceFailed,
    InvalidInput,
    InvalidModel
};

struct WhisperSegment {
    double startTime = 0.0;  // seconds, relative to the transcribed buffer
    double endTime = 0.0;
    QString text;
};

struct WhisperResult {
    QString fullText;
    std::vector<WhisperSegment> segments;
    double processingTime = 0.0; // in seconds
};

struct WhisperConfig {
    QString language = "en";
    int nThreads = 4;
    float temperature = 0.0f;
    int beamSize = 1;
    bool singleSegment = true;
    bool noContext = true;
    bool suppressBlank = true;
};

/**
 * @brief Direct wrapper around the whisper.cpp C library
 *
 * Owns one whisper_context. Not thread-safe: a single recognition thread
 * loads, transcribes and unloads.
 */
class WhisperWrapper {
public:
    WhisperWrapper();
    ~WhisperWrapper();

    WhisperWrapper(const WhisperWrapper&) = delete;
    WhisperWrapper& operator=(const WhisperWrapper&) = delete;
    WhisperWrapper(WhisperWrapper&&) = delete;
    WhisperWrapper& operator=(WhisperWrapper&&) = delete;

    /**
     * @brief Route whisper.cpp/ggml logging into the application logger
     */
    Expected<bool, WhisperError> initialize();

    /**
     * @brief Load a ggml model file, replacing any loaded model
     * @param modelPath Path to the .bin model file
     */
    Expected<bool, WhisperError> loadModel(const QString& modelPath);

    bool isModelLoaded() const;
    void unloadModel();

    /**
     * @brief Transcribe a mono 16 kHz float buffer in [-1, 1]
     */
    Expected<WhisperResult, WhisperError> transcribe(
        const std::vector<float>& audioData,
        const WhisperConfig& config = WhisperConfig{}
    );

private:
    struct WhisperWrapperPrivate;
    std::unique_ptr<WhisperWrapperPrivate> d;

    void initializeWhisperParams(whisper_full_params& params, const WhisperConfig& config);
    WhisperResult extractResult() const;
};

} // namespace Parley
