#include "WhisperWrapper.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>

#include <whisper.h>
#include <algorithm>
#include <string>

namespace Parley {

struct WhisperWrapper::WhisperWrapperPrivate {
    whisper_context* ctx = nullptr;
    bool isInitialized = false;

    // whisper_full_params only stores a pointer to the language
    std::string language;
};

WhisperWrapper::WhisperWrapper()
    : d(std::make_unique<WhisperWrapperPrivate>()) {
}

WhisperWrapper::~WhisperWrapper() {
    unloadModel();
}

Expected<bool, WhisperError> WhisperWrapper::initialize() {
    if (d->isInitialized) {
        return true;
    }

    whisper_log_set([](enum ggml_log_level level, const char* text, void* user_data) {
        Q_UNUSED(user_data)
        const QString message = QString::fromUtf8(text).trimmed();
        if (message.isEmpty()) {
            return;
        }

        switch (level) {
            case GGML_LOG_LEVEL_ERROR:
                PARLEY_ERROR("whisper: {}", message.toStdString());
                break;
            case GGML_LOG_LEVEL_WARN:
                PARLEY_WARN("whisper: {}", message.toStdString());
                break;
            default:
                PARLEY_DEBUG("whisper: {}", message.toStdString());
                break;
        }
    }, nullptr);

    d->isInitialized = true;
    PARLEY_INFO("whisper.cpp initialized");
    return true;
}

Expected<bool, WhisperError> WhisperWrapper::loadModel(const QString& modelPath) {
    if (!d->isInitialized) {
        auto initResult = initialize();
        if (initResult.hasError()) {
            return initResult;
        }
    }

    unloadModel();

    QFileInfo modelFile(modelPath);
    if (!modelFile.exists() || !modelFile.isFile()) {
        PARLEY_ERROR("Model file not found: {}", modelPath.toStdString());
        return makeUnexpected(WhisperError::ModelLoadFailed);
    }

    if (modelFile.size() < 1024 * 1024) { // Models should be at least 1MB
        PARLEY_ERROR("Model file too small: {}", modelPath.toStdString());
        return makeUnexpected(WhisperError::InvalidModel);
    }

    PARLEY_INFO("Loading model: {}", modelPath.toStdString());

    const std::string modelPathStd = modelPath.toStdString();
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = true;

    d->ctx = whisper_init_from_file_with_params(modelPathStd.c_str(), cparams);
    if (!d->ctx) {
        PARLEY_ERROR("Failed to load model: {}", modelPath.toStdString());
        return makeUnexpected(WhisperError::ModelLoadFailed);
    }

    PARLEY_INFO("Model loaded: {} (vocab: {}, multilingual: {})",
                modelFile.baseName().toStdString(),
                whisper_n_vocab(d->ctx),
                whisper_is_multilingual(d->ctx) != 0);
    return true;
}

bool WhisperWrapper::isModelLoaded() const {
    return d->ctx != nullptr;
}

void WhisperWrapper::unloadModel() {
    if (d->ctx) {
        whisper_free(d->ctx);
        d->ctx = nullptr;
        PARLEY_INFO("Model unloaded");
    }
}

Expected<WhisperResult, WhisperError> WhisperWrapper::transcribe(
    const std::vector<float>& audioData,
    const WhisperConfig& config) {

    if (!isModelLoaded()) {
        PARLEY_ERROR("No model loaded for transcription");
        return makeUnexpected(WhisperError::ModelLoadFailed);
    }

    if (audioData.empty()) {
        return makeUnexpected(WhisperError::InvalidInput);
    }

    QElapsedTimer timer;
    timer.start();

    whisper_full_params params = whisper_full_default_params(
        config.beamSize > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
    initializeWhisperParams(params, config);

    const int result = whisper_full(d->ctx, params, audioData.data(), static_cast<int>(audioData.size()));
    if (result != 0) {
        PARLEY_ERROR("whisper_full failed with code {}", result);
        return makeUnexpected(WhisperError::InferenceFailed);
    }

    WhisperResult whisperResult = extractResult();
    whisperResult.processingTime = timer.elapsed() / 1000.0;

    PARLEY_DEBUG("Transcribed {:.2f}s of audio in {:.2f}s, {} segments",
                 static_cast<double>(audioData.size()) / 16000.0,
                 whisperResult.processingTime,
                 whisperResult.segments.size());
    return whisperResult;
}

void WhisperWrapper::initializeWhisperParams(whisper_full_params& params, const WhisperConfig& config) {
    d->language = config.language.isEmpty() ? std::string("auto") : config.language.toStdString();
    params.language = d->language.c_str();

    params.n_threads = std::max(1, config.nThreads);
    params.temperature = config.temperature;
    params.beam_search.beam_size = std::max(1, config.beamSize);

    params.print_timestamps = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;

    params.translate = false;
    params.single_segment = config.singleSegment;
    params.no_context = config.noContext;
    params.suppress_blank = config.suppressBlank;
}

WhisperResult WhisperWrapper::extractResult() const {
    WhisperResult result;
    if (!d->ctx) {
        return result;
    }

    const int n_segments = whisper_full_n_segments(d->ctx);
    result.segments.reserve(static_cast<size_t>(std::max(0, n_segments)));

    QStringList parts;
    for (int i = 0; i < n_segments; ++i) {
        WhisperSegment segment;
        // Centiseconds
        segment.startTime = whisper_full_get_segment_t0(d->ctx, i) / 100.0;
        segment.endTime = whisper_full_get_segment_t1(d->ctx, i) / 100.0;

        const char* text = whisper_full_get_segment_text(d->ctx, i);
        if (text) {
            segment.text = QString::fromUtf8(text).trimmed();
        }
        if (!segment.text.isEmpty()) {
            parts << segment.text;
        }
        result.segments.push_back(segment);
    }

    result.fullText = parts.join(' ');
    return result;
}

} // namespace Parley
