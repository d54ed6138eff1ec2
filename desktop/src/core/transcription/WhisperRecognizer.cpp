#include "WhisperRecognizer.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace Parley {

namespace {

UtteranceEndpointer::Settings endpointerSettings(const Config::RecognitionSettings& settings) {
    UtteranceEndpointer::Settings result;
    result.sampleRate = kSampleRate;
    result.pauseThresholdSec = settings.pauseThresholdSec;
    result.silenceThreshold = settings.silenceThreshold;
    result.maxUtteranceSec = settings.maxUtteranceSec;
    return result;
}

RecognitionError mapWhisperError(WhisperError error) {
    switch (error) {
        case WhisperError::ModelLoadFailed:
        case WhisperError::InvalidModel:
        case WhisperError::InitializationFailed:
            return RecognitionError::ModelLoadFailed;
        case WhisperError::InvalidInput:
            return RecognitionError::InvalidFrame;
        case WhisperError::InferenceFailed:
            break;
    }
    return RecognitionError::InferenceFailed;
}

} // namespace

WhisperRecognizer::WhisperRecognizer(const Config::RecognitionSettings& settings)
    : settings_(settings)
    , endpointer_(endpointerSettings(settings)) {
    whisperConfig_.language = settings_.language;
    whisperConfig_.nThreads = settings_.threads;
}

WhisperRecognizer::~WhisperRecognizer() {
    stop();
}

QStringList WhisperRecognizer::availableModels(const QString& directory) {
    QDir dir(directory);
    if (!dir.exists()) {
        return {};
    }
    return dir.entryList(QStringList() << "*.bin", QDir::Files | QDir::Readable, QDir::Name);
}

Expected<void, RecognitionError> WhisperRecognizer::start(const QString& modelPath) {
    if (state_ != EngineState::Idle) {
        stop();
    }

    if (!QFileInfo::exists(modelPath)) {
        PARLEY_ERROR("Recognition model not found: {}", modelPath.toStdString());
        return makeUnexpected(RecognitionError::ModelNotFound);
    }

    state_ = EngineState::Loading;
    auto loaded = loadModel(modelPath);
    if (loaded.hasError()) {
        state_ = EngineState::Idle;
        return loaded;
    }

    endpointer_.reset();
    samplesSincePartial_ = 0;
    lastPartial_.clear();
    state_ = EngineState::Ready;
    PARLEY_INFO("WhisperRecognizer ready ({})", QFileInfo(modelPath).fileName().toStdString());
    return {};
}

Expected<std::optional<RecognitionEvent>, RecognitionError> WhisperRecognizer::consume(const AudioFrame& frame) {
    if (state_ != EngineState::Ready) {
        return makeUnexpected(RecognitionError::NotReady);
    }
    if (frame.samples.empty()) {
        return makeUnexpected(RecognitionError::InvalidFrame);
    }

    const auto decision = endpointer_.feed(frame.samples);

    if (decision == UtteranceEndpointer::Decision::End) {
        auto finalEvent = finalizeUtterance();
        if (finalEvent.hasError()) {
            return makeUnexpected(finalEvent.error());
        }
        return std::optional<RecognitionEvent>(finalEvent.value());
    }

    if (decision == UtteranceEndpointer::Decision::Idle) {
        return std::optional<RecognitionEvent>();
    }

    samplesSincePartial_ += static_cast<qint64>(frame.samples.size());
    const qint64 partialSamples = static_cast<qint64>(settings_.partialIntervalMs) * kSampleRate / 1000;
    if (samplesSincePartial_ < partialSamples) {
        return std::optional<RecognitionEvent>();
    }
    samplesSincePartial_ = 0;

    auto text = transcribeUtterance();
    if (text.hasError()) {
        return makeUnexpected(text.error());
    }
    if (text.value() == lastPartial_) {
        return std::optional<RecognitionEvent>();
    }
    lastPartial_ = text.value();
    return std::optional<RecognitionEvent>(RecognitionEvent::makePartial(lastPartial_));
}

std::optional<RecognitionEvent> WhisperRecognizer::flush() {
    if (state_ != EngineState::Ready || !endpointer_.inUtterance()) {
        return std::nullopt;
    }

    auto finalEvent = finalizeUtterance();
    if (finalEvent.hasError()) {
        return std::nullopt;
    }
    return finalEvent.value();
}

void WhisperRecognizer::stop() {
    if (state_ == EngineState::Idle && !whisper_.isModelLoaded()) {
        return;
    }
    unloadModel();
    endpointer_.reset();
    samplesSincePartial_ = 0;
    lastPartial_.clear();
    state_ = EngineState::Idle;
}

EngineState WhisperRecognizer::state() const {
    return state_;
}

Expected<void, RecognitionError> WhisperRecognizer::loadModel(const QString& modelPath) {
    auto loaded = whisper_.loadModel(modelPath);
    if (loaded.hasError()) {
        return makeUnexpected(mapWhisperError(loaded.error()));
    }
    return {};
}

void WhisperRecognizer::unloadModel() {
    whisper_.unloadModel();
}

Expected<QString, RecognitionError> WhisperRecognizer::transcribe(const std::vector<float>& audio) {
    auto result = whisper_.transcribe(audio, whisperConfig_);
    if (result.hasError()) {
        return makeUnexpected(mapWhisperError(result.error()));
    }
    return result.value().fullText;
}

Expected<QString, RecognitionError> WhisperRecognizer::transcribeUtterance() {
    return transcribe(endpointer_.utteranceAudio());
}

Expected<RecognitionEvent, RecognitionError> WhisperRecognizer::finalizeUtterance() {
    const double relativeEnd = endpointer_.elapsedSeconds();
    auto text = transcribe(endpointer_.takeUtterance());
    const QString fallback = lastPartial_;
    samplesSincePartial_ = 0;
    lastPartial_.clear();

    if (text.hasError()) {
        if (fallback.isEmpty()) {
            PARLEY_WARN("Utterance ending at {:.3f}s could not be transcribed: {}",
                        relativeEnd, toString(text.error()).toStdString());
            return makeUnexpected(text.error());
        }
        PARLEY_WARN("Final transcription failed ({}), keeping the last partial",
                    toString(text.error()).toStdString());
        return RecognitionEvent::makeFinal(fallback, relativeEnd);
    }
    return RecognitionEvent::makeFinal(text.value(), relativeEnd);
}

} // namespace Parley
