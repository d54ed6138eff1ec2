#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <atomic>

#include "../common/Config.hpp"
#include "RecognitionEngine.hpp"
#include "UtteranceEndpointer.hpp"
#include "WhisperWrapper.hpp"

namespace Parley {

/**
 * @brief RecognitionEngine backed by whisper.cpp
 *
 * whisper.cpp is not a streaming recognizer, so utterances are cut by
 * UtteranceEndpointer and transcribed as a whole. While an utterance is
 * open it is re-transcribed every partialIntervalMs of audio to produce
 * Partial events.
 */
class WhisperRecognizer : public RecognitionEngine {
public:
    explicit WhisperRecognizer(const Config::RecognitionSettings& settings);
    ~WhisperRecognizer() override;

    Expected<void, RecognitionError> start(const QString& modelPath) override;
    Expected<std::optional<RecognitionEvent>, RecognitionError> consume(const AudioFrame& frame) override;
    std::optional<RecognitionEvent> flush() override;
    void stop() override;
    EngineState state() const override;

    // Model files (*.bin) in a directory, sorted by name
    static QStringList availableModels(const QString& directory);

protected:
    // The whisper.cpp calls; tests replace them to drive endpointing without a model
    virtual Expected<void, RecognitionError> loadModel(const QString& modelPath);
    virtual void unloadModel();
    virtual Expected<QString, RecognitionError> transcribe(const std::vector<float>& audio);

private:
    Expected<QString, RecognitionError> transcribeUtterance();

    // Closes the current utterance. A failed transcription falls back to the
    // last partial so recognized speech is not lost.
    Expected<RecognitionEvent, RecognitionError> finalizeUtterance();

    Config::RecognitionSettings settings_;
    WhisperConfig whisperConfig_;
    WhisperWrapper whisper_;
    UtteranceEndpointer endpointer_;

    std::atomic<EngineState> state_{EngineState::Idle};
    qint64 samplesSincePartial_ = 0;
    QString lastPartial_;
};

} // namespace Parley
