#pragma once

#include <QtCore/QString>
#include <optional>

#include "../audio/AudioCaptureSource.hpp"
#include "../common/Expected.hpp"
#include "TranscriptionTypes.hpp"

namespace Parley {

/**
 * @brief Stateful speech recognizer fed one capture frame at a time
 *
 * start() may take a long time (model load) and is therefore called from
 * the recognition thread; callers observe state() going Loading -> Ready.
 * Each start() opens a new relative time axis that begins at the first
 * consumed frame; stop() resets everything.
 */
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    virtual Expected<void, RecognitionError> start(const QString& modelPath) = 0;

    // At most one event per frame. An error affects only this frame.
    virtual Expected<std::optional<RecognitionEvent>, RecognitionError> consume(const AudioFrame& frame) = 0;

    // Finalizes an utterance still open at end of stream, if any.
    virtual std::optional<RecognitionEvent> flush() = 0;

    virtual void stop() = 0;
    virtual EngineState state() const = 0;
};

} // namespace Parley
