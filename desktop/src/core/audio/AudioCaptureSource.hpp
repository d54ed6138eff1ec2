#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include <functional>
#include <vector>

#include "../common/Expected.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

constexpr int kSampleRate = 16000;
constexpr int kChannels = 1;

// Fixed-size block of 16 kHz mono signed 16-bit PCM.
struct AudioFrame {
    std::vector<qint16> samples;
    qint64 capturedAtMs = 0;    // wall clock of the first sample

    double durationSeconds() const {
        return static_cast<double>(samples.size()) / kSampleRate;
    }
};

// Receives frames on the capture thread. Returning false means the
// consumer has closed and the source should discard further audio.
using FrameSink = std::function<bool(AudioFrame&&)>;

/**
 * @brief Producer side of the audio pipeline
 *
 * Implementations own their capture thread. start() fails fast when the
 * device (or file) cannot be opened; stop() is idempotent and returns only
 * after the capture thread has finished delivering frames.
 */
class AudioCaptureSource {
public:
    virtual ~AudioCaptureSource() = default;

    virtual Expected<void, SessionError> start(FrameSink sink) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
    virtual QString description() const = 0;
};

} // namespace Parley
