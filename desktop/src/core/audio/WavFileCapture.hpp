#pragma once

#include <QtCore/QString>
#include <atomic>
#include <memory>
#include <vector>

#include "AudioCaptureSource.hpp"

QT_BEGIN_NAMESPACE
class QThread;
QT_END_NAMESPACE

namespace Parley {

/**
 * @brief Replays a 16 kHz mono 16-bit PCM WAV file as capture frames
 *
 * With realtime pacing enabled each frame is delivered after its own
 * duration has elapsed, so the recognizer sees the same timing as a live
 * microphone. Without pacing frames are delivered as fast as the sink
 * accepts them.
 */
class WavFileCapture : public AudioCaptureSource {
public:
    WavFileCapture(const QString& filePath, int frameSamples, bool realtime = true);
    ~WavFileCapture() override;

    WavFileCapture(const WavFileCapture&) = delete;
    WavFileCapture& operator=(const WavFileCapture&) = delete;

    Expected<void, SessionError> start(FrameSink sink) override;
    void stop() override;
    bool isRunning() const override;
    QString description() const override;

    // True once every sample of the file has been delivered
    bool isFinished() const { return finished_; }

    static Expected<std::vector<qint16>, SessionError> loadPcm16Mono(const QString& filePath);

private:
    void run(FrameSink sink);

    QString filePath_;
    int frameSamples_;
    bool realtime_;

    std::vector<qint16> samples_;
    std::unique_ptr<QThread> thread_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
};

} // namespace Parley
