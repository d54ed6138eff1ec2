#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QStringList>
#include <atomic>
#include <memory>
#include <vector>

#include "AudioCaptureSource.hpp"
#include "../common/Config.hpp"

QT_BEGIN_NAMESPACE
class QAudioSource;
class QIODevice;
class QObject;
class QThread;
QT_END_NAMESPACE

namespace Parley {

/**
 * @brief Microphone capture through Qt Multimedia
 *
 * Opens the configured (or default) input device as 16 kHz mono Int16 and
 * re-chunks whatever the device delivers into fixed-size frames. The
 * QAudioSource lives on a dedicated QThread so that a blocked frame sink
 * never stalls the UI event loop.
 */
class MicrophoneCapture : public AudioCaptureSource {
public:
    explicit MicrophoneCapture(const Config::CaptureSettings& settings);
    ~MicrophoneCapture() override;

    MicrophoneCapture(const MicrophoneCapture&) = delete;
    MicrophoneCapture& operator=(const MicrophoneCapture&) = delete;

    Expected<void, SessionError> start(FrameSink sink) override;
    void stop() override;
    bool isRunning() const override;
    QString description() const override;

    // "id<TAB>description" for every input device Qt can see
    static QStringList availableDevices();

private:
    void readAvailable();
    void emitCompleteFrames();
    // Zero-pads whatever is left in pending_ to a full frame
    void emitTrailingFrame();

    Config::CaptureSettings settings_;
    QString deviceDescription_;

    std::unique_ptr<QThread> thread_;
    QObject* context_ = nullptr;        // lives on thread_
    QAudioSource* audioSource_ = nullptr;
    QIODevice* device_ = nullptr;

    FrameSink sink_;
    std::vector<qint16> pending_;
    QByteArray carry_;                  // odd trailing byte between reads
    qint64 firstSampleMs_ = 0;
    qint64 emittedSamples_ = 0;
    bool sinkOpen_ = true;
    std::atomic<bool> running_{false};
};

} // namespace Parley
