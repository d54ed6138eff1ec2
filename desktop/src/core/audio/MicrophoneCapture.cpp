#include "MicrophoneCapture.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QIODevice>
#include <QtCore/QMetaObject>
#include <QtCore/QObject>
#include <QtCore/QThread>
#include <QtMultimedia/QAudioDevice>
#include <QtMultimedia/QAudioFormat>
#include <QtMultimedia/QAudioSource>
#include <QtMultimedia/QMediaDevices>
#include <cstddef>
#include <cstring>

namespace Parley {

MicrophoneCapture::MicrophoneCapture(const Config::CaptureSettings& settings)
    : settings_(settings) {
}

MicrophoneCapture::~MicrophoneCapture() {
    stop();
}

QStringList MicrophoneCapture::availableDevices() {
    QStringList devices;
    for (const QAudioDevice& device : QMediaDevices::audioInputs()) {
        devices << QString::fromUtf8(device.id()) + '\t' + device.description();
    }
    return devices;
}

Expected<void, SessionError> MicrophoneCapture::start(FrameSink sink) {
    if (running_) {
        PARLEY_WARN("MicrophoneCapture: start() while already capturing");
        return makeUnexpected(SessionError::InvalidOperation);
    }

    const auto inputs = QMediaDevices::audioInputs();
    if (inputs.isEmpty()) {
        PARLEY_ERROR("MicrophoneCapture: No audio input devices available");
        return makeUnexpected(SessionError::CaptureFailed);
    }

    QAudioDevice device = QMediaDevices::defaultAudioInput();
    if (!settings_.deviceId.isEmpty()) {
        device = QAudioDevice();
        for (const QAudioDevice& candidate : inputs) {
            if (QString::fromUtf8(candidate.id()) == settings_.deviceId) {
                device = candidate;
                break;
            }
        }
    }
    if (device.isNull()) {
        PARLEY_ERROR("MicrophoneCapture: Audio input device not found: {}",
                     settings_.deviceId.toStdString());
        return makeUnexpected(SessionError::CaptureFailed);
    }

    QAudioFormat format;
    format.setSampleRate(kSampleRate);
    format.setChannelCount(kChannels);
    format.setSampleFormat(QAudioFormat::Int16);

    if (!device.isFormatSupported(format)) {
        PARLEY_ERROR("MicrophoneCapture: {} does not support 16 kHz mono Int16",
                     device.description().toStdString());
        return makeUnexpected(SessionError::CaptureFailed);
    }

    sink_ = std::move(sink);
    pending_.clear();
    pending_.reserve(static_cast<size_t>(settings_.frameSamples) * 2);
    carry_.clear();
    emittedSamples_ = 0;
    firstSampleMs_ = 0;
    sinkOpen_ = true;
    deviceDescription_ = device.description();

    thread_ = std::make_unique<QThread>();
    thread_->setObjectName("parley-capture");
    context_ = new QObject;
    context_->moveToThread(thread_.get());
    thread_->start();

    bool opened = false;
    QMetaObject::invokeMethod(context_, [this, device, format, &opened]() {
        audioSource_ = new QAudioSource(device, format, context_);
        audioSource_->setBufferSize(settings_.frameSamples * static_cast<int>(sizeof(qint16)) * 2);

        QObject::connect(audioSource_, &QAudioSource::stateChanged, context_, [this](QAudio::State state) {
            if (state == QAudio::StoppedState && audioSource_->error() != QAudio::NoError) {
                PARLEY_WARN("MicrophoneCapture: device stopped with error {}",
                            static_cast<int>(audioSource_->error()));
            }
        });

        device_ = audioSource_->start();
        opened = device_ != nullptr && audioSource_->error() == QAudio::NoError;
        if (opened) {
            QObject::connect(device_, &QIODevice::readyRead, context_, [this]() { readAvailable(); });
        }
    }, Qt::BlockingQueuedConnection);

    if (!opened) {
        PARLEY_ERROR("MicrophoneCapture: Failed to open {}", deviceDescription_.toStdString());
        running_ = true;
        stop();
        return makeUnexpected(SessionError::CaptureFailed);
    }

    running_ = true;
    PARLEY_INFO("MicrophoneCapture: capturing from {} ({} samples/frame)",
                deviceDescription_.toStdString(), settings_.frameSamples);
    return {};
}

void MicrophoneCapture::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (thread_ && context_) {
        QMetaObject::invokeMethod(context_, [this]() {
            if (audioSource_) {
                readAvailable();
                audioSource_->stop();
                emitTrailingFrame();
                delete audioSource_;
                audioSource_ = nullptr;
            }
            device_ = nullptr;
        }, Qt::BlockingQueuedConnection);

        thread_->quit();
        thread_->wait();
    }

    delete context_;
    context_ = nullptr;
    thread_.reset();
    sink_ = nullptr;

    PARLEY_INFO("MicrophoneCapture: stopped after {} samples", emittedSamples_);
}

bool MicrophoneCapture::isRunning() const {
    return running_;
}

QString MicrophoneCapture::description() const {
    return deviceDescription_.isEmpty() ? QStringLiteral("default microphone") : deviceDescription_;
}

void MicrophoneCapture::readAvailable() {
    if (!device_) {
        return;
    }

    QByteArray bytes = carry_ + device_->readAll();
    carry_.clear();
    if (bytes.isEmpty()) {
        return;
    }
    if (bytes.size() % 2 != 0) {
        carry_ = bytes.right(1);
        bytes.chop(1);
    }

    if (firstSampleMs_ == 0) {
        // Back-date the stream start by the audio already buffered.
        const qint64 bufferedMs = (bytes.size() / 2) * 1000 / kSampleRate;
        firstSampleMs_ = QDateTime::currentMSecsSinceEpoch() - bufferedMs;
    }

    if (!sinkOpen_) {
        return;
    }

    const size_t count = static_cast<size_t>(bytes.size()) / sizeof(qint16);
    const size_t offset = pending_.size();
    pending_.resize(offset + count);
    std::memcpy(pending_.data() + offset, bytes.constData(), count * sizeof(qint16));

    emitCompleteFrames();
}

void MicrophoneCapture::emitCompleteFrames() {
    const size_t frameSamples = static_cast<size_t>(settings_.frameSamples);
    size_t consumed = 0;

    while (sinkOpen_ && pending_.size() - consumed >= frameSamples) {
        AudioFrame frame;
        frame.samples.assign(pending_.begin() + consumed, pending_.begin() + consumed + frameSamples);
        frame.capturedAtMs = firstSampleMs_ + emittedSamples_ * 1000 / kSampleRate;
        consumed += frameSamples;
        emittedSamples_ += static_cast<qint64>(frameSamples);

        if (!sink_(std::move(frame))) {
            sinkOpen_ = false;
            PARLEY_DEBUG("MicrophoneCapture: consumer closed, discarding further audio");
        }
    }

    if (!sinkOpen_) {
        pending_.clear();
        return;
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(consumed));
}

void MicrophoneCapture::emitTrailingFrame() {
    if (!sinkOpen_ || pending_.empty()) {
        pending_.clear();
        return;
    }

    const qint64 available = static_cast<qint64>(pending_.size());
    AudioFrame frame;
    frame.samples = std::move(pending_);
    frame.samples.resize(static_cast<size_t>(settings_.frameSamples), 0);
    frame.capturedAtMs = firstSampleMs_ + emittedSamples_ * 1000 / kSampleRate;
    emittedSamples_ += available;
    pending_.clear();

    if (!sink_(std::move(frame))) {
        sinkOpen_ = false;
        PARLEY_DEBUG("MicrophoneCapture: consumer closed before the last {} samples", available);
    }
}

} // namespace Parley
