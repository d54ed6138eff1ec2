#include "WavFileCapture.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QThread>
#include <QtCore/QtEndian>
#include <algorithm>
#include <cstring>

namespace Parley {

WavFileCapture::WavFileCapture(const QString& filePath, int frameSamples, bool realtime)
    : filePath_(filePath)
    , frameSamples_(std::max(1, frameSamples))
    , realtime_(realtime) {
}

WavFileCapture::~WavFileCapture() {
    stop();
}

Expected<std::vector<qint16>, SessionError> WavFileCapture::loadPcm16Mono(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        PARLEY_ERROR("Cannot open WAV file: {}", filePath.toStdString());
        return makeUnexpected(SessionError::CaptureFailed);
    }

    const QByteArray bytes = file.readAll();
    if (bytes.size() < 12 || std::strncmp(bytes.constData(), "RIFF", 4) != 0
        || std::strncmp(bytes.constData() + 8, "WAVE", 4) != 0) {
        PARLEY_ERROR("Not a valid WAV file: {}", filePath.toStdString());
        return makeUnexpected(SessionError::CaptureFailed);
    }

    const auto* raw = reinterpret_cast<const uchar*>(bytes.constData());
    bool haveFormat = false;
    qsizetype offset = 12;

    while (offset + 8 <= bytes.size()) {
        const QByteArray chunkId = bytes.mid(offset, 4);
        const quint32 chunkSize = qFromLittleEndian<quint32>(raw + offset + 4);
        const qsizetype body = offset + 8;

        if (chunkId == "fmt ") {
            if (chunkSize < 16 || body + 16 > bytes.size()) {
                break;
            }
            const quint16 audioFormat = qFromLittleEndian<quint16>(raw + body);
            const quint16 numChannels = qFromLittleEndian<quint16>(raw + body + 2);
            const quint32 sampleRate = qFromLittleEndian<quint32>(raw + body + 4);
            const quint16 bitsPerSample = qFromLittleEndian<quint16>(raw + body + 14);

            if (audioFormat != 1 || numChannels != kChannels
                || sampleRate != static_cast<quint32>(kSampleRate) || bitsPerSample != 16) {
                PARLEY_ERROR("Unsupported WAV format in {}: format {}, {} ch, {} Hz, {}-bit "
                             "(need PCM mono 16 kHz 16-bit)",
                             filePath.toStdString(), audioFormat, numChannels, sampleRate, bitsPerSample);
                return makeUnexpected(SessionError::CaptureFailed);
            }
            haveFormat = true;
        } else if (chunkId == "data") {
            if (!haveFormat) {
                break;
            }
            const qsizetype available = std::min<qsizetype>(chunkSize, bytes.size() - body);
            if (available != static_cast<qsizetype>(chunkSize)) {
                PARLEY_WARN("Audio data size mismatch in {}", filePath.toStdString());
            }
            std::vector<qint16> samples(static_cast<size_t>(available / 2));
            for (size_t i = 0; i < samples.size(); ++i) {
                samples[i] = qFromLittleEndian<qint16>(raw + body + static_cast<qsizetype>(i) * 2);
            }
            PARLEY_INFO("Loaded WAV {}: {} samples", QFileInfo(filePath).fileName().toStdString(),
                        samples.size());
            return samples;
        }

        offset = body + chunkSize + (chunkSize % 2);
    }

    PARLEY_ERROR("WAV file has no usable fmt/data chunks: {}", filePath.toStdString());
    return makeUnexpected(SessionError::CaptureFailed);
}

Expected<void, SessionError> WavFileCapture::start(FrameSink sink) {
    if (running_) {
        return makeUnexpected(SessionError::InvalidOperation);
    }

    auto loaded = loadPcm16Mono(filePath_);
    if (loaded.hasError()) {
        return makeUnexpected(loaded.error());
    }
    samples_ = std::move(loaded).value();

    stopRequested_ = false;
    finished_ = false;
    running_ = true;

    thread_.reset(QThread::create([this, sink = std::move(sink)]() { run(sink); }));
    thread_->setObjectName("parley-wav-capture");
    thread_->start();

    PARLEY_INFO("WavFileCapture: replaying {} ({})", filePath_.toStdString(),
                realtime_ ? "realtime" : "unpaced");
    return {};
}

void WavFileCapture::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stopRequested_ = true;
    if (thread_) {
        thread_->wait();
        thread_.reset();
    }
    PARLEY_INFO("WavFileCapture: stopped");
}

bool WavFileCapture::isRunning() const {
    return running_;
}

QString WavFileCapture::description() const {
    return QFileInfo(filePath_).fileName();
}

void WavFileCapture::run(FrameSink sink) {
    const qint64 startMs = QDateTime::currentMSecsSinceEpoch();
    QElapsedTimer clock;
    clock.start();

    const size_t frameSamples = static_cast<size_t>(frameSamples_);
    size_t position = 0;

    while (!stopRequested_ && position < samples_.size()) {
        // The last frame is zero-padded to full size
        const size_t available = std::min(frameSamples, samples_.size() - position);
        AudioFrame frame;
        frame.samples.assign(samples_.begin() + static_cast<std::ptrdiff_t>(position),
                             samples_.begin() + static_cast<std::ptrdiff_t>(position + available));
        frame.samples.resize(frameSamples, 0);
        frame.capturedAtMs = startMs + static_cast<qint64>(position) * 1000 / kSampleRate;
        position += available;

        if (realtime_) {
            const qint64 dueMs = static_cast<qint64>(position) * 1000 / kSampleRate;
            qint64 remaining = dueMs - clock.elapsed();
            while (!stopRequested_ && remaining > 0) {
                QThread::msleep(static_cast<unsigned long>(std::min<qint64>(20, remaining)));
                remaining = dueMs - clock.elapsed();
            }
        }

        if (!sink(std::move(frame))) {
            break;
        }
    }

    finished_ = position >= samples_.size();
}

} // namespace Parley
