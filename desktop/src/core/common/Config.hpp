#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Parley {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Parley",
                    const QString& applicationName = "ParleyDesktop");

    // Settings file at an explicit location (tests, portable installs)
    void initializeWithFile(const QString& iniPath);

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    struct CaptureSettings {
        QString deviceId;              // empty = system default input
        int frameSamples = 8000;       // samples per frame at 16 kHz
        int queueCapacity = 256;       // frames buffered before capture blocks
    };

    struct RecognitionSettings {
        QString modelsPath;
        QString modelFile = "ggml-base.en.bin";
        QString language = "en";
        int threads = 4;
        double pauseThresholdSec = 1.0;
        double silenceThreshold = 0.01;
        int partialIntervalMs = 1000;
        int maxUtteranceSec = 30;

        QString modelPath() const;
    };

    struct SessionSettings {
        int pollIntervalMs = 100;
        QString exportDirectory;
    };

    CaptureSettings getCaptureSettings() const;
    RecognitionSettings getRecognitionSettings() const;
    SessionSettings getSessionSettings() const;

    void setCaptureSettings(const CaptureSettings& settings);
    void setRecognitionSettings(const RecognitionSettings& settings);
    void setSessionSettings(const SessionSettings& settings);

    QString getDataPath() const;
    QString getTempPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Parley
