#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>
#include <QtCore/QThread>

namespace Parley {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    PARLEY_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeWithFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    ensureDirectoriesExist();
    PARLEY_INFO("Config initialized from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

QString Config::RecognitionSettings::modelPath() const {
    if (QDir::isAbsolutePath(modelFile)) {
        return modelFile;
    }
    return QDir(modelsPath).filePath(modelFile);
}

Config::CaptureSettings Config::getCaptureSettings() const {
    CaptureSettings settings;
    settings.deviceId = getString("capture/deviceId");
    settings.frameSamples = qMax(160, getInt("capture/frameSamples", 8000));
    settings.queueCapacity = qMax(1, getInt("capture/queueCapacity", 256));
    return settings;
}

Config::RecognitionSettings Config::getRecognitionSettings() const {
    RecognitionSettings settings;
    settings.modelsPath = getString("recognition/modelsPath", getDataPath() + "/models");
    settings.modelFile = getString("recognition/modelFile", "ggml-base.en.bin");
    settings.language = getString("recognition/language", "en");
    settings.threads = getInt("recognition/threads", qBound(1, QThread::idealThreadCount(), 8));
    settings.pauseThresholdSec = getDouble("recognition/pauseThresholdSec", 1.0);
    settings.silenceThreshold = getDouble("recognition/silenceThreshold", 0.01);
    settings.partialIntervalMs = getInt("recognition/partialIntervalMs", 1000);
    settings.maxUtteranceSec = getInt("recognition/maxUtteranceSec", 30);
    return settings;
}

Config::SessionSettings Config::getSessionSettings() const {
    SessionSettings settings;
    settings.pollIntervalMs = qMax(10, getInt("session/pollIntervalMs", 100));
    settings.exportDirectory = getString("session/exportDirectory",
        QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation));
    return settings;
}

void Config::setCaptureSettings(const CaptureSettings& settings) {
    setValue("capture/deviceId", settings.deviceId);
    setValue("capture/frameSamples", settings.frameSamples);
    setValue("capture/queueCapacity", settings.queueCapacity);
}

void Config::setRecognitionSettings(const RecognitionSettings& settings) {
    setValue("recognition/modelsPath", settings.modelsPath);
    setValue("recognition/modelFile", settings.modelFile);
    setValue("recognition/language", settings.language);
    setValue("recognition/threads", settings.threads);
    setValue("recognition/pauseThresholdSec", settings.pauseThresholdSec);
    setValue("recognition/silenceThreshold", settings.silenceThreshold);
    setValue("recognition/partialIntervalMs", settings.partialIntervalMs);
    setValue("recognition/maxUtteranceSec", settings.maxUtteranceSec);
}

void Config::setSessionSettings(const SessionSettings& settings) {
    setValue("session/pollIntervalMs", settings.pollIntervalMs);
    setValue("session/exportDirectory", settings.exportDirectory);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getTempPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/Parley";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getDataPath(),
        getTempPath(),
        getString("recognition/modelsPath", getDataPath() + "/models")
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            PARLEY_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Parley
