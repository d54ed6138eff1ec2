#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTextStream>
#include <QtCore/QTimer>
#include <cstdio>

#include "core/audio/MicrophoneCapture.hpp"
#include "core/audio/WavFileCapture.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/session/TranscriptionSession.hpp"
#include "core/transcription/WhisperRecognizer.hpp"
#include "ui/controllers/ConsoleController.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ParleyDesktop");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Parley");

    QCommandLineParser parser;
    parser.setApplicationDescription("Live speaker-attributed transcription");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption modelOption("model", "Model file (absolute, or relative to the models directory).", "file");
    QCommandLineOption modelsDirOption("models-dir", "Directory containing ggml model files.", "dir");
    QCommandLineOption listModelsOption("list-models", "List available models and exit.");
    QCommandLineOption listDevicesOption("list-devices", "List audio input devices (id and description) and exit.");
    QCommandLineOption deviceOption("device", "Audio input device id (see --list-devices).", "id");
    QCommandLineOption inputOption("input", "Transcribe a 16 kHz mono WAV file instead of the microphone.", "wav");
    QCommandLineOption speakerOption("speaker", "Add a speaker (repeatable). The first one starts active.", "name");
    QCommandLineOption exportOption("export", "Export the session as JSON when it ends (relative to the export directory).", "path");
    QCommandLineOption durationOption("duration", "Stop after this many seconds.", "sec");
    QCommandLineOption verboseOption("verbose", "Debug logging.");
    parser.addOptions({modelOption, modelsDirOption, listModelsOption, listDevicesOption, deviceOption, inputOption,
                       speakerOption, exportOption, durationOption, verboseOption});
    parser.process(app);

    const auto level = parser.isSet(verboseOption) ? Parley::Logger::Level::Debug : Parley::Logger::Level::Warn;
    Parley::Config::instance().initialize();
    Parley::Logger::instance().initialize(
        QDir(Parley::Config::instance().getDataPath()).filePath("parley.log").toStdString(), level);
    PARLEY_INFO("Starting Parley v{}", app.applicationVersion().toStdString());

    auto captureSettings = Parley::Config::instance().getCaptureSettings();
    auto recognitionSettings = Parley::Config::instance().getRecognitionSettings();
    const auto sessionSettings = Parley::Config::instance().getSessionSettings();

    if (parser.isSet(modelsDirOption)) {
        recognitionSettings.modelsPath = parser.value(modelsDirOption);
    }
    if (parser.isSet(modelOption)) {
        recognitionSettings.modelFile = parser.value(modelOption);
    }
    if (parser.isSet(deviceOption)) {
        captureSettings.deviceId = parser.value(deviceOption);
    }

    QFile stdoutFile;
    if (!stdoutFile.open(stdout, QIODevice::WriteOnly)) {
        return 1;
    }
    QTextStream out(&stdoutFile);

    if (parser.isSet(listModelsOption)) {
        const QStringList models = Parley::WhisperRecognizer::availableModels(recognitionSettings.modelsPath);
        if (models.isEmpty()) {
            out << "No models in " << recognitionSettings.modelsPath << Qt::endl;
        }
        for (const QString& model : models) {
            out << model << Qt::endl;
        }
        return 0;
    }

    if (parser.isSet(listDevicesOption)) {
        const QStringList devices = Parley::MicrophoneCapture::availableDevices();
        if (devices.isEmpty()) {
            out << "No audio input devices" << Qt::endl;
        }
        for (const QString& device : devices) {
            out << device << Qt::endl;
        }
        return 0;
    }

    const QString modelPath = recognitionSettings.modelPath();

    std::unique_ptr<Parley::AudioCaptureSource> capture;
    Parley::WavFileCapture* fileCapture = nullptr;
    if (parser.isSet(inputOption)) {
        auto wav = std::make_unique<Parley::WavFileCapture>(parser.value(inputOption), captureSettings.frameSamples);
        fileCapture = wav.get();
        capture = std::move(wav);
    } else {
        capture = std::make_unique<Parley::MicrophoneCapture>(captureSettings);
    }

    Parley::TranscriptionSession::Options options;
    options.queueCapacity = captureSettings.queueCapacity;
    options.pollIntervalMs = sessionSettings.pollIntervalMs;

    Parley::TranscriptionSession session(std::move(capture),
                                         std::make_unique<Parley::WhisperRecognizer>(recognitionSettings),
                                         options);
    Parley::ConsoleController console(session, &stdoutFile);
    console.setShowPartials(parser.isSet(verboseOption));

    for (const QString& name : parser.values(speakerOption)) {
        auto added = session.addSpeaker(name);
        if (added.hasError()) {
            return 1;
        }
    }

    QString exportPath = parser.value(exportOption);
    if (!exportPath.isEmpty() && QDir::isRelativePath(exportPath)) {
        exportPath = QDir(sessionSettings.exportDirectory).filePath(exportPath);
    }
    bool finished = false;
    auto finish = [&]() {
        if (finished) {
            return;
        }
        finished = true;
        auto stopped = session.stop();
        if (stopped.hasError()) {
            PARLEY_WARN("Session stop reported {}", Parley::toString(stopped.error()).toStdString());
        }
        int exitCode = session.status() == Parley::SessionStatus::Failed ? 2 : 0;
        if (!exportPath.isEmpty() && session.exportTo(exportPath).hasError()) {
            exitCode = 3;
        }
        QCoreApplication::exit(exitCode);
    };

    QObject::connect(&console, &Parley::ConsoleController::quitRequested, &app, finish);

    auto started = session.start(modelPath);
    if (started.hasError()) {
        out << "Cannot start: " << Parley::toString(started.error()) << Qt::endl;
        return started.error() == Parley::SessionError::ModelLoadFailed ? 2 : 1;
    }

    QObject::connect(&session, &Parley::TranscriptionSession::statusChanged, &app,
                     [&](Parley::SessionStatus status) {
        if (status == Parley::SessionStatus::Failed) {
            QTimer::singleShot(0, &app, finish);
        }
    });

    if (parser.isSet(durationOption)) {
        const int seconds = parser.value(durationOption).toInt();
        if (seconds > 0) {
            QTimer::singleShot(seconds * 1000, &app, finish);
        }
    }

    QTimer endOfFile;
    if (fileCapture) {
        QObject::connect(&endOfFile, &QTimer::timeout, &app, [&]() {
            if (fileCapture->isFinished()) {
                endOfFile.stop();
                finish();
            }
        });
        endOfFile.start(sessionSettings.pollIntervalMs);
    }

    console.attachStdin();
    out << "Type 'help' for commands." << Qt::endl;

    const int result = app.exec();
    PARLEY_INFO("Parley exiting with code {}", result);
    return result;
}
