#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <deque>
#include <optional>

#include "../src/core/transcription/WhisperRecognizer.hpp"
#include "utils/TestUtils.hpp"

using namespace Parley;
using namespace Parley::Test;

namespace {

// Replaces the whisper.cpp calls with scripted transcription results;
// std::nullopt makes that transcription fail.
class ScriptedWhisperRecognizer : public WhisperRecognizer {
public:
    using WhisperRecognizer::WhisperRecognizer;

    std::deque<std::optional<QString>> results;
    int transcribeCalls = 0;

protected:
    Expected<void, RecognitionError> loadModel(const QString&) override {
        return {};
    }

    void unloadModel() override {}

    Expected<QString, RecognitionError> transcribe(const std::vector<float>&) override {
        ++transcribeCalls;
        if (results.empty()) {
            return QString();
        }
        const std::optional<QString> next = results.front();
        results.pop_front();
        if (!next) {
            return makeUnexpected(RecognitionError::InferenceFailed);
        }
        return *next;
    }
};

} // namespace

class TestWhisperRecognizer : public QObject {
    Q_OBJECT

private:
    static Config::RecognitionSettings settings() {
        Config::RecognitionSettings settings;
        settings.threads = 1;
        settings.partialIntervalMs = 500;
        return settings;
    }

    static AudioFrame toneFrame() {
        AudioFrame frame;
        frame.samples = TestUtils::generateTone(1600);
        return frame;
    }

    static AudioFrame silentFrame() {
        AudioFrame frame;
        frame.samples = TestUtils::generateSilence(1600);
        return frame;
    }

    // 100 ms frames: a partial every frame, an utterance ends after 200 ms of silence
    static Config::RecognitionSettings endpointSettings(int partialIntervalMs) {
        Config::RecognitionSettings settings;
        settings.threads = 1;
        settings.partialIntervalMs = partialIntervalMs;
        settings.pauseThresholdSec = 0.2;
        settings.silenceThreshold = 0.01;
        settings.maxUtteranceSec = 30;
        return settings;
    }

private slots:
    void testStartsIdle() {
        WhisperRecognizer recognizer(settings());
        QCOMPARE(recognizer.state(), EngineState::Idle);
        QVERIFY(!recognizer.flush().has_value());
    }

    void testMissingModel() {
        WhisperRecognizer recognizer(settings());
        auto started = recognizer.start("/nonexistent/parley/ggml-none.bin");
        ASSERT_EXPECTED_ERROR(started, RecognitionError::ModelNotFound);
        QCOMPARE(recognizer.state(), EngineState::Idle);
    }

    void testInvalidModelFileFailsToLoad() {
        TEST_SCOPE("whisper_invalid");
        const QString model = TestUtils::createDummyFile(_testScope.getTempDirectory(), "ggml-tiny.bin", 4096);

        WhisperRecognizer recognizer(settings());
        ASSERT_EXPECTED_ERROR(recognizer.start(model), RecognitionError::ModelLoadFailed);
        QCOMPARE(recognizer.state(), EngineState::Idle);
    }

    void testConsumeBeforeReady() {
        WhisperRecognizer recognizer(settings());
        ASSERT_EXPECTED_ERROR(recognizer.consume(toneFrame()), RecognitionError::NotReady);
    }

    void testStopWhenIdleIsHarmless() {
        WhisperRecognizer recognizer(settings());
        recognizer.stop();
        recognizer.stop();
        QCOMPARE(recognizer.state(), EngineState::Idle);
    }

    void testFailedFinalKeepsLastPartial() {
        TEST_SCOPE("whisper_final_fallback");
        const QString model = TestUtils::createDummyFile(_testScope.getTempDirectory(), "ggml-test.bin");

        ScriptedWhisperRecognizer recognizer(endpointSettings(100));
        recognizer.results = {QString("hello there"), QString("hello there"), std::nullopt};
        ASSERT_EXPECTED_VALUE(recognizer.start(model));
        QCOMPARE(recognizer.state(), EngineState::Ready);

        auto partial = recognizer.consume(toneFrame());
        ASSERT_EXPECTED_VALUE(partial);
        QVERIFY(partial.value().has_value());
        QVERIFY(!partial.value()->isFinal());
        QCOMPARE(partial.value()->text, QString("hello there"));

        // Same text again: nothing new to report
        auto unchanged = recognizer.consume(silentFrame());
        ASSERT_EXPECTED_VALUE(unchanged);
        QVERIFY(!unchanged.value().has_value());

        auto ended = recognizer.consume(silentFrame());
        ASSERT_EXPECTED_VALUE(ended);
        QVERIFY(ended.value().has_value());
        QVERIFY(ended.value()->isFinal());
        QCOMPARE(ended.value()->text, QString("hello there"));
        QCOMPARE(ended.value()->relativeEndTime, 0.3);
        QCOMPARE(recognizer.transcribeCalls, 3);
    }

    void testFailedFinalWithoutPartialIsFrameError() {
        TEST_SCOPE("whisper_final_error");
        const QString model = TestUtils::createDummyFile(_testScope.getTempDirectory(), "ggml-test.bin");

        ScriptedWhisperRecognizer recognizer(endpointSettings(10'000));
        recognizer.results = {std::nullopt, QString("second try")};
        ASSERT_EXPECTED_VALUE(recognizer.start(model));

        ASSERT_EXPECTED_VALUE(recognizer.consume(toneFrame()));
        ASSERT_EXPECTED_VALUE(recognizer.consume(silentFrame()));
        ASSERT_EXPECTED_ERROR(recognizer.consume(silentFrame()), RecognitionError::InferenceFailed);

        // The stream carries on with the next utterance
        ASSERT_EXPECTED_VALUE(recognizer.consume(toneFrame()));
        ASSERT_EXPECTED_VALUE(recognizer.consume(silentFrame()));
        auto ended = recognizer.consume(silentFrame());
        ASSERT_EXPECTED_VALUE(ended);
        QVERIFY(ended.value().has_value());
        QCOMPARE(ended.value()->text, QString("second try"));
        QCOMPARE(ended.value()->relativeEndTime, 0.6);
    }

    void testFlushFallsBackToLastPartial() {
        TEST_SCOPE("whisper_flush_fallback");
        const QString model = TestUtils::createDummyFile(_testScope.getTempDirectory(), "ggml-test.bin");

        ScriptedWhisperRecognizer recognizer(endpointSettings(100));
        recognizer.results = {QString("trailing words"), std::nullopt};
        ASSERT_EXPECTED_VALUE(recognizer.start(model));
        ASSERT_EXPECTED_VALUE(recognizer.consume(toneFrame()));

        const auto flushed = recognizer.flush();
        QVERIFY(flushed.has_value());
        QVERIFY(flushed->isFinal());
        QCOMPARE(flushed->text, QString("trailing words"));
        QCOMPARE(flushed->relativeEndTime, 0.1);
        QVERIFY(!recognizer.flush().has_value());
    }

    void testAvailableModels() {
        TEST_SCOPE("whisper_models");
        const QString dir = _testScope.getTempDirectory();
        TestUtils::createDummyFile(dir, "ggml-small.bin");
        TestUtils::createDummyFile(dir, "ggml-base.en.bin");
        TestUtils::createDummyFile(dir, "notes.txt");
        QVERIFY(QDir(dir).mkpath("nested.bin"));

        const QStringList models = WhisperRecognizer::availableModels(dir);
        QCOMPARE(models, (QStringList{"ggml-base.en.bin", "ggml-small.bin"}));

        QVERIFY(WhisperRecognizer::availableModels(dir + "/missing").isEmpty());
    }
};

int runTestWhisperRecognizer(int argc, char** argv) {
    TestWhisperRecognizer test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_whisper_recognizer.moc"
