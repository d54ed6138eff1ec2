#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <algorithm>
#include <atomic>

#include "../src/core/audio/WavFileCapture.hpp"
#include "utils/TestUtils.hpp"

using namespace Parley;
using namespace Parley::Test;

class TestWavFileCapture : public QObject {
    Q_OBJECT

private slots:
    void testLoadPcm16Mono() {
        TEST_SCOPE("wav_load");
        const QString path = QDir(_testScope.getTempDirectory()).filePath("tone.wav");
        const auto samples = TestUtils::generateTone(4000);
        QVERIFY(TestUtils::writeWavFile(path, samples));

        auto loaded = WavFileCapture::loadPcm16Mono(path);
        ASSERT_EXPECTED_VALUE(loaded);
        QCOMPARE(loaded.value().size(), samples.size());
        QCOMPARE(loaded.value()[123], samples[123]);
    }

    void testRejectsUnsupportedFormats() {
        TEST_SCOPE("wav_reject");
        const QDir dir(_testScope.getTempDirectory());

        const QString stereo = dir.filePath("stereo.wav");
        QVERIFY(TestUtils::writeWavFile(stereo, TestUtils::generateTone(800), 16000, 2));
        ASSERT_EXPECTED_ERROR(WavFileCapture::loadPcm16Mono(stereo), SessionError::CaptureFailed);

        const QString wrongRate = dir.filePath("44k.wav");
        QVERIFY(TestUtils::writeWavFile(wrongRate, TestUtils::generateTone(800), 44100));
        ASSERT_EXPECTED_ERROR(WavFileCapture::loadPcm16Mono(wrongRate), SessionError::CaptureFailed);

        const QString garbage = TestUtils::createDummyFile(dir.path(), "garbage.wav", 64);
        ASSERT_EXPECTED_ERROR(WavFileCapture::loadPcm16Mono(garbage), SessionError::CaptureFailed);

        ASSERT_EXPECTED_ERROR(WavFileCapture::loadPcm16Mono(dir.filePath("missing.wav")),
                              SessionError::CaptureFailed);
    }

    void testStartFailsForMissingFile() {
        WavFileCapture capture("/nonexistent/parley/input.wav", 1600, false);
        auto started = capture.start([](AudioFrame&&) { return true; });
        ASSERT_EXPECTED_ERROR(started, SessionError::CaptureFailed);
        QVERIFY(!capture.isRunning());
    }

    void testDeliversFramesInOrderWithPaddedTail() {
        TEST_SCOPE("wav_frames");
        const QString path = QDir(_testScope.getTempDirectory()).filePath("speech.wav");
        const auto samples = TestUtils::generateTone(17000);
        QVERIFY(TestUtils::writeWavFile(path, samples));

        QMutex mutex;
        std::vector<AudioFrame> frames;
        WavFileCapture capture(path, 4000, false);
        auto started = capture.start([&](AudioFrame&& frame) {
            QMutexLocker locker(&mutex);
            frames.push_back(std::move(frame));
            return true;
        });
        ASSERT_EXPECTED_VALUE(started);
        QVERIFY(TestUtils::waitForCondition([&]() { return capture.isFinished(); }, 3000));
        capture.stop();
        QVERIFY(!capture.isRunning());

        QMutexLocker locker(&mutex);
        QCOMPARE(frames.size(), size_t(5));
        for (size_t i = 0; i < frames.size(); ++i) {
            QCOMPARE(frames[i].samples.size(), size_t(4000));
            QCOMPARE(frames[i].durationSeconds(), 0.25);
            if (i > 0) {
                QCOMPARE(frames[i].capturedAtMs - frames[i - 1].capturedAtMs, qint64(250));
            }
        }

        // The trailing 1000 samples come first in the last frame, then silence
        const AudioFrame& last = frames.back();
        QCOMPARE(last.samples[0], samples[16000]);
        QCOMPARE(last.samples[999], samples[16999]);
        QVERIFY(std::all_of(last.samples.begin() + 1000, last.samples.end(),
                            [](qint16 sample) { return sample == 0; }));
    }

    void testFileShorterThanOneFrame() {
        TEST_SCOPE("wav_short");
        const QString path = QDir(_testScope.getTempDirectory()).filePath("short.wav");
        const auto samples = TestUtils::generateTone(300);
        QVERIFY(TestUtils::writeWavFile(path, samples));

        QMutex mutex;
        std::vector<AudioFrame> frames;
        WavFileCapture capture(path, 1600, false);
        ASSERT_EXPECTED_VALUE(capture.start([&](AudioFrame&& frame) {
            QMutexLocker locker(&mutex);
            frames.push_back(std::move(frame));
            return true;
        }));
        QVERIFY(TestUtils::waitForCondition([&]() { return capture.isFinished(); }, 3000));
        capture.stop();

        QMutexLocker locker(&mutex);
        QCOMPARE(frames.size(), size_t(1));
        QCOMPARE(frames.front().samples.size(), size_t(1600));
        QCOMPARE(frames.front().samples[299], samples[299]);
        QCOMPARE(frames.front().samples[300], qint16(0));
    }

    void testClosedSinkStopsDelivery() {
        TEST_SCOPE("wav_closed");
        const QString path = QDir(_testScope.getTempDirectory()).filePath("long.wav");
        QVERIFY(TestUtils::writeWavFile(path, TestUtils::generateTone(16000)));

        std::atomic<int> calls{0};
        WavFileCapture capture(path, 1600, false);
        ASSERT_EXPECTED_VALUE(capture.start([&](AudioFrame&&) {
            return ++calls < 3;
        }));
        QVERIFY(TestUtils::waitForCondition([&]() { return calls.load() >= 3; }, 3000));
        capture.stop();

        QCOMPARE(calls.load(), 3);
        QVERIFY(!capture.isFinished());
    }

    void testStopIsIdempotent() {
        TEST_SCOPE("wav_stop");
        const QString path = QDir(_testScope.getTempDirectory()).filePath("paced.wav");
        QVERIFY(TestUtils::writeWavFile(path, TestUtils::generateTone(160000)));

        WavFileCapture capture(path, 1600, true);
        ASSERT_EXPECTED_VALUE(capture.start([](AudioFrame&&) { return true; }));
        QVERIFY(capture.isRunning());
        QCOMPARE(capture.description(), QString("paced.wav"));

        capture.stop();
        capture.stop();
        QVERIFY(!capture.isRunning());
        QVERIFY(!capture.isFinished());
    }
};

int runTestWavFileCapture(int argc, char** argv) {
    TestWavFileCapture test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_wav_file_capture.moc"
