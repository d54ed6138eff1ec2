#include <QtTest/QtTest>
#include "../src/core/common/Expected.hpp"
#include "../src/core/transcription/TranscriptionTypes.hpp"

using namespace Parley;

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    // A QString value must never be mistaken for an error
    void testStringValueWithStringError() {
        Expected<QString, QString> result(QString("value"));
        QVERIFY(result.hasValue());
        QCOMPARE(result.value(), QString("value"));
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testVoidSpecialization() {
        Expected<void, SessionError> ok;
        QVERIFY(ok);

        Expected<void, SessionError> failed = makeUnexpected(SessionError::NotFound);
        QVERIFY(!failed);
        QCOMPARE(failed.error(), SessionError::NotFound);
    }

    void testAccessingWrongSideThrows() {
        Expected<int, SessionError> failed = makeUnexpected(SessionError::InvalidColor);
        QVERIFY_EXCEPTION_THROWN(failed.value(), std::logic_error);

        Expected<int, SessionError> success(1);
        QVERIFY_EXCEPTION_THROWN(success.error(), std::logic_error);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        // Original should still be valid
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
