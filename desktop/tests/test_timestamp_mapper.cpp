#include <QtTest/QtTest>
#include <QtCore/QDateTime>

#include "../src/core/session/TimeFormat.hpp"
#include "../src/core/session/TimestampMapper.hpp"

using namespace Parley;

class TestTimestampMapper : public QObject {
    Q_OBJECT

private:
    static qint64 localMs(int h, int m, int s, int ms = 0) {
        return QDateTime(QDate(2024, 3, 14), QTime(h, m, s, ms)).toMSecsSinceEpoch();
    }

private slots:
    void testAnchorOnlyOnce() {
        TimestampMapper mapper;
        QVERIFY(!mapper.isAnchored());
        QVERIFY(mapper.anchor(1000));
        QVERIFY(!mapper.anchor(5000));
        QCOMPARE(mapper.anchorMs(), qint64(1000));

        mapper.reset();
        QVERIFY(!mapper.isAnchored());
        QVERIFY(mapper.anchor(5000));
        QCOMPARE(mapper.anchorMs(), qint64(5000));
    }

    void testToAbsoluteRoundsToMilliseconds() {
        TimestampMapper mapper;
        mapper.anchor(localMs(14, 15, 20));

        QCOMPARE(mapper.toAbsolute(0.0), localMs(14, 15, 20));
        QCOMPARE(mapper.toAbsolute(3.0), localMs(14, 15, 23));
        QCOMPARE(mapper.toAbsolute(1.2345), localMs(14, 15, 21, 235));
    }

    void testToRelativeInvertsToAbsolute() {
        TimestampMapper mapper;
        mapper.anchor(1'700'000'000'000);
        const qint64 wall = mapper.toAbsolute(12.5);
        QCOMPARE(mapper.toRelative(wall), 12.5);
    }

    void testClockFormat() {
        QCOMPARE(TimeFormat::clock(localMs(14, 15, 20)), QString("14:15:20.000"));
        QCOMPARE(TimeFormat::clock(localMs(9, 5, 3, 7)), QString("09:05:03.007"));
    }

    void testRangeFormat() {
        TimeRange range{localMs(14, 15, 20), localMs(14, 15, 23, 500)};
        QCOMPARE(TimeFormat::range(range), QString("14:15:20.000-14:15:23.500"));
    }

    void testIsoTimestampKeepsMillisecondsAndOffset() {
        const qint64 ms = localMs(14, 15, 20, 123);
        const QString iso = TimeFormat::isoTimestamp(ms);

        QVERIFY2(iso.startsWith("2024-03-14T14:15:20.123"), qPrintable(iso));
        const QDateTime parsed = QDateTime::fromString(iso, Qt::ISODateWithMs);
        QVERIFY(parsed.isValid());
        QCOMPARE(parsed.toMSecsSinceEpoch(), ms);
    }
};

int runTestTimestampMapper(int argc, char** argv) {
    TestTimestampMapper test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_timestamp_mapper.moc"
