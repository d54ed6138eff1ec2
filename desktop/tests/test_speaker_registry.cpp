#include <QtTest/QtTest>

#include "../src/core/session/SpeakerRegistry.hpp"
#include "utils/TestUtils.hpp"

using namespace Parley;
using namespace Parley::Test;

class TestSpeakerRegistry : public QObject {
    Q_OBJECT

private slots:
    void testAddAssignsIdsAndPaletteColors() {
        SpeakerRegistry registry;
        auto alice = registry.addSpeaker("Alice");
        auto bob = registry.addSpeaker("Bob");
        ASSERT_EXPECTED_VALUE(alice);
        ASSERT_EXPECTED_VALUE(bob);

        QCOMPARE(alice.value(), SpeakerId(1));
        QCOMPARE(bob.value(), SpeakerId(2));
        QCOMPARE(registry.speaker(1)->color, SpeakerRegistry::palette().at(0));
        QCOMPARE(registry.speaker(2)->color, SpeakerRegistry::palette().at(1));
        QCOMPARE(registry.count(), 2);
    }

    void testPaletteCycles() {
        SpeakerRegistry registry;
        const int paletteSize = SpeakerRegistry::palette().size();
        for (int i = 0; i <= paletteSize; ++i) {
            ASSERT_EXPECTED_VALUE(registry.addSpeaker(QString("S%1").arg(i)));
        }
        QCOMPARE(registry.speakers().back().color, SpeakerRegistry::palette().at(0));
    }

    void testExplicitColorIsNormalized() {
        SpeakerRegistry registry;
        auto id = registry.addSpeaker("Alice", "#ABC");
        ASSERT_EXPECTED_VALUE(id);
        QCOMPARE(registry.speaker(id.value())->color, QString("#aabbcc"));

        ASSERT_EXPECTED_VALUE(registry.setSpeakerColor(id.value(), "#00FF7f"));
        QCOMPARE(registry.speaker(id.value())->color, QString("#00ff7f"));
    }

    void testRejectsInvalidInput() {
        SpeakerRegistry registry;
        ASSERT_EXPECTED_ERROR(registry.addSpeaker("   "), SessionError::InvalidOperation);
        ASSERT_EXPECTED_ERROR(registry.addSpeaker("Alice", "red"), SessionError::InvalidColor);
        ASSERT_EXPECTED_ERROR(registry.addSpeaker("Alice", "#12345"), SessionError::InvalidColor);
        QVERIFY(registry.isEmpty());

        ASSERT_EXPECTED_VALUE(registry.addSpeaker("Alice"));
        ASSERT_EXPECTED_ERROR(registry.addSpeaker("Alice"), SessionError::DuplicateSpeaker);
        QCOMPARE(registry.count(), 1);
    }

    void testNamesAreCaseSensitive() {
        SpeakerRegistry registry;
        ASSERT_EXPECTED_VALUE(registry.addSpeaker("alice"));
        ASSERT_EXPECTED_VALUE(registry.addSpeaker("Alice"));
        QCOMPARE(registry.count(), 2);
    }

    void testRename() {
        SpeakerRegistry registry;
        const SpeakerId alice = registry.addSpeaker("Alice").value();
        registry.addSpeaker("Bob");

        ASSERT_EXPECTED_VALUE(registry.renameSpeaker(alice, "Carol"));
        QCOMPARE(registry.speaker(alice)->name, QString("Carol"));
        QVERIFY(registry.findByName("Alice") == nullptr);

        ASSERT_EXPECTED_ERROR(registry.renameSpeaker(alice, "Bob"), SessionError::DuplicateSpeaker);
        ASSERT_EXPECTED_ERROR(registry.renameSpeaker(alice, ""), SessionError::InvalidOperation);
        ASSERT_EXPECTED_ERROR(registry.renameSpeaker(42, "Dave"), SessionError::NotFound);
        ASSERT_EXPECTED_VALUE(registry.renameSpeaker(alice, "Carol"));
    }

    void testActivate() {
        SpeakerRegistry registry;
        ASSERT_EXPECTED_ERROR(registry.activateSpeaker(1), SessionError::InvalidOperation);
        QVERIFY(!registry.hasActiveSpeaker());

        const SpeakerId alice = registry.addSpeaker("Alice").value();
        ASSERT_EXPECTED_ERROR(registry.activateSpeaker(99), SessionError::NotFound);
        ASSERT_EXPECTED_VALUE(registry.activateSpeaker(alice));
        QCOMPARE(registry.activeSpeakerId(), alice);
    }

    void testIdsAreNotConsumedByRejectedSpeakers() {
        SpeakerRegistry registry;
        QCOMPARE(registry.addSpeaker("Alice").value(), SpeakerId(1));
        ASSERT_EXPECTED_ERROR(registry.addSpeaker("Alice"), SessionError::DuplicateSpeaker);
        ASSERT_EXPECTED_ERROR(registry.addSpeaker("Bob", "red"), SessionError::InvalidColor);

        auto id = registry.addSpeaker("Bob");
        ASSERT_EXPECTED_VALUE(id);
        QCOMPARE(id.value(), SpeakerId(2));
        QCOMPARE(registry.count(), 2);
    }

    void testNormalizeColor_data() {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("short") << "#FfF" << "#ffffff";
        QTest::newRow("long") << "#12AB34" << "#12ab34";
        QTest::newRow("padded") << " #000000 " << "#000000";
        QTest::newRow("no hash") << "123456" << "";
        QTest::newRow("bad digit") << "#12345g" << "";
        QTest::newRow("named") << "blue" << "";
    }

    void testNormalizeColor() {
        QFETCH(QString, input);
        QFETCH(QString, expected);

        const auto normalized = SpeakerRegistry::normalizeColor(input);
        if (expected.isEmpty()) {
            QVERIFY(!normalized.has_value());
        } else {
            QVERIFY(normalized.has_value());
            QCOMPARE(*normalized, expected);
        }
    }
};

int runTestSpeakerRegistry(int argc, char** argv) {
    TestSpeakerRegistry test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_speaker_registry.moc"
