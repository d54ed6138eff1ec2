#include <QtTest/QtTest>

#include "../src/core/session/NoteStore.hpp"
#include "../src/core/session/ProtectedTextModel.hpp"
#include "../src/core/session/SpeakerRegistry.hpp"
#include "../src/core/session/TranscriptSegmentStore.hpp"
#include "utils/TestUtils.hpp"

using namespace Parley;
using namespace Parley::Test;

class TestNoteStore : public QObject {
    Q_OBJECT

private slots:
    void testCreateSnapshotsSegment() {
        SpeakerRegistry registry;
        TranscriptSegmentStore store;
        const SpeakerId alice = registry.addSpeaker("Alice", "#123456").value();
        store.open(alice, 1'000);
        const Segment segment = store.closeOpen(3'000, "hello");

        NoteStore notes(store, registry);
        auto note = notes.createNote(segment.id);
        ASSERT_EXPECTED_VALUE(note);

        QCOMPARE(note.value().id, NoteId(1));
        QCOMPARE(note.value().timeRangeSnapshot, (TimeRange{1'000, 3'000}));
        QCOMPARE(note.value().speakerNameSnapshot, QString("Alice"));
        QCOMPARE(note.value().speakerColorSnapshot, QString("#123456"));
        QVERIFY(note.value().text.isEmpty());
        QCOMPARE(notes.count(), 1);
    }

    void testUnknownSegment() {
        SpeakerRegistry registry;
        TranscriptSegmentStore store;
        NoteStore notes(store, registry);

        ASSERT_EXPECTED_ERROR(notes.createNote(5), SessionError::NotFound);
        ASSERT_EXPECTED_ERROR(notes.editNote(5, "text"), SessionError::NotFound);
        QCOMPARE(notes.count(), 0);
    }

    void testSnapshotSurvivesRenameRecolorAndEdits() {
        SpeakerRegistry registry;
        TranscriptSegmentStore store;
        ProtectedTextModel model(registry);
        const SpeakerId alice = registry.addSpeaker("Alice", "#aa0000").value();
        store.open(alice, 0);
        const Segment segment = store.closeOpen(2'000, "original words");
        model.appendFinalizedLine(segment);

        NoteStore notes(store, registry);
        const Note created = notes.createNote(segment.id).value();

        registry.renameSpeaker(alice, "Alicia");
        registry.setSpeakerColor(alice, "#00bb00");
        model.renameSpeaker(alice);
        QVERIFY(model.applyEdit(model.line(0).bodyStart(), 8, "edited"));

        const Note* stored = notes.note(created.id);
        QVERIFY(stored != nullptr);
        QCOMPARE(stored->speakerNameSnapshot, QString("Alice"));
        QCOMPARE(stored->speakerColorSnapshot, QString("#aa0000"));
        QCOMPARE(stored->timeRangeSnapshot, created.timeRangeSnapshot);
    }

    void testEditOnlyChangesText() {
        SpeakerRegistry registry;
        TranscriptSegmentStore store;
        const SpeakerId bob = registry.addSpeaker("Bob").value();
        store.open(bob, 0);
        const Segment segment = store.closeOpen(1'000, "x");

        NoteStore notes(store, registry);
        const Note created = notes.createNote(segment.id).value();
        ASSERT_EXPECTED_VALUE(notes.editNote(created.id, "follow up on this"));

        const Note* stored = notes.note(created.id);
        QCOMPARE(stored->text, QString("follow up on this"));
        QCOMPARE(stored->speakerNameSnapshot, created.speakerNameSnapshot);
        QCOMPARE(stored->timeRangeSnapshot, created.timeRangeSnapshot);
    }

    void testNotesKeepCreationOrder() {
        SpeakerRegistry registry;
        TranscriptSegmentStore store;
        const SpeakerId bob = registry.addSpeaker("Bob").value();
        store.open(bob, 0);
        const Segment first = store.closeOpen(1'000, "a");
        store.open(bob, 1'000);
        const Segment second = store.closeOpen(2'000, "b");

        NoteStore notes(store, registry);
        notes.createNote(second.id);
        notes.createNote(first.id);
        notes.createNote(second.id);

        const auto& list = notes.listNotes();
        QCOMPARE(list.size(), size_t(3));
        QCOMPARE(list[0].timeRangeSnapshot.startMs, qint64(1'000));
        QCOMPARE(list[1].timeRangeSnapshot.startMs, qint64(0));
        QCOMPARE(list[2].id, NoteId(3));
    }
};

int runTestNoteStore(int argc, char** argv) {
    TestNoteStore test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_note_store.moc"
