#pragma once

#include <QtCore/QString>
#include <vector>

#include "../common/Expected.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

class SpeakerRegistry;
class TranscriptSegmentStore;

/**
 * @brief User notes, each frozen to a segment as it was when annotated
 *
 * createNote() copies the segment's time range and its speaker's current
 * name and color. The note keeps no reference to the segment afterwards,
 * so later renames or text edits never reach it.
 */
class NoteStore {
public:
    NoteStore(const TranscriptSegmentStore& segments, const SpeakerRegistry& registry);

    Expected<Note, SessionError> createNote(SegmentId segmentId);
    Expected<void, SessionError> editNote(NoteId noteId, const QString& text);

    // In creation order
    const std::vector<Note>& listNotes() const { return notes_; }
    const Note* note(NoteId noteId) const;
    int count() const { return static_cast<int>(notes_.size()); }

private:
    const TranscriptSegmentStore& segments_;
    const SpeakerRegistry& registry_;
    std::vector<Note> notes_;
    NoteId nextId_ = 1;
};

} // namespace Parley
