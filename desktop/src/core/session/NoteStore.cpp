#include "NoteStore.hpp"
#include "SpeakerRegistry.hpp"
#include "TranscriptSegmentStore.hpp"
#include "../common/Logger.hpp"

#include <algorithm>

namespace Parley {

NoteStore::NoteStore(const TranscriptSegmentStore& segments, const SpeakerRegistry& registry)
    : segments_(segments)
    , registry_(registry) {
}

Expected<Note, SessionError> NoteStore::createNote(SegmentId segmentId) {
    const Segment* segment = segments_.segment(segmentId);
    if (!segment) {
        PARLEY_WARN("Cannot annotate unknown segment {}", segmentId);
        return makeUnexpected(SessionError::NotFound);
    }

    Note note;
    note.id = nextId_++;
    note.timeRangeSnapshot = segment->range;
    if (const Speaker* speaker = registry_.speaker(segment->speakerId)) {
        note.speakerNameSnapshot = speaker->name;
        note.speakerColorSnapshot = speaker->color;
    }
    notes_.push_back(note);

    PARLEY_DEBUG("Created note {} for segment {}", note.id, segmentId);
    return note;
}

Expected<void, SessionError> NoteStore::editNote(NoteId noteId, const QString& text) {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [noteId](const Note& n) { return n.id == noteId; });
    if (it == notes_.end()) {
        return makeUnexpected(SessionError::NotFound);
    }
    it->text = text;
    return {};
}

const Note* NoteStore::note(NoteId noteId) const {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [noteId](const Note& n) { return n.id == noteId; });
    return it != notes_.end() ? &*it : nullptr;
}

} // namespace Parley
