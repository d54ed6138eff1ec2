#pragma once

#include <QtCore/QString>
#include <optional>
#include <vector>

#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

// The in-progress segment. It has a speaker and a start but no end yet.
// Text carried over from before a speaker was active is kept apart from
// the recognizer's latest partial so a Final can replace the partial.
struct OpenSegment {
    SpeakerId speakerId = InvalidSpeakerId;
    qint64 startMs = 0;
    QString carriedText;
    QString partialText;

    QString accumulatedText() const;
};

/**
 * @brief Append-only list of closed segments plus at most one open segment
 *
 * Closed segments are never reordered, removed or modified; their `order`
 * equals their position. Only SegmentFinalizationController opens and
 * closes segments.
 */
class TranscriptSegmentStore {
public:
    const std::vector<Segment>& segments() const { return segments_; }
    const Segment* segment(SegmentId id) const;
    int size() const { return static_cast<int>(segments_.size()); }
    bool isEmpty() const { return segments_.empty(); }

    bool hasOpenSegment() const { return open_.has_value(); }
    const OpenSegment* openSegment() const { return open_ ? &*open_ : nullptr; }

    void open(SpeakerId speakerId, qint64 startMs, const QString& carriedText = QString());
    void setPartialText(const QString& text);

    // Closes the open segment with the given end and text and appends it.
    // endMs is clamped so the segment never ends before it starts.
    const Segment& closeOpen(qint64 endMs, const QString& text);

    // Drops the open segment without emitting anything
    void discardOpen();

private:
    std::vector<Segment> segments_;
    std::optional<OpenSegment> open_;
    SegmentId nextId_ = 1;
};

} // namespace Parley
