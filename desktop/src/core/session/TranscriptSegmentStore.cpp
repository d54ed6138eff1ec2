#include "TranscriptSegmentStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace Parley {

QString OpenSegment::accumulatedText() const {
    if (carriedText.isEmpty()) {
        return partialText;
    }
    if (partialText.isEmpty()) {
        return carriedText;
    }
    return carriedText + ' ' + partialText;
}

const Segment* TranscriptSegmentStore::segment(SegmentId id) const {
    auto it = std::find_if(segments_.begin(), segments_.end(),
                           [id](const Segment& s) { return s.id == id; });
    return it != segments_.end() ? &*it : nullptr;
}

void TranscriptSegmentStore::open(SpeakerId speakerId, qint64 startMs, const QString& carriedText) {
    OpenSegment segment;
    segment.speakerId = speakerId;
    segment.startMs = startMs;
    segment.carriedText = carriedText;
    open_ = segment;
}

void TranscriptSegmentStore::setPartialText(const QString& text) {
    if (open_) {
        open_->partialText = text;
    }
}

const Segment& TranscriptSegmentStore::closeOpen(qint64 endMs, const QString& text) {
    if (!open_) {
        throw std::logic_error("TranscriptSegmentStore::closeOpen without an open segment");
    }

    Segment segment;
    segment.id = nextId_++;
    segment.order = static_cast<qint64>(segments_.size());
    segment.range.startMs = open_->startMs;
    segment.range.endMs = std::max(open_->startMs, endMs);
    segment.speakerId = open_->speakerId;
    segment.text = text;

    open_.reset();
    segments_.push_back(segment);
    return segments_.back();
}

void TranscriptSegmentStore::discardOpen() {
    open_.reset();
}

} // namespace Parley
