#include "SegmentFinalizationController.hpp"
#include "SpeakerRegistry.hpp"
#include "TimestampMapper.hpp"
#include "TranscriptSegmentStore.hpp"
#include "../common/Logger.hpp"

namespace Parley {

SegmentFinalizationController::SegmentFinalizationController(TranscriptSegmentStore& store,
                                                             SpeakerRegistry& registry,
                                                             TimestampMapper& mapper)
    : store_(store)
    , registry_(registry)
    , mapper_(mapper) {
}

SegmentFinalizationController::State SegmentFinalizationController::state() const {
    return store_.hasOpenSegment() ? State::OpenSegment : State::NoOpenSegment;
}

QString SegmentFinalizationController::joinText(const QString& head, const QString& tail) {
    if (head.isEmpty()) {
        return tail;
    }
    if (tail.isEmpty()) {
        return head;
    }
    return head + ' ' + tail;
}

void SegmentFinalizationController::onSessionStart() {
    if (!mapper_.isAnchored() || store_.hasOpenSegment() || !registry_.hasActiveSpeaker()) {
        return;
    }
    store_.open(registry_.activeSpeakerId(), mapper_.anchorMs());
    PARLEY_DEBUG("Opened first segment for speaker {}", registry_.activeSpeakerId());
}

void SegmentFinalizationController::onPartial(const QString& text) {
    if (store_.hasOpenSegment()) {
        store_.setPartialText(text.trimmed());
    } else {
        bufferedPartial_ = text.trimmed();
    }
}

std::optional<Segment> SegmentFinalizationController::onFinal(const QString& text, double relativeEndTime) {
    const QString finalText = text.trimmed();

    if (!store_.hasOpenSegment()) {
        bufferedPartial_.clear();
        if (!finalText.isEmpty()) {
            bufferedText_ = joinText(bufferedText_, finalText);
            PARLEY_DEBUG("No active speaker, buffering final text");
        }
        return std::nullopt;
    }

    if (finalText.isEmpty()) {
        // The utterance produced nothing; the stale partial goes with it
        store_.setPartialText(QString());
        return std::nullopt;
    }

    const OpenSegment open = *store_.openSegment();
    const Segment closed = store_.closeOpen(mapper_.toAbsolute(relativeEndTime),
                                            joinText(open.carriedText, finalText));
    store_.open(open.speakerId, closed.range.endMs);
    return closed;
}

Expected<std::optional<Segment>, SessionError> SegmentFinalizationController::onSpeakerSwitch(
    SpeakerId speakerId, double relativeNow) {

    if (registry_.hasActiveSpeaker() && registry_.activeSpeakerId() == speakerId) {
        return std::optional<Segment>();
    }

    auto activated = registry_.activateSpeaker(speakerId);
    if (activated.hasError()) {
        return makeUnexpected(activated.error());
    }

    if (!mapper_.isAnchored()) {
        return std::optional<Segment>();
    }

    const qint64 nowMs = mapper_.toAbsolute(relativeNow);

    if (!store_.hasOpenSegment()) {
        // First activation of the run; anything heard so far belongs to it
        store_.open(speakerId, nowMs, bufferedText_);
        store_.setPartialText(bufferedPartial_);
        bufferedText_.clear();
        bufferedPartial_.clear();
        return std::optional<Segment>();
    }

    const OpenSegment open = *store_.openSegment();
    const QString text = open.accumulatedText();

    if (text.isEmpty()) {
        // Nothing was said: the new speaker inherits the interval
        store_.discardOpen();
        store_.open(speakerId, open.startMs);
        return std::optional<Segment>();
    }

    const Segment closed = store_.closeOpen(nowMs, text);
    store_.open(speakerId, closed.range.endMs);
    return std::optional<Segment>(closed);
}

std::optional<Segment> SegmentFinalizationController::onSessionStop(double relativeNow) {
    std::optional<Segment> closed;

    if (store_.hasOpenSegment()) {
        const QString text = store_.openSegment()->accumulatedText();
        if (text.isEmpty()) {
            store_.discardOpen();
        } else {
            closed = store_.closeOpen(mapper_.toAbsolute(relativeNow), text);
        }
    }

    if (!bufferedText_.isEmpty() || !bufferedPartial_.isEmpty()) {
        PARLEY_WARN("Dropping text recognized while no speaker was active");
    }
    bufferedText_.clear();
    bufferedPartial_.clear();
    return closed;
}

QString SegmentFinalizationController::liveText() const {
    if (const OpenSegment* open = store_.openSegment()) {
        return open->accumulatedText();
    }
    return joinText(bufferedText_, bufferedPartial_);
}

} // namespace Parley
