#pragma once

#include <QtCore/QString>
#include <optional>

#include "../common/Expected.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

class SpeakerRegistry;
class TimestampMapper;
class TranscriptSegmentStore;

/**
 * @brief Single authority that opens and closes transcript segments
 *
 * Two triggers close the open segment: a recognizer Final and a switch
 * of the active speaker. Each closing appends exactly one segment to the
 * store and immediately opens the next one at the same instant, so
 * consecutive segments share their boundary.
 *
 * Text recognized while no speaker is active is buffered and becomes the
 * start of the first segment once a speaker is activated.
 *
 * All methods run on the UI thread.
 */
class SegmentFinalizationController {
public:
    enum class State {
        NoOpenSegment,
        OpenSegment
    };

    SegmentFinalizationController(TranscriptSegmentStore& store,
                                  SpeakerRegistry& registry,
                                  TimestampMapper& mapper);

    State state() const;

    // Stream anchored: opens a segment at the anchor if a speaker is active
    void onSessionStart();

    void onPartial(const QString& text);

    // Returns the closed segment, if the Final produced one
    std::optional<Segment> onFinal(const QString& text, double relativeEndTime);

    /**
     * @brief Makes @p speakerId the active speaker
     *
     * While a run is anchored this closes the open segment at
     * @p relativeNow (or discards it when it has no text) and opens a new
     * one for the new speaker. Switching to the already active speaker
     * changes nothing.
     */
    Expected<std::optional<Segment>, SessionError> onSpeakerSwitch(SpeakerId speakerId, double relativeNow);

    // Best-effort close of whatever is open at the end of a run
    std::optional<Segment> onSessionStop(double relativeNow);

    // Text shown for the utterance in progress
    QString liveText() const;

    bool hasBufferedText() const { return !bufferedText_.isEmpty(); }

private:
    static QString joinText(const QString& head, const QString& tail);

    TranscriptSegmentStore& store_;
    SpeakerRegistry& registry_;
    TimestampMapper& mapper_;

    // Only used while no speaker is active
    QString bufferedText_;
    QString bufferedPartial_;
};

} // namespace Parley
