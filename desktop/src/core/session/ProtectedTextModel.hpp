#pragma once

#include <QtCore/QString>
#include <optional>
#include <vector>

#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

class SpeakerRegistry;

/**
 * @brief Editable text projection of the closed transcript segments
 *
 * Every closed segment is rendered as exactly one line
 *
 *     [HH:mm:ss.zzz-HH:mm:ss.zzz] Speaker: body text\n
 *
 * The part up to and including ": " is the prefix and cannot be edited.
 * Edits are accepted only when they fall entirely inside one line's body
 * and do not insert a line break; anything else is rejected and leaves
 * the document untouched. Line colors and names are resolved from the
 * registry by speaker id at render time.
 */
class ProtectedTextModel {
public:
    struct LineRecord {
        SegmentId segmentId = InvalidSegmentId;
        SpeakerId speakerId = InvalidSpeakerId;
        TimeRange range;
        int start = 0;          // offset of the line in the document
        int prefixLength = 0;
        int bodyLength = 0;

        int bodyStart() const { return start + prefixLength; }
        int end() const { return start + prefixLength + bodyLength; }  // excludes '\n'
    };

    explicit ProtectedTextModel(const SpeakerRegistry& registry);

    static QString renderPrefix(const TimeRange& range, const QString& speakerName);

    // Returns the index of the new line
    int appendFinalizedLine(const Segment& segment);

    bool applyEdit(int position, int deleteLength, const QString& insertText);

    // Segment owning the character at (or the cursor before) @p position
    SegmentId locateLine(int position) const;

    std::optional<QString> currentBodyText(SegmentId segmentId) const;

    // Re-renders the prefixes of every line of @p speakerId; returns the number of lines touched
    int renameSpeaker(SpeakerId speakerId);

    QString colorForLine(int index) const;

    const QString& text() const { return document_; }
    int lineCount() const { return static_cast<int>(lines_.size()); }
    const LineRecord& line(int index) const { return lines_.at(static_cast<size_t>(index)); }
    int lineIndexOf(SegmentId segmentId) const;
    QString lineText(int index) const;
    QString prefixText(int index) const;

private:
    QString speakerName(SpeakerId speakerId) const;
    int lineIndexAt(int position) const;
    void shiftLinesAfter(int index, int delta);

    const SpeakerRegistry& registry_;
    QString document_;
    std::vector<LineRecord> lines_;
};

} // namespace Parley
