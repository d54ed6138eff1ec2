#include "ProtectedTextModel.hpp"
#include "SpeakerRegistry.hpp"
#include "TimeFormat.hpp"
#include "../common/Logger.hpp"

#include <algorithm>

namespace Parley {

ProtectedTextModel::ProtectedTextModel(const SpeakerRegistry& registry)
    : registry_(registry) {
}

QString ProtectedTextModel::renderPrefix(const TimeRange& range, const QString& speakerName) {
    return QString("[%1] %2: ").arg(TimeFormat::range(range), speakerName);
}

QString ProtectedTextModel::speakerName(SpeakerId speakerId) const {
    const Speaker* speaker = registry_.speaker(speakerId);
    return speaker ? speaker->name : QStringLiteral("Unknown");
}

int ProtectedTextModel::appendFinalizedLine(const Segment& segment) {
    // Bodies are single-line by construction
    QString body = segment.text;
    body.replace('\n', ' ').replace('\r', ' ');

    LineRecord record;
    record.segmentId = segment.id;
    record.speakerId = segment.speakerId;
    record.range = segment.range;
    record.start = static_cast<int>(document_.size());

    const QString prefix = renderPrefix(segment.range, speakerName(segment.speakerId));
    record.prefixLength = static_cast<int>(prefix.size());
    record.bodyLength = static_cast<int>(body.size());

    document_ += prefix;
    document_ += body;
    document_ += '\n';
    lines_.push_back(record);
    return static_cast<int>(lines_.size()) - 1;
}

int ProtectedTextModel::lineIndexAt(int position) const {
    if (position < 0 || lines_.empty()) {
        return -1;
    }
    // Last line starting at or before position
    auto it = std::upper_bound(lines_.begin(), lines_.end(), position,
                               [](int pos, const LineRecord& line) { return pos < line.start; });
    if (it == lines_.begin()) {
        return -1;
    }
    --it;
    if (position > it->end()) {
        return -1;
    }
    return static_cast<int>(std::distance(lines_.begin(), it));
}

bool ProtectedTextModel::applyEdit(int position, int deleteLength, const QString& insertText) {
    if (position < 0 || deleteLength < 0) {
        return false;
    }
    if (insertText.contains('\n') || insertText.contains('\r')) {
        return false;
    }

    const int index = lineIndexAt(position);
    if (index < 0) {
        return false;
    }

    LineRecord& record = lines_[static_cast<size_t>(index)];
    // Compared as a remaining length so a huge deleteLength cannot overflow
    if (position < record.bodyStart() || deleteLength > record.end() - position) {
        PARLEY_TRACE("Rejected edit at {} (+{}) touching a protected region", position, deleteLength);
        return false;
    }

    document_.replace(position, deleteLength, insertText);
    const int delta = static_cast<int>(insertText.size()) - deleteLength;
    record.bodyLength += delta;
    shiftLinesAfter(index, delta);
    return true;
}

void ProtectedTextModel::shiftLinesAfter(int index, int delta) {
    if (delta == 0) {
        return;
    }
    for (size_t i = static_cast<size_t>(index) + 1; i < lines_.size(); ++i) {
        lines_[i].start += delta;
    }
}

SegmentId ProtectedTextModel::locateLine(int position) const {
    const int index = lineIndexAt(position);
    return index < 0 ? InvalidSegmentId : lines_[static_cast<size_t>(index)].segmentId;
}

int ProtectedTextModel::lineIndexOf(SegmentId segmentId) const {
    auto it = std::find_if(lines_.begin(), lines_.end(),
                           [segmentId](const LineRecord& line) { return line.segmentId == segmentId; });
    return it == lines_.end() ? -1 : static_cast<int>(std::distance(lines_.begin(), it));
}

std::optional<QString> ProtectedTextModel::currentBodyText(SegmentId segmentId) const {
    const int index = lineIndexOf(segmentId);
    if (index < 0) {
        return std::nullopt;
    }
    const LineRecord& record = lines_[static_cast<size_t>(index)];
    return document_.mid(record.bodyStart(), record.bodyLength);
}

int ProtectedTextModel::renameSpeaker(SpeakerId speakerId) {
    const QString name = speakerName(speakerId);
    int shift = 0;
    int touched = 0;

    for (LineRecord& record : lines_) {
        record.start += shift;
        if (record.speakerId != speakerId) {
            continue;
        }
        const QString prefix = renderPrefix(record.range, name);
        document_.replace(record.start, record.prefixLength, prefix);
        shift += static_cast<int>(prefix.size()) - record.prefixLength;
        record.prefixLength = static_cast<int>(prefix.size());
        ++touched;
    }
    return touched;
}

QString ProtectedTextModel::colorForLine(int index) const {
    const Speaker* speaker = registry_.speaker(line(index).speakerId);
    return speaker ? speaker->color : QString();
}

QString ProtectedTextModel::lineText(int index) const {
    const LineRecord& record = line(index);
    return document_.mid(record.start, record.prefixLength + record.bodyLength);
}

QString ProtectedTextModel::prefixText(int index) const {
    const LineRecord& record = line(index);
    return document_.mid(record.start, record.prefixLength);
}

} // namespace Parley
