#include "ExportSerializer.hpp"
#include "NoteStore.hpp"
#include "ProtectedTextModel.hpp"
#include "SpeakerRegistry.hpp"
#include "TimeFormat.hpp"
#include "TranscriptSegmentStore.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QSaveFile>

namespace Parley {

QJsonDocument ExportSerializer::buildDocument(const SpeakerRegistry& registry,
                                              const TranscriptSegmentStore& segments,
                                              const ProtectedTextModel& textModel,
                                              const NoteStore& notes,
                                              qint64 exportedAtMs) {
    QJsonObject metadata;
    metadata["exported_at"] = TimeFormat::isoTimestamp(exportedAtMs);

    QJsonArray speakersArray;
    for (const Speaker& speaker : registry.speakers()) {
        QJsonObject speakerObj;
        speakerObj["name"] = speaker.name;
        speakerObj["color"] = speaker.color;
        speakersArray.append(speakerObj);
    }

    QJsonArray transcriptArray;
    for (const Segment& segment : segments.segments()) {
        const Speaker* speaker = registry.speaker(segment.speakerId);

        QJsonObject entry;
        entry["timestamp"] = TimeFormat::range(segment.range);
        entry["speaker"] = speaker ? speaker->name : QString();
        entry["text"] = textModel.currentBodyText(segment.id).value_or(segment.text);
        transcriptArray.append(entry);
    }

    QJsonArray notesArray;
    for (const Note& note : notes.listNotes()) {
        QJsonObject entry;
        entry["timestamp"] = TimeFormat::range(note.timeRangeSnapshot);
        entry["speaker"] = note.speakerNameSnapshot;
        entry["text"] = note.text;
        notesArray.append(entry);
    }

    QJsonObject root;
    root["metadata"] = metadata;
    root["speakers"] = speakersArray;
    root["transcript"] = transcriptArray;
    root["notes"] = notesArray;
    return QJsonDocument(root);
}

Expected<void, SessionError> ExportSerializer::writeToFile(const QString& filePath, const QJsonDocument& document) {
    if (filePath.isEmpty()) {
        return makeUnexpected(SessionError::ExportFailed);
    }

    const QFileInfo target(filePath);
    if (!QDir().mkpath(target.absolutePath())) {
        PARLEY_ERROR("Cannot create export directory {}", target.absolutePath().toStdString());
        return makeUnexpected(SessionError::ExportFailed);
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        PARLEY_ERROR("Cannot open {} for export: {}", filePath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(SessionError::ExportFailed);
    }

    const QByteArray json = document.toJson(QJsonDocument::Indented);
    if (file.write(json) != json.size()) {
        PARLEY_ERROR("Export write to {} failed: {}", filePath.toStdString(), file.errorString().toStdString());
        file.cancelWriting();
        return makeUnexpected(SessionError::ExportFailed);
    }

    if (!file.commit()) {
        PARLEY_ERROR("Export commit to {} failed: {}", filePath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(SessionError::ExportFailed);
    }

    PARLEY_INFO("Exported session to {} ({} bytes)", filePath.toStdString(), json.size());
    return {};
}

} // namespace Parley
