#pragma once

#include <QtCore/QJsonDocument>
#include <QtCore/QString>

#include "../common/Expected.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

class NoteStore;
class ProtectedTextModel;
class SpeakerRegistry;
class TranscriptSegmentStore;

/**
 * @brief Builds and writes the session export document
 *
 *     { "metadata":   { "exported_at": ISO-8601 },
 *       "speakers":   [ { "name", "color" } ],
 *       "transcript": [ { "timestamp", "speaker", "text" } ],
 *       "notes":      [ { "timestamp", "speaker", "text" } ] }
 *
 * Transcript text is the current (edited) line body and speaker names are
 * resolved now; notes use their frozen snapshots.
 */
class ExportSerializer {
public:
    static QJsonDocument buildDocument(const SpeakerRegistry& registry,
                                       const TranscriptSegmentStore& segments,
                                       const ProtectedTextModel& textModel,
                                       const NoteStore& notes,
                                       qint64 exportedAtMs);

    // Writes atomically: on failure the target is left as it was
    static Expected<void, SessionError> writeToFile(const QString& filePath, const QJsonDocument& document);
};

} // namespace Parley
