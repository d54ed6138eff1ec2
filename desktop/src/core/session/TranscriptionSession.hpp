#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

#include "../audio/AudioCaptureSource.hpp"
#include "../common/Expected.hpp"
#include "../transcription/RecognitionEngine.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

class NoteStore;
class ProtectedTextModel;
class SpeakerRegistry;
class TranscriptSegmentStore;
class TimestampMapper;
class SegmentFinalizationController;

/**
 * @brief Live transcription session: capture -> recognition -> transcript
 *
 * Lives on the UI thread. start() launches the capture source and a
 * recognition thread that loads the model and feeds it frames from a
 * bounded queue. The recognition thread never touches session state; it
 * posts events to an outbox that poll() drains on the UI thread (driven by
 * a timer while running). Every command below is synchronous.
 */
class TranscriptionSession : public QObject {
    Q_OBJECT

public:
    struct Options {
        int queueCapacity = 256;
        int pollIntervalMs = 100;
    };

    TranscriptionSession(std::unique_ptr<AudioCaptureSource> capture,
                         std::unique_ptr<RecognitionEngine> engine,
                         const Options& options,
                         QObject* parent = nullptr);
    ~TranscriptionSession() override;

    static QString startingText();

    // Speakers
    Expected<SpeakerId, SessionError> addSpeaker(const QString& name, const QString& color = QString());
    Expected<void, SessionError> renameSpeaker(SpeakerId id, const QString& newName);
    Expected<void, SessionError> setSpeakerColor(SpeakerId id, const QString& color);
    Expected<void, SessionError> activateSpeaker(SpeakerId id);

    // Run control
    Expected<void, SessionError> start(const QString& modelPath);
    Expected<void, SessionError> stop();
    bool isRunning() const;
    SessionStatus status() const;

    // Transcript and notes
    bool applyEdit(int position, int deleteLength, const QString& insertText);
    Expected<Note, SessionError> createNoteAt(int position);
    Expected<void, SessionError> editNote(NoteId noteId, const QString& text);
    Expected<void, SessionError> exportTo(const QString& filePath);

    QString liveText() const;

    const SpeakerRegistry& speakers() const;
    const TranscriptSegmentStore& segments() const;
    const ProtectedTextModel& textModel() const;
    const NoteStore& notes() const;
    const TimestampMapper& timestampMapper() const;

    // Frames the capture side had to wait for because the queue was full
    size_t blockedFramePushes() const;

public slots:
    // Drains the recognition outbox; the only place recognition results
    // reach the transcript
    void poll();

signals:
    void statusChanged(Parley::SessionStatus status);
    void liveTextChanged(const QString& text);
    void lineAppended(Parley::SegmentId segmentId);
    void speakersChanged();
    void speakerLinesChanged(Parley::SpeakerId speakerId);
    void noteAdded(Parley::NoteId noteId);
    void errorOccurred(Parley::SessionError error, const QString& message);

private:
    struct SessionPrivate;
    std::unique_ptr<SessionPrivate> d;

    void runRecognition(const QString& modelPath);
    void processOutbox();
    void appendClosedSegment(const Segment& segment);
    void setStatus(SessionStatus status);
    void setLiveText(const QString& text);
    double relativeNow() const;
};

} // namespace Parley
