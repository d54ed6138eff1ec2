#include "TranscriptionSession.hpp"
#include "ExportSerializer.hpp"
#include "NoteStore.hpp"
#include "ProtectedTextModel.hpp"
#include "SegmentFinalizationController.hpp"
#include "SpeakerRegistry.hpp"
#include "TimestampMapper.hpp"
#include "TranscriptSegmentStore.hpp"
#include "../common/ConcurrentQueue.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QFileInfo>
#include <QtCore/QThread>
#include <QtCore/QTimer>
#include <algorithm>

namespace Parley {

namespace {

// Handed from the recognition thread to the UI thread
struct SessionEvent {
    enum class Type {
        StreamStarted,
        StatusChanged,
        Recognition
    };

    Type type = Type::Recognition;
    qint64 anchorMs = 0;
    SessionStatus status = SessionStatus::Idle;
    QString message;
    RecognitionEvent recognition;

    static SessionEvent streamStarted(qint64 anchorMs) {
        SessionEvent event;
        event.type = Type::StreamStarted;
        event.anchorMs = anchorMs;
        return event;
    }

    static SessionEvent statusChanged(SessionStatus status, const QString& message = QString()) {
        SessionEvent event;
        event.type = Type::StatusChanged;
        event.status = status;
        event.message = message;
        return event;
    }

    static SessionEvent recognized(const RecognitionEvent& recognition) {
        SessionEvent event;
        event.type = Type::Recognition;
        event.recognition = recognition;
        return event;
    }
};

} // namespace

struct TranscriptionSession::SessionPrivate {
    SessionPrivate(std::unique_ptr<AudioCaptureSource> captureSource,
                   std::unique_ptr<RecognitionEngine> recognitionEngine,
                   const Options& sessionOptions)
        : options(sessionOptions)
        , capture(std::move(captureSource))
        , engine(std::move(recognitionEngine))
        , controller(store, registry, mapper)
        , textModel(registry)
        , notes(store, registry)
        , frames(static_cast<size_t>(sessionOptions.queueCapacity)) {
    }

    Options options;
    std::unique_ptr<AudioCaptureSource> capture;
    std::unique_ptr<RecognitionEngine> engine;

    SpeakerRegistry registry;
    TranscriptSegmentStore store;
    TimestampMapper mapper;
    SegmentFinalizationController controller;
    ProtectedTextModel textModel;
    NoteStore notes;

    BoundedQueue<AudioFrame> frames;
    EventOutbox<SessionEvent> outbox;

    std::unique_ptr<QThread> recognitionThread;
    QTimer* pollTimer = nullptr;

    SessionStatus status = SessionStatus::Idle;
    QString liveText;
    bool running = false;
    bool stopping = false;
    bool loadFailed = false;
};

TranscriptionSession::TranscriptionSession(std::unique_ptr<AudioCaptureSource> capture,
                                           std::unique_ptr<RecognitionEngine> engine,
                                           const Options& options,
                                           QObject* parent)
    : QObject(parent)
    , d(std::make_unique<SessionPrivate>(std::move(capture), std::move(engine), options)) {
    d->pollTimer = new QTimer(this);
    d->pollTimer->setInterval(std::max(1, options.pollIntervalMs));
    connect(d->pollTimer, &QTimer::timeout, this, &TranscriptionSession::poll);
}

TranscriptionSession::~TranscriptionSession() {
    auto stopped = stop();
    if (stopped.hasError()) {
        PARLEY_WARN("Session did not stop cleanly: {}", toString(stopped.error()).toStdString());
    }
}

QString TranscriptionSession::startingText() {
    return QStringLiteral("Wait, starting...");
}

Expected<SpeakerId, SessionError> TranscriptionSession::addSpeaker(const QString& name, const QString& color) {
    auto added = d->registry.addSpeaker(name, color);
    if (added.hasError()) {
        emit errorOccurred(added.error(), QString("Cannot add speaker '%1'").arg(name));
        return added;
    }

    emit speakersChanged();

    if (!d->registry.hasActiveSpeaker()) {
        auto activated = activateSpeaker(added.value());
        if (activated.hasError()) {
            return makeUnexpected(activated.error());
        }
    }
    return added;
}

Expected<void, SessionError> TranscriptionSession::renameSpeaker(SpeakerId id, const QString& newName) {
    auto renamed = d->registry.renameSpeaker(id, newName);
    if (renamed.hasError()) {
        emit errorOccurred(renamed.error(), QString("Cannot rename speaker to '%1'").arg(newName));
        return renamed;
    }

    d->textModel.renameSpeaker(id);
    emit speakersChanged();
    emit speakerLinesChanged(id);
    return {};
}

Expected<void, SessionError> TranscriptionSession::setSpeakerColor(SpeakerId id, const QString& color) {
    auto changed = d->registry.setSpeakerColor(id, color);
    if (changed.hasError()) {
        emit errorOccurred(changed.error(), QString("Cannot set color '%1'").arg(color));
        return changed;
    }

    emit speakersChanged();
    emit speakerLinesChanged(id);
    return {};
}

Expected<void, SessionError> TranscriptionSession::activateSpeaker(SpeakerId id) {
    const double now = d->mapper.isAnchored() ? relativeNow() : 0.0;
    auto switched = d->controller.onSpeakerSwitch(id, now);
    if (switched.hasError()) {
        emit errorOccurred(switched.error(), QString("Cannot activate speaker %1").arg(id));
        return makeUnexpected(switched.error());
    }

    if (switched.value()) {
        appendClosedSegment(*switched.value());
    }
    if (d->status == SessionStatus::Ready) {
        setLiveText(d->controller.liveText());
    }
    emit speakersChanged();
    return {};
}

Expected<void, SessionError> TranscriptionSession::start(const QString& modelPath) {
    if (d->running) {
        PARLEY_WARN("start() while a session is already running");
        emit errorOccurred(SessionError::AlreadyRunning, "Session is already running");
        return makeUnexpected(SessionError::AlreadyRunning);
    }

    const QFileInfo model(modelPath);
    if (!model.exists() || !model.isFile() || !model.isReadable()) {
        PARLEY_ERROR("Model not found or unreadable: {}", modelPath.toStdString());
        emit errorOccurred(SessionError::ModelLoadFailed, QString("Cannot read model %1").arg(modelPath));
        return makeUnexpected(SessionError::ModelLoadFailed);
    }

    d->frames.reset();
    d->outbox.clear();
    d->mapper.reset();
    d->loadFailed = false;

    if (!d->registry.hasActiveSpeaker() && !d->registry.isEmpty()) {
        auto activated = d->controller.onSpeakerSwitch(d->registry.speakers().front().id, 0.0);
        if (activated.hasError()) {
            PARLEY_WARN("Could not activate the first speaker: {}", toString(activated.error()).toStdString());
        }
        emit speakersChanged();
    }

    BoundedQueue<AudioFrame>* frames = &d->frames;
    auto captured = d->capture->start([frames](AudioFrame&& frame) {
        return frames->push(std::move(frame));
    });
    if (captured.hasError()) {
        PARLEY_ERROR("Audio capture failed to start ({})", d->capture->description().toStdString());
        emit errorOccurred(SessionError::CaptureFailed,
                           QString("Cannot open audio input %1").arg(d->capture->description()));
        return makeUnexpected(SessionError::CaptureFailed);
    }

    d->running = true;
    setStatus(SessionStatus::Loading);
    setLiveText(startingText());

    d->recognitionThread.reset(QThread::create([this, modelPath]() { runRecognition(modelPath); }));
    d->recognitionThread->setObjectName("parley-recognition");
    d->recognitionThread->start();
    d->pollTimer->start();

    PARLEY_INFO("Session started: {} with model {}", d->capture->description().toStdString(),
                model.fileName().toStdString());
    return {};
}

Expected<void, SessionError> TranscriptionSession::stop() {
    if (!d->running || d->stopping) {
        return {};
    }
    d->stopping = true;

    // Capture stops first so the audio it flushes on the way out is still queued.
    // A push blocked on a full queue completes because the recognition thread
    // keeps draining until the queue is closed.
    d->capture->stop();
    d->frames.close();
    if (d->recognitionThread) {
        d->recognitionThread->wait();
        d->recognitionThread.reset();
    }
    d->pollTimer->stop();

    processOutbox();

    const double now = d->mapper.isAnchored() ? relativeNow() : 0.0;
    if (auto closed = d->controller.onSessionStop(now)) {
        appendClosedSegment(*closed);
    }
    d->mapper.reset();

    d->running = false;
    d->stopping = false;
    setStatus(d->loadFailed ? SessionStatus::Failed : SessionStatus::Idle);
    setLiveText(QString());

    PARLEY_INFO("Session stopped: {} segments", d->store.size());
    return {};
}

bool TranscriptionSession::isRunning() const {
    return d->running;
}

SessionStatus TranscriptionSession::status() const {
    return d->status;
}

bool TranscriptionSession::applyEdit(int position, int deleteLength, const QString& insertText) {
    return d->textModel.applyEdit(position, deleteLength, insertText);
}

Expected<Note, SessionError> TranscriptionSession::createNoteAt(int position) {
    const SegmentId segmentId = d->textModel.locateLine(position);
    if (segmentId == InvalidSegmentId) {
        emit errorOccurred(SessionError::NotFound, QString("No transcript line at position %1").arg(position));
        return makeUnexpected(SessionError::NotFound);
    }

    auto created = d->notes.createNote(segmentId);
    if (created.hasError()) {
        emit errorOccurred(created.error(), QString("Cannot annotate segment %1").arg(segmentId));
        return created;
    }

    emit noteAdded(created.value().id);
    return created;
}

Expected<void, SessionError> TranscriptionSession::editNote(NoteId noteId, const QString& text) {
    auto edited = d->notes.editNote(noteId, text);
    if (edited.hasError()) {
        emit errorOccurred(edited.error(), QString("No note %1").arg(noteId));
    }
    return edited;
}

Expected<void, SessionError> TranscriptionSession::exportTo(const QString& filePath) {
    const QJsonDocument document = ExportSerializer::buildDocument(
        d->registry, d->store, d->textModel, d->notes, QDateTime::currentMSecsSinceEpoch());

    auto written = ExportSerializer::writeToFile(filePath, document);
    if (written.hasError()) {
        emit errorOccurred(SessionError::ExportFailed, QString("Export to %1 failed").arg(filePath));
    }
    return written;
}

QString TranscriptionSession::liveText() const {
    return d->liveText;
}

const SpeakerRegistry& TranscriptionSession::speakers() const {
    return d->registry;
}

const TranscriptSegmentStore& TranscriptionSession::segments() const {
    return d->store;
}

const ProtectedTextModel& TranscriptionSession::textModel() const {
    return d->textModel;
}

const NoteStore& TranscriptionSession::notes() const {
    return d->notes;
}

const TimestampMapper& TranscriptionSession::timestampMapper() const {
    return d->mapper;
}

size_t TranscriptionSession::blockedFramePushes() const {
    return d->frames.blockedPushes();
}

void TranscriptionSession::poll() {
    processOutbox();

    if (d->loadFailed && d->running && !d->stopping) {
        auto stopped = stop();
        if (stopped.hasError()) {
            PARLEY_WARN("Stopping after a failed model load: {}", toString(stopped.error()).toStdString());
        }
    }
}

void TranscriptionSession::runRecognition(const QString& modelPath) {
    // Recognition thread: only the engine, the frame queue and the outbox are touched here
    RecognitionEngine& engine = *d->engine;
    BoundedQueue<AudioFrame>& frames = d->frames;
    EventOutbox<SessionEvent>& outbox = d->outbox;

    auto started = engine.start(modelPath);
    if (started.hasError()) {
        PARLEY_ERROR("Recognition model failed to load: {}", toString(started.error()).toStdString());
        frames.close();
        outbox.post(SessionEvent::statusChanged(SessionStatus::Failed, toString(started.error())));
        return;
    }
    outbox.post(SessionEvent::statusChanged(SessionStatus::Ready));

    bool anchored = false;
    qint64 skipped = 0;
    AudioFrame frame;
    while (frames.pop(frame)) {
        if (!anchored) {
            outbox.post(SessionEvent::streamStarted(frame.capturedAtMs));
            anchored = true;
        }

        auto result = engine.consume(frame);
        if (result.hasError()) {
            ++skipped;
            PARLEY_WARN("Skipping audio frame: {}", toString(result.error()).toStdString());
            continue;
        }
        if (result.value()) {
            outbox.post(SessionEvent::recognized(*result.value()));
        }
    }

    if (auto last = engine.flush()) {
        outbox.post(SessionEvent::recognized(*last));
    }
    engine.stop();

    if (skipped > 0) {
        PARLEY_WARN("{} audio frames were skipped after recognizer errors", skipped);
    }
}

void TranscriptionSession::processOutbox() {
    for (SessionEvent& event : d->outbox.drain()) {
        switch (event.type) {
            case SessionEvent::Type::StreamStarted:
                d->mapper.anchor(event.anchorMs);
                d->controller.onSessionStart();
                break;

            case SessionEvent::Type::StatusChanged:
                if (event.status == SessionStatus::Failed) {
                    d->loadFailed = true;
                    setStatus(SessionStatus::Failed);
                    setLiveText(QString());
                    emit errorOccurred(SessionError::ModelLoadFailed,
                                       QString("Model failed to load: %1").arg(event.message));
                } else {
                    setStatus(event.status);
                    setLiveText(d->controller.liveText());
                }
                break;

            case SessionEvent::Type::Recognition: {
                const RecognitionEvent& recognition = event.recognition;
                if (recognition.isFinal()) {
                    if (auto closed = d->controller.onFinal(recognition.text, recognition.relativeEndTime)) {
                        appendClosedSegment(*closed);
                    }
                } else {
                    d->controller.onPartial(recognition.text);
                }
                setLiveText(d->controller.liveText());
                break;
            }
        }
    }
}

void TranscriptionSession::appendClosedSegment(const Segment& segment) {
    d->textModel.appendFinalizedLine(segment);
    PARLEY_DEBUG("Segment {} closed: {}", segment.id, segment.text.toStdString());
    emit lineAppended(segment.id);
}

void TranscriptionSession::setStatus(SessionStatus status) {
    if (d->status == status) {
        return;
    }
    d->status = status;
    PARLEY_INFO("Session status: {}", toString(status).toStdString());
    emit statusChanged(status);
}

void TranscriptionSession::setLiveText(const QString& text) {
    if (d->liveText == text) {
        return;
    }
    d->liveText = text;
    emit liveTextChanged(text);
}

double TranscriptionSession::relativeNow() const {
    return d->mapper.toRelative(QDateTime::currentMSecsSinceEpoch());
}

} // namespace Parley
