#pragma once

#include <QtCore/QString>
#include <QtCore/QMetaType>
#include <QtCore/QtGlobal>

namespace Parley {

using SpeakerId = qint64;
using SegmentId = qint64;
using NoteId = qint64;

constexpr SpeakerId InvalidSpeakerId = 0;
constexpr SegmentId InvalidSegmentId = 0;

enum class SessionError {
    CaptureFailed,
    ModelLoadFailed,
    ExportFailed,
    InvalidOperation,
    AlreadyRunning,
    NotFound,
    DuplicateSpeaker,
    InvalidColor
};

enum class RecognitionError {
    ModelNotFound,
    ModelLoadFailed,
    NotReady,
    InferenceFailed,
    InvalidFrame
};

enum class EngineState {
    Idle,
    Loading,
    Ready
};

enum class SessionStatus {
    Idle,
    Loading,
    Ready,
    Failed
};

QString toString(SessionError error);
QString toString(RecognitionError error);
QString toString(SessionStatus status);

struct Speaker {
    SpeakerId id = InvalidSpeakerId;
    QString name;
    QString color;      // "#rrggbb"
};

// Wall-clock interval, milliseconds since the Unix epoch.
struct TimeRange {
    qint64 startMs = 0;
    qint64 endMs = 0;

    qint64 duration() const { return endMs - startMs; }
    bool isValid() const { return startMs <= endMs; }
    bool operator==(const TimeRange& other) const {
        return startMs == other.startMs && endMs == other.endMs;
    }
};

// A closed transcript segment. Only `text` is ever edited after closing,
// and those edits live in ProtectedTextModel, not here.
struct Segment {
    SegmentId id = InvalidSegmentId;
    qint64 order = 0;
    TimeRange range;
    SpeakerId speakerId = InvalidSpeakerId;
    QString text;
};

struct Note {
    NoteId id = 0;
    TimeRange timeRangeSnapshot;
    QString speakerNameSnapshot;
    QString speakerColorSnapshot;
    QString text;
};

// Output of the recognizer. Partial text is superseded by the next event;
// a Final ends the utterance at `relativeEndTime` seconds after the
// recognizer's own stream start.
struct RecognitionEvent {
    enum class Kind {
        Partial,
        Final
    };

    Kind kind = Kind::Partial;
    QString text;
    double relativeEndTime = 0.0;

    static RecognitionEvent makePartial(const QString& text) {
        return RecognitionEvent{Kind::Partial, text, 0.0};
    }
    static RecognitionEvent makeFinal(const QString& text, double relativeEndTime) {
        return RecognitionEvent{Kind::Final, text, relativeEndTime};
    }

    bool isFinal() const { return kind == Kind::Final; }
};

} // namespace Parley

Q_DECLARE_METATYPE(Parley::SessionError)
Q_DECLARE_METATYPE(Parley::SessionStatus)
