#include "TranscriptionTypes.hpp"

namespace Parley {

QString toString(SessionError error) {
    switch (error) {
    case SessionError::CaptureFailed: return QStringLiteral("capture");
    case SessionError::ModelLoadFailed: return QStringLiteral("model-load");
    case SessionError::ExportFailed: return QStringLiteral("export");
    case SessionError::InvalidOperation: return QStringLiteral("invalid-operation");
    case SessionError::AlreadyRunning: return QStringLiteral("already-running");
    case SessionError::NotFound: return QStringLiteral("not-found");
    case SessionError::DuplicateSpeaker: return QStringLiteral("duplicate-speaker");
    case SessionError::InvalidColor: return QStringLiteral("invalid-color");
    }
    return QStringLiteral("unknown");
}

QString toString(RecognitionError error) {
    switch (error) {
    case RecognitionError::ModelNotFound: return QStringLiteral("model not found");
    case RecognitionError::ModelLoadFailed: return QStringLiteral("model load failed");
    case RecognitionError::NotReady: return QStringLiteral("recognizer not ready");
    case RecognitionError::InferenceFailed: return QStringLiteral("inference failed");
    case RecognitionError::InvalidFrame: return QStringLiteral("invalid frame");
    }
    return QStringLiteral("unknown");
}

QString toString(SessionStatus status) {
    switch (status) {
    case SessionStatus::Idle: return QStringLiteral("Idle");
    case SessionStatus::Loading: return QStringLiteral("Loading");
    case SessionStatus::Ready: return QStringLiteral("Ready");
    case SessionStatus::Failed: return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

} // namespace Parley
