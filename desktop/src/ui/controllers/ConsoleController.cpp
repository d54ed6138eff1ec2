#include "ConsoleController.hpp"
#include "../../core/common/Logger.hpp"
#include "../../core/session/NoteStore.hpp"
#include "../../core/session/ProtectedTextModel.hpp"
#include "../../core/session/SpeakerRegistry.hpp"
#include "../../core/session/TimeFormat.hpp"
#include "../../core/session/TranscriptionSession.hpp"

#include <QtCore/QFile>
#include <QtCore/QRegularExpression>
#include <QtCore/QSocketNotifier>
#include <cstdio>

namespace Parley {

ConsoleController::ConsoleController(TranscriptionSession& session, QIODevice* output, QObject* parent)
    : QObject(parent)
    , session_(session)
    , out_(output) {
    connect(&session_, &TranscriptionSession::lineAppended, this, &ConsoleController::onLineAppended);
    connect(&session_, &TranscriptionSession::statusChanged, this, &ConsoleController::onStatusChanged);
    connect(&session_, &TranscriptionSession::liveTextChanged, this, &ConsoleController::onLiveTextChanged);
    connect(&session_, &TranscriptionSession::speakerLinesChanged, this, &ConsoleController::onSpeakerLinesChanged);
    connect(&session_, &TranscriptionSession::errorOccurred, this, &ConsoleController::onErrorOccurred);
}

ConsoleController::~ConsoleController() = default;

void ConsoleController::attachStdin() {
    if (stdin_) {
        return;
    }
    stdin_ = std::make_unique<QFile>();
    if (!stdin_->open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
        PARLEY_WARN("Cannot read commands from standard input");
        stdin_.reset();
        return;
    }
    stdinNotifier_ = new QSocketNotifier(fileno(stdin), QSocketNotifier::Read, this);
    connect(stdinNotifier_, &QSocketNotifier::activated, this, &ConsoleController::onStdinReady);
}

void ConsoleController::onStdinReady() {
    const QByteArray raw = stdin_->readLine();
    if (raw.isEmpty()) {
        // EOF
        stdinNotifier_->setEnabled(false);
        emit quitRequested();
        return;
    }
    if (!executeCommand(QString::fromUtf8(raw).trimmed())) {
        stdinNotifier_->setEnabled(false);
        emit quitRequested();
    }
}

SpeakerId ConsoleController::speakerIdByName(const QString& name) const {
    const Speaker* speaker = session_.speakers().findByName(name);
    return speaker ? speaker->id : InvalidSpeakerId;
}

bool ConsoleController::executeCommand(const QString& line) {
    if (line.isEmpty()) {
        return true;
    }

    const QString command = line.section(' ', 0, 0).toLower();
    const QString rest = line.section(' ', 1).trimmed();
    const QStringList args = rest.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);

    if (command == "quit" || command == "exit") {
        return false;
    }

    if (command == "help") {
        printHelp();
    } else if (command == "add") {
        QString name = rest;
        QString color;
        if (args.size() >= 2 && args.last().startsWith('#')) {
            color = args.last();
            name = rest.left(rest.lastIndexOf(color)).trimmed();
        }
        auto added = session_.addSpeaker(name, color);
        if (added) {
            const Speaker* speaker = session_.speakers().speaker(added.value());
            out_ << "speaker " << speaker->name << " " << speaker->color << Qt::endl;
        }
    } else if (command == "switch") {
        const SpeakerId id = speakerIdByName(rest);
        if (id == InvalidSpeakerId && !session_.speakers().isEmpty()) {
            out_ << "unknown speaker: " << rest << Qt::endl;
        } else if (session_.activateSpeaker(id)) {
            // With no speakers defined this fails as an invalid operation
            out_ << "active speaker: " << rest << Qt::endl;
        }
    } else if (command == "rename" && args.size() == 2) {
        const SpeakerId id = speakerIdByName(args[0]);
        if (id == InvalidSpeakerId) {
            out_ << "unknown speaker: " << args[0] << Qt::endl;
        } else if (session_.renameSpeaker(id, args[1])) {
            // Failures are reported through errorOccurred
            out_ << "renamed " << args[0] << " to " << args[1] << Qt::endl;
        }
    } else if (command == "color" && args.size() == 2) {
        const SpeakerId id = speakerIdByName(args[0]);
        if (id == InvalidSpeakerId) {
            out_ << "unknown speaker: " << args[0] << Qt::endl;
        } else if (session_.setSpeakerColor(id, args[1])) {
            out_ << "color of " << args[0] << " set" << Qt::endl;
        }
    } else if (command == "edit" && args.size() >= 2) {
        bool posOk = false;
        bool lenOk = false;
        const int position = args[0].toInt(&posOk);
        const int length = args[1].toInt(&lenOk);
        const QString text = rest.section(' ', 2, -1, QString::SectionSkipEmpty);
        if (!posOk || !lenOk) {
            out_ << "usage: edit <pos> <len> <text>" << Qt::endl;
        } else if (!session_.applyEdit(position, length, text)) {
            out_ << "edit rejected" << Qt::endl;
        }
    } else if (command == "note" && args.size() == 1) {
        auto note = session_.createNoteAt(args[0].toInt());
        if (note) {
            out_ << "note " << note.value().id << " [" << TimeFormat::range(note.value().timeRangeSnapshot)
                 << "] " << note.value().speakerNameSnapshot << Qt::endl;
        }
    } else if (command == "annotate" && args.size() >= 1) {
        const QString text = rest.section(' ', 1, -1, QString::SectionSkipEmpty);
        if (session_.editNote(args[0].toLongLong(), text)) {
            out_ << "note " << args[0] << " updated" << Qt::endl;
        }
    } else if (command == "show") {
        printTranscript();
    } else if (command == "notes") {
        printNotes();
    } else if (command == "export" && args.size() == 1) {
        if (session_.exportTo(args[0])) {
            out_ << "exported to " << args[0] << Qt::endl;
        }
    } else if (command == "stop") {
        if (session_.stop()) {
            out_ << session_.segments().size() << " segments" << Qt::endl;
        }
    } else {
        out_ << "unknown command: " << line << " (try 'help')" << Qt::endl;
    }
    return true;
}

void ConsoleController::onLineAppended(SegmentId segmentId) {
    const ProtectedTextModel& model = session_.textModel();
    const int index = model.lineIndexOf(segmentId);
    if (index >= 0) {
        out_ << model.lineText(index) << Qt::endl;
    }
}

void ConsoleController::onStatusChanged(SessionStatus status) {
    out_ << "-- " << toString(status) << Qt::endl;
}

void ConsoleController::onLiveTextChanged(const QString& text) {
    if (showPartials_ && !text.isEmpty()) {
        out_ << "   ... " << text << Qt::endl;
    }
}

void ConsoleController::onSpeakerLinesChanged(SpeakerId speakerId) {
    const Speaker* speaker = session_.speakers().speaker(speakerId);
    if (speaker) {
        out_ << "speaker " << speaker->name << " " << speaker->color << Qt::endl;
    }
}

void ConsoleController::onErrorOccurred(SessionError error, const QString& message) {
    out_ << "error (" << toString(error) << "): " << message << Qt::endl;
}

void ConsoleController::printTranscript() {
    const ProtectedTextModel& model = session_.textModel();
    for (int i = 0; i < model.lineCount(); ++i) {
        const auto& record = model.line(i);
        out_ << record.start << "\t" << model.lineText(i) << Qt::endl;
    }
}

void ConsoleController::printNotes() {
    for (const Note& note : session_.notes().listNotes()) {
        out_ << note.id << " [" << TimeFormat::range(note.timeRangeSnapshot) << "] "
             << note.speakerNameSnapshot << ": " << note.text << Qt::endl;
    }
}

void ConsoleController::printHelp() {
    out_ << "add <name> [#color] | switch <name> | rename <name> <new> | color <name> <#rrggbb>" << Qt::endl
         << "edit <pos> <len> <text> | note <pos> | annotate <id> <text>" << Qt::endl
         << "show | notes | export <path> | stop | quit" << Qt::endl;
}

} // namespace Parley
