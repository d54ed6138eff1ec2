#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTextStream>
#include <memory>

#include "../../core/transcription/TranscriptionTypes.hpp"

QT_BEGIN_NAMESPACE
class QFile;
class QSocketNotifier;
QT_END_NAMESPACE

namespace Parley {

class TranscriptionSession;

/**
 * @brief Line-oriented terminal front-end for a TranscriptionSession
 *
 * Prints closed transcript lines, status changes and errors as they
 * happen and executes one command per input line:
 *
 *     add <name> [#color]      switch <name>        rename <name> <new>
 *     color <name> <#rrggbb>   edit <pos> <len> <text>
 *     note <pos>               annotate <id> <text> show | notes
 *     export <path>            stop | quit | help
 */
class ConsoleController : public QObject {
    Q_OBJECT

public:
    ConsoleController(TranscriptionSession& session, QIODevice* output, QObject* parent = nullptr);
    ~ConsoleController() override;

    void setShowPartials(bool show) { showPartials_ = show; }

    // Starts reading commands from standard input
    void attachStdin();

    // Returns false once the user asked to quit
    bool executeCommand(const QString& line);

signals:
    void quitRequested();

private slots:
    void onStdinReady();
    void onLineAppended(Parley::SegmentId segmentId);
    void onStatusChanged(Parley::SessionStatus status);
    void onLiveTextChanged(const QString& text);
    void onSpeakerLinesChanged(Parley::SpeakerId speakerId);
    void onErrorOccurred(Parley::SessionError error, const QString& message);

private:
    SpeakerId speakerIdByName(const QString& name) const;
    void printTranscript();
    void printNotes();
    void printHelp();

    TranscriptionSession& session_;
    QTextStream out_;
    std::unique_ptr<QFile> stdin_;
    QSocketNotifier* stdinNotifier_ = nullptr;
    bool showPartials_ = true;
};

} // namespace Parley
