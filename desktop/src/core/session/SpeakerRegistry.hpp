#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>
#include <vector>

#include "../common/Expected.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {

/**
 * @brief Speaker definitions and the single active speaker
 *
 * Ids are assigned from 1 upwards and never reused. Names are unique and
 * case-sensitive. Colors are stored as lower-case "#rrggbb"; speakers
 * added without a color take the next palette entry.
 */
class SpeakerRegistry {
public:
    static const QStringList& palette();

    // "#RGB" / "#RRGGBB" (case-insensitive) -> "#rrggbb"
    static std::optional<QString> normalizeColor(const QString& color);

    Expected<SpeakerId, SessionError> addSpeaker(const QString& name, const QString& color = QString());
    Expected<void, SessionError> renameSpeaker(SpeakerId id, const QString& newName);
    Expected<void, SessionError> setSpeakerColor(SpeakerId id, const QString& color);

    // Only TranscriptionSession (via SegmentFinalizationController) calls this
    Expected<void, SessionError> activateSpeaker(SpeakerId id);

    SpeakerId activeSpeakerId() const { return activeSpeakerId_; }
    bool hasActiveSpeaker() const { return activeSpeakerId_ != InvalidSpeakerId; }

    const Speaker* speaker(SpeakerId id) const;
    const Speaker* findByName(const QString& name) const;
    bool contains(SpeakerId id) const { return speaker(id) != nullptr; }

    const std::vector<Speaker>& speakers() const { return speakers_; }
    bool isEmpty() const { return speakers_.empty(); }
    int count() const { return static_cast<int>(speakers_.size()); }

private:
    Speaker* mutableSpeaker(SpeakerId id);

    std::vector<Speaker> speakers_;
    SpeakerId nextId_ = 1;
    SpeakerId activeSpeakerId_ = InvalidSpeakerId;
    int paletteIndex_ = 0;
};

} // namespace Parley
