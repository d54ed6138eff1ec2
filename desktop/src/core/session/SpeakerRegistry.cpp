#include "SpeakerRegistry.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QRegularExpression>
#include <algorithm>

namespace Parley {

const QStringList& SpeakerRegistry::palette() {
    static const QStringList colors = {
        "#1f77b4", "#ff7f0e", "#2ca02c", "#d62728",
        "#9467bd", "#8c564b", "#e377c2", "#7f7f7f"
    };
    return colors;
}

std::optional<QString> SpeakerRegistry::normalizeColor(const QString& color) {
    static const QRegularExpression pattern("^#([0-9a-fA-F]{3}|[0-9a-fA-F]{6})$");

    const QString trimmed = color.trimmed();
    const auto match = pattern.match(trimmed);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    QString hex = match.captured(1).toLower();
    if (hex.size() == 3) {
        hex = QString("%1%1%2%2%3%3").arg(hex[0]).arg(hex[1]).arg(hex[2]);
    }
    return QStringLiteral("#") + hex;
}

Expected<SpeakerId, SessionError> SpeakerRegistry::addSpeaker(const QString& name, const QString& color) {
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        PARLEY_WARN("Rejected speaker with empty name");
        return makeUnexpected(SessionError::InvalidOperation);
    }
    if (findByName(trimmed)) {
        PARLEY_WARN("Speaker '{}' already exists", trimmed.toStdString());
        return makeUnexpected(SessionError::DuplicateSpeaker);
    }

    QString resolvedColor;
    if (color.isEmpty()) {
        resolvedColor = palette().at(paletteIndex_ % palette().size());
        ++paletteIndex_;
    } else {
        auto normalized = normalizeColor(color);
        if (!normalized) {
            PARLEY_WARN("Invalid speaker color '{}'", color.toStdString());
            return makeUnexpected(SessionError::InvalidColor);
        }
        resolvedColor = *normalized;
    }

    Speaker speaker;
    speaker.id = nextId_++;
    speaker.name = trimmed;
    speaker.color = resolvedColor;
    speakers_.push_back(speaker);

    PARLEY_INFO("Added speaker {} '{}' ({})", speaker.id, trimmed.toStdString(), resolvedColor.toStdString());
    return speaker.id;
}

Expected<void, SessionError> SpeakerRegistry::renameSpeaker(SpeakerId id, const QString& newName) {
    Speaker* target = mutableSpeaker(id);
    if (!target) {
        return makeUnexpected(SessionError::NotFound);
    }

    const QString trimmed = newName.trimmed();
    if (trimmed.isEmpty()) {
        return makeUnexpected(SessionError::InvalidOperation);
    }
    if (trimmed == target->name) {
        return {};
    }
    if (findByName(trimmed)) {
        PARLEY_WARN("Cannot rename '{}': '{}' already exists",
                    target->name.toStdString(), trimmed.toStdString());
        return makeUnexpected(SessionError::DuplicateSpeaker);
    }

    PARLEY_INFO("Renamed speaker '{}' to '{}'", target->name.toStdString(), trimmed.toStdString());
    target->name = trimmed;
    return {};
}

Expected<void, SessionError> SpeakerRegistry::setSpeakerColor(SpeakerId id, const QString& color) {
    Speaker* target = mutableSpeaker(id);
    if (!target) {
        return makeUnexpected(SessionError::NotFound);
    }
    auto normalized = normalizeColor(color);
    if (!normalized) {
        PARLEY_WARN("Invalid speaker color '{}'", color.toStdString());
        return makeUnexpected(SessionError::InvalidColor);
    }
    target->color = *normalized;
    return {};
}

Expected<void, SessionError> SpeakerRegistry::activateSpeaker(SpeakerId id) {
    if (speakers_.empty()) {
        PARLEY_WARN("Speaker switch with no speakers defined");
        return makeUnexpected(SessionError::InvalidOperation);
    }
    if (!contains(id)) {
        return makeUnexpected(SessionError::NotFound);
    }
    activeSpeakerId_ = id;
    return {};
}

const Speaker* SpeakerRegistry::speaker(SpeakerId id) const {
    auto it = std::find_if(speakers_.begin(), speakers_.end(),
                           [id](const Speaker& s) { return s.id == id; });
    return it != speakers_.end() ? &*it : nullptr;
}

const Speaker* SpeakerRegistry::findByName(const QString& name) const {
    auto it = std::find_if(speakers_.begin(), speakers_.end(),
                           [&name](const Speaker& s) { return s.name == name; });
    return it != speakers_.end() ? &*it : nullptr;
}

Speaker* SpeakerRegistry::mutableSpeaker(SpeakerId id) {
    auto it = std::find_if(speakers_.begin(), speakers_.end(),
                           [id](const Speaker& s) { return s.id == id; });
    return it != speakers_.end() ? &*it : nullptr;
}

} // namespace Parley
