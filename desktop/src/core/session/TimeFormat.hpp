#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>

#include "../transcription/TranscriptionTypes.hpp"

namespace Parley {
namespace TimeFormat {

// "HH:mm:ss.zzz" in local time, independent of the user's locale
QString clock(qint64 epochMs);

// "HH:mm:ss.zzz-HH:mm:ss.zzz"
QString range(const TimeRange& range);

// ISO-8601 local time with milliseconds and UTC offset
QString isoTimestamp(qint64 epochMs);

} // namespace TimeFormat
} // namespace Parley
