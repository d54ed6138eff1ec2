#include "TimeFormat.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QLocale>

namespace Parley {
namespace TimeFormat {

QString clock(qint64 epochMs) {
    const QDateTime local = QDateTime::fromMSecsSinceEpoch(epochMs);
    return QLocale::c().toString(local.time(), QStringLiteral("HH:mm:ss.zzz"));
}

QString range(const TimeRange& range) {
    return clock(range.startMs) + '-' + clock(range.endMs);
}

QString isoTimestamp(qint64 epochMs) {
    const QDateTime local = QDateTime::fromMSecsSinceEpoch(epochMs);
    return local.toOffsetFromUtc(local.offsetFromUtc()).toString(Qt::ISODateWithMs);
}

} // namespace TimeFormat
} // namespace Parley
