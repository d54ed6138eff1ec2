#include "TimestampMapper.hpp"

namespace Parley {

bool TimestampMapper::anchor(qint64 wallClockMs) {
    if (anchored_) {
        return false;
    }
    anchorMs_ = wallClockMs;
    anchored_ = true;
    return true;
}

void TimestampMapper::reset() {
    anchorMs_ = 0;
    anchored_ = false;
}

qint64 TimestampMapper::toAbsolute(double relativeSeconds) const {
    return anchorMs_ + qRound64(relativeSeconds * 1000.0);
}

double TimestampMapper::toRelative(qint64 wallClockMs) const {
    return static_cast<double>(wallClockMs - anchorMs_) / 1000.0;
}

} // namespace Parley
