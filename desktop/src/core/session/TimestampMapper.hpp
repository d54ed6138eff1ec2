#pragma once

#include <QtCore/QtGlobal>

namespace Parley {

/**
 * @brief Maps recognizer offsets (seconds since stream start) to wall clock
 *
 * The anchor is the wall-clock time of the first audio frame of a run and
 * is set once; later anchor() calls are ignored until reset(). No drift
 * correction is applied.
 */
class TimestampMapper {
public:
    // Returns false if already anchored for this run
    bool anchor(qint64 wallClockMs);
    void reset();

    bool isAnchored() const { return anchored_; }
    qint64 anchorMs() const { return anchorMs_; }

    qint64 toAbsolute(double relativeSeconds) const;
    double toRelative(qint64 wallClockMs) const;

private:
    qint64 anchorMs_ = 0;
    bool anchored_ = false;
};

} // namespace Parley
