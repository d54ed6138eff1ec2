#pragma once

#include <QtCore/QtGlobal>
#include <vector>

namespace Parley {

/**
 * @brief Pause-based utterance segmentation over a 16 kHz sample stream
 *
 * A frame is silent when its mean absolute amplitude (normalized to
 * [0, 1]) is below the silence threshold. Leading silence is discarded.
 * Once voice is heard every frame is kept until either the trailing
 * silence reaches the pause threshold or the utterance hits its maximum
 * length.
 */
class UtteranceEndpointer {
public:
    struct Settings {
        int sampleRate = 16000;
        double pauseThresholdSec = 1.0;
        double silenceThreshold = 0.01;
        double maxUtteranceSec = 30.0;
    };

    enum class Decision {
        Idle,       // no utterance in progress
        Continue,   // utterance in progress
        End         // utterance complete, call takeUtterance()
    };

    UtteranceEndpointer();
    explicit UtteranceEndpointer(const Settings& settings);

    Decision feed(const std::vector<qint16>& samples);

    bool inUtterance() const { return !utterance_.empty(); }

    // Audio of the current utterance as floats in [-1, 1]
    std::vector<float> utteranceAudio() const;

    // Returns the utterance audio and starts listening for the next one
    std::vector<float> takeUtterance();

    qint64 samplesConsumed() const { return samplesConsumed_; }
    qint64 utteranceSamples() const { return static_cast<qint64>(utterance_.size()); }

    // Stream offset in seconds after the last fed frame
    double elapsedSeconds() const;

    void reset();

    static double meanAmplitude(const std::vector<qint16>& samples);

private:
    Settings settings_;
    std::vector<qint16> utterance_;
    qint64 trailingSilence_ = 0;
    qint64 samplesConsumed_ = 0;
};

} // namespace Parley
