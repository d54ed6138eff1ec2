#include "UtteranceEndpointer.hpp"

#include <cmath>
#include <cstdlib>

namespace Parley {

UtteranceEndpointer::UtteranceEndpointer()
    : UtteranceEndpointer(Settings{}) {
}

UtteranceEndpointer::UtteranceEndpointer(const Settings& settings)
    : settings_(settings) {
    if (settings_.sampleRate <= 0) {
        settings_.sampleRate = 16000;
    }
}

double UtteranceEndpointer::meanAmplitude(const std::vector<qint16>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (qint16 sample : samples) {
        sum += std::abs(static_cast<int>(sample));
    }
    return sum / static_cast<double>(samples.size()) / 32768.0;
}

UtteranceEndpointer::Decision UtteranceEndpointer::feed(const std::vector<qint16>& samples) {
    samplesConsumed_ += static_cast<qint64>(samples.size());

    const bool silent = meanAmplitude(samples) < settings_.silenceThreshold;

    if (utterance_.empty()) {
        if (silent || samples.empty()) {
            return Decision::Idle;
        }
        trailingSilence_ = 0;
    }

    utterance_.insert(utterance_.end(), samples.begin(), samples.end());
    trailingSilence_ = silent ? trailingSilence_ + static_cast<qint64>(samples.size()) : 0;

    const auto pauseSamples = static_cast<qint64>(std::llround(settings_.pauseThresholdSec * settings_.sampleRate));
    const auto maxSamples = static_cast<qint64>(std::llround(settings_.maxUtteranceSec * settings_.sampleRate));

    if (trailingSilence_ >= pauseSamples) {
        return Decision::End;
    }
    if (maxSamples > 0 && static_cast<qint64>(utterance_.size()) >= maxSamples) {
        return Decision::End;
    }
    return Decision::Continue;
}

std::vector<float> UtteranceEndpointer::utteranceAudio() const {
    std::vector<float> audio;
    audio.reserve(utterance_.size());
    for (qint16 sample : utterance_) {
        audio.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return audio;
}

std::vector<float> UtteranceEndpointer::takeUtterance() {
    std::vector<float> audio = utteranceAudio();
    utterance_.clear();
    trailingSilence_ = 0;
    return audio;
}

double UtteranceEndpointer::elapsedSeconds() const {
    return static_cast<double>(samplesConsumed_) / settings_.sampleRate;
}

void UtteranceEndpointer::reset() {
    utterance_.clear();
    trailingSilence_ = 0;
    samplesConsumed_ = 0;
}

} // namespace Parley
