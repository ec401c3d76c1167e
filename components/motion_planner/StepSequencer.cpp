/**
 * @file StepSequencer.cpp
 * @brief Per-step interval computation
 *
 * Acceleration step k (1-based) ends at v = sqrt(2 * a * k), deceleration
 * mirrors this with r = steps left including the current one. Both are
 * capped at the profile's peak velocity.
 */

#include "StepSequencer.hpp"
#include "MechanicalConstraints.hpp"
#include "esp_log.h"
#include <algorithm>
#include <cmath>

static const char *TAG = "StepSequencer";

StepSequencer::StepSequencer(const MotionProfile& profile) :
    profile_(profile),
    total_(profile.stepCount()),
    emitted_(0),
    cruise_interval_ns_(intervalForVelocity(profile.peakVelocity()))
{
}

uint32_t StepSequencer::intervalForVelocity(double steps_per_sec) {
    return MechanicalConstraints::velocityToIntervalNs(steps_per_sec);
}

uint32_t StepSequencer::intervalAt(uint64_t index) const {
    const double peak = profile_.peakVelocity();

    switch (profile_.phaseAt(index)) {
        case MotionPhase::Accelerating: {
            const double k = static_cast<double>(index + 1);
            const double v = std::sqrt(2.0 * profile_.accelRate() * k);
            return intervalForVelocity(std::min(v, peak));
        }
        case MotionPhase::Cruising:
            return cruise_interval_ns_;
        case MotionPhase::Decelerating: {
            const double r = static_cast<double>(total_ - index);
            const double v = std::sqrt(2.0 * profile_.decelRate() * r);
            return intervalForVelocity(std::min(v, peak));
        }
        case MotionPhase::Complete:
        default:
            return UINT32_MAX;
    }
}

bool StepSequencer::next(StepTiming* item) {
    if (isComplete()) {
        ESP_LOGW(TAG, "next() called on an exhausted sequence");
        return false;
    }
    if (item) {
        item->direction = profile_.direction();
        item->interval_ns = intervalAt(emitted_);
    }
    emitted_++;
    return true;
}

float StepSequencer::progress() const {
    if (total_ == 0) {
        return 1.0f;
    }
    return static_cast<float>(static_cast<double>(emitted_) / static_cast<double>(total_));
}

uint32_t StepSequencer::startIntervalNs() const {
    const double v = std::sqrt(2.0 * profile_.accelRate());
    const double peak = profile_.peakVelocity();
    return intervalForVelocity(peak > 0.0 ? std::min(v, peak) : v);
}
