/**
 * @file MotionProfile.cpp
 * @brief Phase length computation for point-to-point moves
 */

#include "MotionProfile.hpp"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <cmath>

static const char *TAG = "MotionProfile";

static const char* phase_names[] = {
    "ACCELERATING",
    "CRUISING",
    "DECELERATING",
    "COMPLETE"
};

const char* motion_phase_name(MotionPhase phase) {
    return phase_names[static_cast<uint8_t>(phase)];
}

static inline bool is_positive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

esp_err_t MotionProfile::plan(int64_t delta_steps,
                              float cap_velocity,
                              float accel_rate,
                              float decel_rate,
                              MotionProfile* out) {
    if (out == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (!is_positive(accel_rate) || !is_positive(decel_rate) || !is_positive(cap_velocity)) {
        ESP_LOGE(TAG, "Invalid rates: v=%.3f a=%.3f d=%.3f", cap_velocity, accel_rate, decel_rate);
        return STEPPER_ERR_INVALID_PROFILE;
    }

    MotionProfile profile;
    profile.accel_rate_ = accel_rate;
    profile.decel_rate_ = decel_rate;

    if (delta_steps == 0) {
        *out = profile;
        return ESP_OK;
    }

    if (delta_steps > static_cast<int64_t>(UINT32_MAX) || delta_steps < -static_cast<int64_t>(UINT32_MAX)) {
        ESP_LOGE(TAG, "Move of %lld steps exceeds the plannable range", (long long)delta_steps);
        return STEPPER_ERR_INVALID_PROFILE;
    }

    const uint32_t n = static_cast<uint32_t>(delta_steps < 0 ? -delta_steps : delta_steps);
    const double v = cap_velocity;
    const double a = accel_rate;
    const double d = decel_rate;

    const double accel_distance = (v * v) / (2.0 * a);
    const double decel_distance = (v * v) / (2.0 * d);

    uint32_t accel_steps;
    uint32_t decel_steps;
    uint32_t cruise_steps;
    double peak;

    if (accel_distance + decel_distance <= static_cast<double>(n)) {
        // Trapezoid: both ramps fit, cruise fills the rest
        accel_steps = static_cast<uint32_t>(std::llround(accel_distance));
        decel_steps = static_cast<uint32_t>(std::llround(decel_distance));
        if (static_cast<uint64_t>(accel_steps) + decel_steps > n) {
            decel_steps = n - accel_steps;
        }
        cruise_steps = n - accel_steps - decel_steps;
        peak = v;
    } else {
        // Triangle: peak where both ramps meet exactly at n
        peak = std::sqrt((2.0 * n * a * d) / (a + d));
        const double ramp = (peak * peak) / (2.0 * a);
        accel_steps = static_cast<uint32_t>(std::llround(ramp));
        if (accel_steps > n) {
            accel_steps = n;
        }
        decel_steps = n - accel_steps;
        cruise_steps = 0;
        profile.triangular_ = true;
    }

    profile.total_steps_ = delta_steps;
    profile.accel_steps_ = accel_steps;
    profile.cruise_steps_ = cruise_steps;
    profile.decel_steps_ = decel_steps;
    profile.peak_velocity_ = static_cast<float>(peak);

    ESP_LOGD(TAG, "%s: %lld steps = %lu accel + %lu cruise + %lu decel, peak %.1f steps/s",
             profile.triangular_ ? "Triangle" : "Trapezoid",
             (long long)delta_steps,
             (unsigned long)accel_steps, (unsigned long)cruise_steps, (unsigned long)decel_steps,
             peak);

    *out = profile;
    return ESP_OK;
}

MotionPhase MotionProfile::phaseAt(uint64_t index) const {
    if (index >= stepCount()) {
        return MotionPhase::Complete;
    }
    if (index < accel_steps_) {
        return MotionPhase::Accelerating;
    }
    if (index < static_cast<uint64_t>(accel_steps_) + cruise_steps_) {
        return MotionPhase::Cruising;
    }
    return MotionPhase::Decelerating;
}

float MotionProfile::estimatedDurationSec() const {
    if (isZero() || peak_velocity_ <= 0.0f) {
        return 0.0f;
    }
    const float accel_time = peak_velocity_ / accel_rate_;
    const float decel_time = peak_velocity_ / decel_rate_;
    const float cruise_time = static_cast<float>(cruise_steps_) / peak_velocity_;
    return accel_time + cruise_time + decel_time;
}
