/**
 * @file MechanicalConstraints.cpp
 * @brief Derivation of step-domain constants and trajectory rates
 */

#include "MechanicalConstraints.hpp"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <algorithm>
#include <cmath>

static const char *TAG = "Constraints";

static constexpr double NS_PER_SEC = 1e9;

static esp_err_t reject(config_field_t field, config_field_t* bad_field) {
    if (bad_field) {
        *bad_field = field;
    }
    ESP_LOGE(TAG, "Cannot derive constraints, invalid %s", motion_config_field_name(field));
    return STEPPER_ERR_CONFIG;
}

static inline bool is_positive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

esp_err_t MechanicalConstraints::derive(uint16_t base_steps_per_rev,
                                        uint16_t microsteps,
                                        float gear_ratio,
                                        float max_velocity_deg_per_sec,
                                        float max_acceleration_deg_per_sec2,
                                        const soft_limits_t* limits,
                                        MechanicalConstraints* out,
                                        config_field_t* bad_field) {
    if (out == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (base_steps_per_rev == 0) {
        return reject(CONFIG_FIELD_STEPS_PER_REVOLUTION, bad_field);
    }
    if (!motion_config_is_valid_microsteps(microsteps)) {
        return reject(CONFIG_FIELD_MICROSTEPS, bad_field);
    }
    if (!is_positive(gear_ratio)) {
        return reject(CONFIG_FIELD_GEAR_RATIO, bad_field);
    }
    if (!is_positive(max_velocity_deg_per_sec)) {
        return reject(CONFIG_FIELD_MAX_VELOCITY, bad_field);
    }
    if (!is_positive(max_acceleration_deg_per_sec2)) {
        return reject(CONFIG_FIELD_MAX_ACCELERATION, bad_field);
    }

    const double total = std::round(static_cast<double>(base_steps_per_rev) * microsteps * gear_ratio);
    if (total < 1.0 || total > static_cast<double>(UINT32_MAX)) {
        return reject(CONFIG_FIELD_GEAR_RATIO, bad_field);
    }

    MechanicalConstraints result;
    result.steps_per_revolution = static_cast<uint32_t>(total);
    result.steps_per_degree = static_cast<float>(total / 360.0);
    result.max_velocity_steps_per_sec = max_velocity_deg_per_sec * result.steps_per_degree;
    result.max_acceleration_steps_per_sec2 = max_acceleration_deg_per_sec2 * result.steps_per_degree;
    result.min_step_interval_ns = velocityToIntervalNs(result.max_velocity_steps_per_sec);
    result.max_velocity_deg_per_sec = max_velocity_deg_per_sec;
    result.max_acceleration_deg_per_sec2 = max_acceleration_deg_per_sec2;

    if (limits != nullptr) {
        if (!std::isfinite(limits->min_degrees) || !std::isfinite(limits->max_degrees)) {
            return reject(CONFIG_FIELD_LIMITS, bad_field);
        }
        result.has_limits = true;
        result.limits.min_steps = result.degreesToSteps(limits->min_degrees);
        result.limits.max_steps = result.degreesToSteps(limits->max_degrees);
        result.limits.policy = limits->policy;
        if (result.limits.min_steps >= result.limits.max_steps) {
            return reject(CONFIG_FIELD_LIMITS, bad_field);
        }
    }

    ESP_LOGD(TAG, "%lu steps/rev, %.4f steps/deg, vmax %.1f steps/s, amax %.1f steps/s^2, min interval %lu ns",
             (unsigned long)result.steps_per_revolution, result.steps_per_degree,
             result.max_velocity_steps_per_sec, result.max_acceleration_steps_per_sec2,
             (unsigned long)result.min_step_interval_ns);

    *out = result;
    if (bad_field) {
        *bad_field = CONFIG_FIELD_NONE;
    }
    return ESP_OK;
}

esp_err_t MechanicalConstraints::fromConfig(const motor_config_t& config,
                                            MechanicalConstraints* out,
                                            config_field_t* bad_field) {
    return derive(config.steps_per_revolution,
                  config.microsteps,
                  config.gear_ratio,
                  config.max_velocity_deg_per_sec,
                  config.max_acceleration_deg_per_sec2,
                  config.has_limits ? &config.limits : nullptr,
                  out,
                  bad_field);
}

int64_t MechanicalConstraints::degreesToSteps(float degrees) const {
    return static_cast<int64_t>(std::llround(static_cast<double>(degrees) * steps_per_degree));
}

float MechanicalConstraints::stepsToDegrees(int64_t steps) const {
    return static_cast<float>(static_cast<double>(steps) / steps_per_degree);
}

uint32_t MechanicalConstraints::velocityToIntervalNs(double steps_per_sec) {
    if (!(steps_per_sec > 0.0)) {
        return UINT32_MAX;
    }
    const double interval = std::round(NS_PER_SEC / steps_per_sec);
    if (interval >= static_cast<double>(UINT32_MAX)) {
        return UINT32_MAX;
    }
    return interval < 1.0 ? 1 : static_cast<uint32_t>(interval);
}

MoveRates MechanicalConstraints::maxRates() const {
    MoveRates rates;
    rates.velocity = max_velocity_steps_per_sec;
    rates.acceleration = max_acceleration_steps_per_sec2;
    rates.deceleration = max_acceleration_steps_per_sec2;
    return rates;
}

MoveRates MechanicalConstraints::trajectoryRates(const trajectory_config_t& trajectory) const {
    const float velocity_deg = trajectory.has_velocity
        ? trajectory.velocity_deg_per_sec
        : max_velocity_deg_per_sec * (trajectory.velocity_percent / 100.0f);

    const float percent_accel_deg = max_acceleration_deg_per_sec2 * (trajectory.acceleration_percent / 100.0f);

    const float accel_deg = trajectory.has_acceleration
        ? trajectory.acceleration_deg_per_sec2
        : percent_accel_deg;

    float decel_deg = percent_accel_deg;
    if (trajectory.has_deceleration) {
        decel_deg = trajectory.deceleration_deg_per_sec2;
    } else if (trajectory.has_acceleration) {
        decel_deg = trajectory.acceleration_deg_per_sec2;
    }

    MoveRates rates;
    rates.velocity = velocity_deg * steps_per_degree;
    rates.acceleration = accel_deg * steps_per_degree;
    rates.deceleration = decel_deg * steps_per_degree;
    return clampRates(rates);
}

MoveRates MechanicalConstraints::clampRates(const MoveRates& rates) const {
    MoveRates clamped;
    clamped.velocity = std::min(rates.velocity, max_velocity_steps_per_sec);
    clamped.acceleration = std::min(rates.acceleration, max_acceleration_steps_per_sec2);
    clamped.deceleration = std::min(rates.deceleration, max_acceleration_steps_per_sec2);
    return clamped;
}
