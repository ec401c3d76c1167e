/**
 * @file motion_config.cpp
 * @brief Defaults and validation for motor and trajectory records
 */

#include "motion_config.h"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <string.h>
#include <cmath>

static const char *TAG = "MOTION_CONFIG";

static const char* field_names[] = {
    "none",
    "steps_per_revolution",
    "microsteps",
    "gear_ratio",
    "max_velocity_deg_per_sec",
    "max_acceleration_deg_per_sec2",
    "limits",
    "backlash_compensation_deg",
    "motor",
    "target_degrees",
    "velocity_percent",
    "velocity_deg_per_sec",
    "acceleration_percent",
    "acceleration_deg_per_sec2",
    "deceleration_deg_per_sec2",
    "waypoints",
};

static inline bool is_positive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

static inline bool is_valid_percent(uint8_t percent) {
    return percent >= MOTION_CONFIG_MIN_PERCENT && percent <= MOTION_CONFIG_MAX_PERCENT;
}

static esp_err_t fail(config_field_t field, config_field_t* bad_field) {
    if (bad_field) {
        *bad_field = field;
    }
    ESP_LOGE(TAG, "Invalid configuration field: %s", motion_config_field_name(field));
    return STEPPER_ERR_CONFIG;
}

motor_config_t motion_config_default_motor(void) {
    motor_config_t config = {
        .name = "motor",
        .steps_per_revolution = 200,
        .microsteps = 1,
        .gear_ratio = 1.0f,
        .max_velocity_deg_per_sec = 360.0f,
        .max_acceleration_deg_per_sec2 = 720.0f,
        .invert_direction = false,
        .has_limits = false,
        .limits = {
            .min_degrees = 0.0f,
            .max_degrees = 0.0f,
            .policy = LIMIT_POLICY_REJECT
        },
        .backlash_compensation_deg = 0.0f
    };
    return config;
}

trajectory_config_t motion_config_default_trajectory(void) {
    trajectory_config_t config = {
        .motor = nullptr,
        .target_degrees = 0.0f,
        .velocity_percent = 100,
        .has_velocity = false,
        .velocity_deg_per_sec = 0.0f,
        .acceleration_percent = 100,
        .has_acceleration = false,
        .acceleration_deg_per_sec2 = 0.0f,
        .has_deceleration = false,
        .deceleration_deg_per_sec2 = 0.0f,
        .dwell_ms = 0
    };
    return config;
}

waypoint_trajectory_t motion_config_default_sequence(void) {
    waypoint_trajectory_t sequence = {
        .motor = nullptr,
        .waypoints_degrees = {},
        .waypoint_count = 0,
        .dwell_ms = 0,
        .velocity_percent = 100
    };
    return sequence;
}

esp_err_t motion_config_sequence_add_waypoint(waypoint_trajectory_t* sequence, float degrees) {
    if (sequence == nullptr || !std::isfinite(degrees)) {
        return ESP_ERR_INVALID_ARG;
    }
    if (sequence->waypoint_count >= MOTION_CONFIG_MAX_WAYPOINTS) {
        ESP_LOGW(TAG, "Waypoint %.2f deg dropped, sequence full", degrees);
        return ESP_ERR_NO_MEM;
    }
    sequence->waypoints_degrees[sequence->waypoint_count++] = degrees;
    return ESP_OK;
}

bool motion_config_is_valid_microsteps(uint16_t microsteps) {
    if (microsteps == 0 || microsteps > MOTION_CONFIG_MAX_MICROSTEPS) {
        return false;
    }
    return (microsteps & (microsteps - 1)) == 0;
}

esp_err_t motion_config_validate_motor(const motor_config_t* config, config_field_t* bad_field) {
    if (config == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (config->steps_per_revolution == 0) {
        return fail(CONFIG_FIELD_STEPS_PER_REVOLUTION, bad_field);
    }
    if (!motion_config_is_valid_microsteps(config->microsteps)) {
        return fail(CONFIG_FIELD_MICROSTEPS, bad_field);
    }
    if (!is_positive(config->gear_ratio)) {
        return fail(CONFIG_FIELD_GEAR_RATIO, bad_field);
    }
    if (!is_positive(config->max_velocity_deg_per_sec)) {
        return fail(CONFIG_FIELD_MAX_VELOCITY, bad_field);
    }
    if (!is_positive(config->max_acceleration_deg_per_sec2)) {
        return fail(CONFIG_FIELD_MAX_ACCELERATION, bad_field);
    }
    if (config->has_limits) {
        const soft_limits_t& limits = config->limits;
        if (!std::isfinite(limits.min_degrees) || !std::isfinite(limits.max_degrees) ||
            limits.min_degrees >= limits.max_degrees) {
            return fail(CONFIG_FIELD_LIMITS, bad_field);
        }
    }
    if (!std::isfinite(config->backlash_compensation_deg) || config->backlash_compensation_deg < 0.0f) {
        return fail(CONFIG_FIELD_BACKLASH, bad_field);
    }

    if (bad_field) {
        *bad_field = CONFIG_FIELD_NONE;
    }
    return ESP_OK;
}

esp_err_t motion_config_validate_trajectory(const trajectory_config_t* trajectory,
                                            const motor_config_t* motor,
                                            config_field_t* bad_field) {
    if (trajectory == nullptr || motor == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (trajectory->motor == nullptr || motor->name == nullptr ||
        strcmp(trajectory->motor, motor->name) != 0) {
        return fail(CONFIG_FIELD_MOTOR_NAME, bad_field);
    }
    if (!std::isfinite(trajectory->target_degrees)) {
        return fail(CONFIG_FIELD_TARGET, bad_field);
    }
    if (!is_valid_percent(trajectory->velocity_percent)) {
        return fail(CONFIG_FIELD_VELOCITY_PERCENT, bad_field);
    }
    if (trajectory->has_velocity && !is_positive(trajectory->velocity_deg_per_sec)) {
        return fail(CONFIG_FIELD_VELOCITY, bad_field);
    }
    if (!is_valid_percent(trajectory->acceleration_percent)) {
        return fail(CONFIG_FIELD_ACCELERATION_PERCENT, bad_field);
    }
    if (trajectory->has_acceleration && !is_positive(trajectory->acceleration_deg_per_sec2)) {
        return fail(CONFIG_FIELD_ACCELERATION, bad_field);
    }
    if (trajectory->has_deceleration && !is_positive(trajectory->deceleration_deg_per_sec2)) {
        return fail(CONFIG_FIELD_DECELERATION, bad_field);
    }

    // Clamp-policy targets are legal, they are pulled to the bound at move time
    if (motor->has_limits && motor->limits.policy == LIMIT_POLICY_REJECT) {
        if (trajectory->target_degrees < motor->limits.min_degrees ||
            trajectory->target_degrees > motor->limits.max_degrees) {
            if (bad_field) {
                *bad_field = CONFIG_FIELD_TARGET;
            }
            ESP_LOGE(TAG, "Target %.2f deg outside limits [%.2f, %.2f]",
                     trajectory->target_degrees,
                     motor->limits.min_degrees, motor->limits.max_degrees);
            return STEPPER_ERR_LIMIT_EXCEEDED;
        }
    }

    if (bad_field) {
        *bad_field = CONFIG_FIELD_NONE;
    }
    return ESP_OK;
}

esp_err_t motion_config_validate_sequence(const waypoint_trajectory_t* sequence,
                                          const motor_config_t* motor,
                                          config_field_t* bad_field) {
    if (sequence == nullptr || motor == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (sequence->motor == nullptr || motor->name == nullptr ||
        strcmp(sequence->motor, motor->name) != 0) {
        return fail(CONFIG_FIELD_MOTOR_NAME, bad_field);
    }
    if (sequence->waypoint_count == 0 || sequence->waypoint_count > MOTION_CONFIG_MAX_WAYPOINTS) {
        return fail(CONFIG_FIELD_WAYPOINTS, bad_field);
    }
    for (uint8_t i = 0; i < sequence->waypoint_count; i++) {
        if (!std::isfinite(sequence->waypoints_degrees[i])) {
            return fail(CONFIG_FIELD_WAYPOINTS, bad_field);
        }
    }
    if (!is_valid_percent(sequence->velocity_percent)) {
        return fail(CONFIG_FIELD_VELOCITY_PERCENT, bad_field);
    }

    if (motor->has_limits && motor->limits.policy == LIMIT_POLICY_REJECT) {
        for (uint8_t i = 0; i < sequence->waypoint_count; i++) {
            const float target = sequence->waypoints_degrees[i];
            if (target < motor->limits.min_degrees || target > motor->limits.max_degrees) {
                if (bad_field) {
                    *bad_field = CONFIG_FIELD_WAYPOINTS;
                }
                ESP_LOGE(TAG, "Waypoint %u at %.2f deg outside limits [%.2f, %.2f]",
                         (unsigned)i, target, motor->limits.min_degrees, motor->limits.max_degrees);
                return STEPPER_ERR_LIMIT_EXCEEDED;
            }
        }
    }

    if (bad_field) {
        *bad_field = CONFIG_FIELD_NONE;
    }
    return ESP_OK;
}

const char* motion_config_field_name(config_field_t field) {
    if (field < CONFIG_FIELD_NONE || field >= CONFIG_FIELD_COUNT) {
        return "unknown";
    }
    return field_names[field];
}
