/**
 * @file motion_config.h
 * @brief Validated configuration records for motors and trajectories
 *
 * Records are produced by the application (or an external loader) and
 * consumed by MechanicalConstraints and StepperMotor. All physical values
 * are in degrees of output shaft rotation.
 */

#ifndef MOTION_CONFIG_H
#define MOTION_CONFIG_H

#include <stdint.h>
#include <stdbool.h>
#include "esp_err.h"

#ifdef __cplusplus
extern "C" {
#endif

#define MOTION_CONFIG_MAX_MICROSTEPS     256
#define MOTION_CONFIG_MIN_PERCENT        1
#define MOTION_CONFIG_MAX_PERCENT        200
#define MOTION_CONFIG_MAX_WAYPOINTS      32

/**
 * @brief What to do with a move target outside the soft limits
 */
typedef enum {
    LIMIT_POLICY_REJECT = 0,    // Refuse the move
    LIMIT_POLICY_CLAMP,         // Move to the nearest bound instead
} limit_policy_t;

/**
 * @brief Soft limits in degrees
 */
typedef struct {
    float min_degrees;
    float max_degrees;
    limit_policy_t policy;
} soft_limits_t;

/**
 * @brief Per-motor configuration record
 */
typedef struct {
    const char* name;
    uint16_t steps_per_revolution;          // Full steps per motor revolution (200 for 1.8 deg)
    uint16_t microsteps;                    // Power of two, 1..256
    float gear_ratio;                       // Output reduction, 5.0 means 5:1
    float max_velocity_deg_per_sec;
    float max_acceleration_deg_per_sec2;
    bool invert_direction;
    bool has_limits;
    soft_limits_t limits;
    float backlash_compensation_deg;        // 0 disables compensation
} motor_config_t;

/**
 * @brief Per-trajectory configuration record
 *
 * Absolute rates take precedence over percentages. Deceleration falls back
 * to the absolute acceleration, then to the acceleration percentage.
 */
typedef struct {
    const char* motor;
    float target_degrees;
    uint8_t velocity_percent;
    bool has_velocity;
    float velocity_deg_per_sec;
    uint8_t acceleration_percent;
    bool has_acceleration;
    float acceleration_deg_per_sec2;
    bool has_deceleration;
    float deceleration_deg_per_sec2;
    uint32_t dwell_ms;
} trajectory_config_t;

/**
 * @brief Ordered list of absolute targets played back on one motor
 */
typedef struct {
    const char* motor;
    float waypoints_degrees[MOTION_CONFIG_MAX_WAYPOINTS];
    uint8_t waypoint_count;
    uint32_t dwell_ms;                      // Pause after each waypoint
    uint8_t velocity_percent;               // Applies to every leg
} waypoint_trajectory_t;

/**
 * @brief Configuration field that failed validation
 */
typedef enum {
    CONFIG_FIELD_NONE = 0,
    CONFIG_FIELD_STEPS_PER_REVOLUTION,
    CONFIG_FIELD_MICROSTEPS,
    CONFIG_FIELD_GEAR_RATIO,
    CONFIG_FIELD_MAX_VELOCITY,
    CONFIG_FIELD_MAX_ACCELERATION,
    CONFIG_FIELD_LIMITS,
    CONFIG_FIELD_BACKLASH,
    CONFIG_FIELD_MOTOR_NAME,
    CONFIG_FIELD_TARGET,
    CONFIG_FIELD_VELOCITY_PERCENT,
    CONFIG_FIELD_VELOCITY,
    CONFIG_FIELD_ACCELERATION_PERCENT,
    CONFIG_FIELD_ACCELERATION,
    CONFIG_FIELD_DECELERATION,
    CONFIG_FIELD_WAYPOINTS,
    CONFIG_FIELD_COUNT
} config_field_t;

/**
 * @brief Motor record with defaults: 200 full steps, no microstepping,
 *        1:1 gearing, 360 deg/s, 720 deg/s^2, no limits, no backlash
 */
motor_config_t motion_config_default_motor(void);

/**
 * @brief Trajectory record with defaults: 100% velocity and acceleration,
 *        no absolute rates, no dwell
 */
trajectory_config_t motion_config_default_trajectory(void);

/**
 * @brief Waypoint trajectory with no waypoints, 100% velocity, no dwell
 */
waypoint_trajectory_t motion_config_default_sequence(void);

/**
 * @brief Append a waypoint
 *
 * @return ESP_OK, ESP_ERR_INVALID_ARG for a non-finite position,
 *         ESP_ERR_NO_MEM when MOTION_CONFIG_MAX_WAYPOINTS are already set
 */
esp_err_t motion_config_sequence_add_waypoint(waypoint_trajectory_t* sequence, float degrees);

/**
 * @brief Check that microsteps is a power of two in [1, 256]
 */
bool motion_config_is_valid_microsteps(uint16_t microsteps);

/**
 * @brief Validate a motor record
 *
 * @param config Record to check
 * @param bad_field Receives the offending field on failure (may be NULL)
 * @return ESP_OK, or STEPPER_ERR_CONFIG
 */
esp_err_t motion_config_validate_motor(const motor_config_t* config, config_field_t* bad_field);

/**
 * @brief Validate a trajectory record against the motor it drives
 *
 * Checks percentages (1-200), absolute rates (> 0), the motor name and,
 * for Reject limits, that the target lies inside the limits.
 *
 * @return ESP_OK, STEPPER_ERR_CONFIG, or STEPPER_ERR_LIMIT_EXCEEDED
 */
esp_err_t motion_config_validate_trajectory(const trajectory_config_t* trajectory,
                                            const motor_config_t* motor,
                                            config_field_t* bad_field);

/**
 * @brief Validate a waypoint trajectory against the motor it drives
 *
 * At least one waypoint is required. Under Reject limits every waypoint
 * must lie inside the limits.
 *
 * @return ESP_OK, STEPPER_ERR_CONFIG, or STEPPER_ERR_LIMIT_EXCEEDED
 */
esp_err_t motion_config_validate_sequence(const waypoint_trajectory_t* sequence,
                                          const motor_config_t* motor,
                                          config_field_t* bad_field);

/**
 * @brief Printable name of a configuration field
 */
const char* motion_config_field_name(config_field_t field);

#ifdef __cplusplus
}
#endif

#endif // MOTION_CONFIG_H
