/**
 * @file MechanicalConstraints.hpp
 * @brief Step-domain constants derived from physical motor parameters
 *
 * Converts a motor's degree-based configuration into the step domain once,
 * at construction time. The result never changes for the motor's lifetime.
 */

#ifndef MECHANICAL_CONSTRAINTS_HPP
#define MECHANICAL_CONSTRAINTS_HPP

#include "motion_config.h"
#include "esp_err.h"
#include <cstdint>

/**
 * @brief Soft limits converted to steps
 */
struct StepLimits {
    int64_t min_steps = 0;
    int64_t max_steps = 0;
    limit_policy_t policy = LIMIT_POLICY_REJECT;

    bool contains(int64_t steps) const { return steps >= min_steps && steps <= max_steps; }

    /**
     * @brief Nearest bound to a position outside the limits
     */
    int64_t nearestBound(int64_t steps) const { return steps < min_steps ? min_steps : max_steps; }
};

/**
 * @brief Velocity and acceleration rates in the step domain
 */
struct MoveRates {
    float velocity = 0.0f;          // steps/s
    float acceleration = 0.0f;      // steps/s^2
    float deceleration = 0.0f;      // steps/s^2
};

/**
 * @brief Derived mechanical constants for one motor
 */
struct MechanicalConstraints {
    uint32_t steps_per_revolution = 0;
    float steps_per_degree = 0.0f;
    float max_velocity_steps_per_sec = 0.0f;
    float max_acceleration_steps_per_sec2 = 0.0f;
    uint32_t min_step_interval_ns = 0;
    bool has_limits = false;
    StepLimits limits;

    // Degree-domain maxima, kept for percentage based trajectory rates
    float max_velocity_deg_per_sec = 0.0f;
    float max_acceleration_deg_per_sec2 = 0.0f;

    /**
     * @brief Derive constraints from physical parameters
     *
     * @param base_steps_per_rev Full steps per motor revolution (> 0)
     * @param microsteps Power of two in [1, 256]
     * @param gear_ratio Output reduction (> 0)
     * @param max_velocity_deg_per_sec Maximum output velocity (> 0)
     * @param max_acceleration_deg_per_sec2 Maximum output acceleration (> 0)
     * @param limits Soft limits in degrees, or nullptr
     * @param out Receives the constraints on success
     * @param bad_field Receives the offending field on failure (may be nullptr)
     * @return ESP_OK or STEPPER_ERR_CONFIG
     */
    static esp_err_t derive(uint16_t base_steps_per_rev,
                            uint16_t microsteps,
                            float gear_ratio,
                            float max_velocity_deg_per_sec,
                            float max_acceleration_deg_per_sec2,
                            const soft_limits_t* limits,
                            MechanicalConstraints* out,
                            config_field_t* bad_field = nullptr);

    /**
     * @brief Derive constraints from a motor configuration record
     */
    static esp_err_t fromConfig(const motor_config_t& config,
                                MechanicalConstraints* out,
                                config_field_t* bad_field = nullptr);

    int64_t degreesToSteps(float degrees) const;
    float stepsToDegrees(int64_t steps) const;

    /**
     * @brief Step interval in nanoseconds for a velocity in steps/s
     */
    static uint32_t velocityToIntervalNs(double steps_per_sec);

    /**
     * @brief Motor maxima as step-domain rates
     */
    MoveRates maxRates() const;

    /**
     * @brief Effective rates of a trajectory, clamped to the motor maxima
     *
     * Velocity: absolute cap, else percentage of the maximum.
     * Acceleration: absolute rate, else percentage of the maximum.
     * Deceleration: absolute deceleration, else absolute acceleration,
     * else percentage of the maximum acceleration.
     */
    MoveRates trajectoryRates(const trajectory_config_t& trajectory) const;

    /**
     * @brief Clamp rates to the motor maxima
     */
    MoveRates clampRates(const MoveRates& rates) const;
};

#endif // MECHANICAL_CONSTRAINTS_HPP
