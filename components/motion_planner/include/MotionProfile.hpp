/**
 * @file MotionProfile.hpp
 * @brief Asymmetric trapezoidal / triangular velocity profile planning
 *
 * A profile splits a point-to-point move into acceleration, cruise and
 * deceleration phases measured in whole steps. The three phase lengths
 * always add up to the absolute move length.
 */

#ifndef MOTION_PROFILE_HPP
#define MOTION_PROFILE_HPP

#include "esp_err.h"
#include <cstdint>

/**
 * @brief Direction of travel
 */
enum class StepDirection : uint8_t {
    Forward,    // Position increases
    Reverse     // Position decreases
};

/**
 * @brief Phase of a move at a given step index
 */
enum class MotionPhase : uint8_t {
    Accelerating,
    Cruising,
    Decelerating,
    Complete
};

const char* motion_phase_name(MotionPhase phase);

class MotionProfile {
public:
    /**
     * @brief Zero-length profile, complete from the start
     */
    MotionProfile() = default;

    /**
     * @brief Plan a move
     *
     * @param delta_steps Signed displacement, sign gives direction
     * @param cap_velocity Requested cruise velocity (steps/s)
     * @param accel_rate Acceleration (steps/s^2)
     * @param decel_rate Deceleration (steps/s^2)
     * @param out Receives the profile
     * @return ESP_OK, or STEPPER_ERR_INVALID_PROFILE for non-positive rates
     *
     * @note delta_steps == 0 yields the zero-length profile and ESP_OK.
     */
    static esp_err_t plan(int64_t delta_steps,
                          float cap_velocity,
                          float accel_rate,
                          float decel_rate,
                          MotionProfile* out);

    int64_t totalSteps() const { return total_steps_; }

    /**
     * @brief Absolute number of steps in the move
     */
    uint64_t stepCount() const { return static_cast<uint64_t>(accel_steps_) + cruise_steps_ + decel_steps_; }

    uint32_t accelSteps() const { return accel_steps_; }
    uint32_t cruiseSteps() const { return cruise_steps_; }
    uint32_t decelSteps() const { return decel_steps_; }
    float accelRate() const { return accel_rate_; }
    float decelRate() const { return decel_rate_; }
    float peakVelocity() const { return peak_velocity_; }

    StepDirection direction() const { return total_steps_ < 0 ? StepDirection::Reverse : StepDirection::Forward; }
    bool isZero() const { return total_steps_ == 0; }

    /**
     * @brief True when the requested velocity could not be reached
     */
    bool isTriangular() const { return triangular_; }

    /**
     * @brief Phase of the step with the given 0-based index
     */
    MotionPhase phaseAt(uint64_t index) const;

    /**
     * @brief Duration of the move assuming ideal kinematics
     */
    float estimatedDurationSec() const;

private:
    int64_t total_steps_ = 0;
    uint32_t accel_steps_ = 0;
    uint32_t cruise_steps_ = 0;
    uint32_t decel_steps_ = 0;
    float accel_rate_ = 0.0f;
    float decel_rate_ = 0.0f;
    float peak_velocity_ = 0.0f;
    bool triangular_ = false;
};

#endif // MOTION_PROFILE_HPP
