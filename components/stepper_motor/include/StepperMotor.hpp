/**
 * @file StepperMotor.hpp
 * @brief Stepper motor state machine
 *
 * Owns the STEP/DIR outputs, the delay capability and the absolute position
 * of one motor. Moves are planned up front and then executed one pulse per
 * step() call, so the caller decides when (and whether) the next pulse runs.
 *
 * States: IDLE -> MOVING -> IDLE, any hardware error -> FAULT -> reset() -> IDLE.
 * HOMING is reserved and never entered.
 */

#ifndef STEPPER_MOTOR_HPP
#define STEPPER_MOTOR_HPP

#include "StepperHardware.hpp"
#include "MechanicalConstraints.hpp"
#include "MotionProfile.hpp"
#include "StepSequencer.hpp"
#include "motion_config.h"
#include "esp_err.h"
#include <cstdint>
#include <memory>
#include <string>

class TrajectoryRegistry;
class SequenceRegistry;

/**
 * @brief Motor states
 */
typedef enum {
    MOTOR_STATE_IDLE = 0,
    MOTOR_STATE_MOVING,
    MOTOR_STATE_HOMING,
    MOTOR_STATE_FAULT,
    MOTOR_STATE_COUNT
} motor_state_t;

const char* motor_state_name(motor_state_t state);

/**
 * @brief Details of a target rejected by a soft limit
 */
struct LimitViolation {
    int64_t requested;      // Requested target (steps)
    int64_t limit;          // Bound it crossed (steps)
};

class StepperMotor {
private:
    std::string name_;
    MechanicalConstraints constraints_;
    std::unique_ptr<IOutputPin> step_pin_;
    std::unique_ptr<IOutputPin> dir_pin_;
    std::unique_ptr<IStepDelay> delay_;
    bool invert_direction_;
    uint32_t backlash_steps_;

    motor_state_t state_ = MOTOR_STATE_IDLE;
    int64_t position_ = 0;
    esp_err_t fault_cause_ = ESP_OK;

    // Valid only while MOVING
    StepSequencer sequencer_;
    uint32_t pending_backlash_ = 0;

    // Last direction written to the DIR line
    bool dir_written_ = false;
    StepDirection dir_level_ = StepDirection::Forward;

    // Direction of the last committed step, for backlash detection
    bool has_travelled_ = false;
    StepDirection last_travel_ = StepDirection::Forward;

    void transitionTo(motor_state_t new_state);
    esp_err_t applyDirection(StepDirection direction);
    esp_err_t pulse(StepDirection direction, uint32_t interval_ns);
    esp_err_t takeUpBacklash(StepDirection direction);
    void enterFault(esp_err_t cause);
    void finishMove();
    esp_err_t dwell(uint32_t ms);
    void resetMotion();

public:
    /**
     * @brief Constructor
     * @param name Motor name, matched against trajectory records
     * @param constraints Derived mechanical constraints
     * @param step_pin STEP output
     * @param dir_pin DIR output
     * @param delay Pulse delay capability
     * @param invert_direction Swap the DIR polarity
     * @param backlash_deg Take-up travel issued when a move reverses direction
     */
    StepperMotor(const char* name,
                 const MechanicalConstraints& constraints,
                 std::unique_ptr<IOutputPin> step_pin,
                 std::unique_ptr<IOutputPin> dir_pin,
                 std::unique_ptr<IStepDelay> delay,
                 bool invert_direction = false,
                 float backlash_deg = 0.0f);

    /**
     * @brief Build a motor from a configuration record
     *
     * @param config Motor record
     * @param step_pin STEP output
     * @param dir_pin DIR output
     * @param delay Pulse delay capability
     * @param out Receives the motor
     * @param bad_field Receives the offending field on STEPPER_ERR_CONFIG (may be nullptr)
     * @return ESP_OK, STEPPER_ERR_CONFIG, or ESP_ERR_INVALID_ARG for missing hardware
     */
    static esp_err_t create(const motor_config_t& config,
                            std::unique_ptr<IOutputPin> step_pin,
                            std::unique_ptr<IOutputPin> dir_pin,
                            std::unique_ptr<IStepDelay> delay,
                            std::unique_ptr<StepperMotor>* out,
                            config_field_t* bad_field = nullptr);

    ~StepperMotor() = default;

    // Delete copy constructor and assignment
    StepperMotor(const StepperMotor&) = delete;
    StepperMotor& operator=(const StepperMotor&) = delete;

    // Move constructor and assignment, the source is left IDLE without hardware
    StepperMotor(StepperMotor&& other) noexcept;
    StepperMotor& operator=(StepperMotor&& other) noexcept;

    /**
     * @brief Start a move to an absolute position at the motor maxima
     *
     * @param target_steps Absolute target
     * @param violation Receives details on STEPPER_ERR_LIMIT_EXCEEDED (may be nullptr)
     * @return ESP_OK (also for a zero-length move, which stays IDLE),
     *         STEPPER_ERR_LIMIT_EXCEEDED, STEPPER_ERR_INVALID_PROFILE
     *         (also when the distance does not fit in int64),
     *         or ESP_ERR_INVALID_STATE when not IDLE
     */
    esp_err_t moveTo(int64_t target_steps, LimitViolation* violation = nullptr);

    /**
     * @brief Start a move with explicit rates, clamped to the motor maxima
     */
    esp_err_t moveTo(int64_t target_steps, const MoveRates& rates, LimitViolation* violation = nullptr);

    /**
     * @brief Start a move relative to the current position
     *
     * @return As moveTo(), STEPPER_ERR_INVALID_PROFILE when the target
     *         would leave the int64 range
     */
    esp_err_t moveBy(int64_t relative_steps, LimitViolation* violation = nullptr);

    esp_err_t moveToDegrees(float degrees, LimitViolation* violation = nullptr);
    esp_err_t moveByDegrees(float degrees, LimitViolation* violation = nullptr);

    /**
     * @brief Start the move described by a trajectory record
     *
     * @return As moveTo(), or ESP_ERR_INVALID_ARG when the record names another motor
     */
    esp_err_t moveWithTrajectory(const trajectory_config_t& trajectory, LimitViolation* violation = nullptr);

    /**
     * @brief Look up a named trajectory and start it
     *
     * @return As moveWithTrajectory(), or STEPPER_ERR_TRAJECTORY_NOT_FOUND
     */
    esp_err_t executeTrajectory(const char* trajectory_name,
                                const TrajectoryRegistry& registry,
                                LimitViolation* violation = nullptr);

    /**
     * @brief Play every waypoint of a sequence to completion, blocking
     *
     * Each leg runs at the sequence's velocity percentage and is followed by
     * the dwell. Under Reject limits all waypoints are checked before the
     * first pulse.
     *
     * @return ESP_OK, ESP_ERR_INVALID_ARG for a malformed record or one naming
     *         another motor, STEPPER_ERR_LIMIT_EXCEEDED, ESP_ERR_INVALID_STATE
     *         when not IDLE, or the error of the failing leg
     */
    esp_err_t executeSequence(const waypoint_trajectory_t& sequence, LimitViolation* violation = nullptr);

    /**
     * @brief Look up a named sequence and play it
     *
     * @return As executeSequence(), or STEPPER_ERR_TRAJECTORY_NOT_FOUND
     */
    esp_err_t executeSequence(const char* sequence_name,
                              const SequenceRegistry& registry,
                              LimitViolation* violation = nullptr);

    /**
     * @brief Issue the next pulse of the active move
     *
     * Blocks for the step interval. The last step of a move returns the
     * motor to IDLE.
     *
     * @param more Set to true while further steps remain (may be nullptr)
     * @return ESP_OK, ESP_ERR_INVALID_STATE when not MOVING, or
     *         STEPPER_ERR_HARDWARE after a pin or delay failure (motor is in FAULT)
     */
    esp_err_t step(bool* more = nullptr);

    /**
     * @brief Call step() until the active move finishes
     *
     * @return ESP_OK (immediately when IDLE), ESP_ERR_INVALID_STATE when
     *         not IDLE or MOVING, or the error of the failing step
     */
    esp_err_t runToCompletion();

    /**
     * @brief Abandon the active move, no further pulses are issued
     */
    esp_err_t emergencyStop();

    /**
     * @brief Leave FAULT, position is kept
     */
    esp_err_t reset();

    /**
     * @brief Declare the current position as zero (IDLE only)
     */
    esp_err_t setOrigin();

    /**
     * @brief Overwrite the position counter (IDLE only)
     */
    esp_err_t setPosition(int64_t steps);

    int64_t positionSteps() const { return position_; }
    float positionDegrees() const { return constraints_.stepsToDegrees(position_); }
    motor_state_t state() const { return state_; }
    const char* stateName() const { return motor_state_name(state_); }

    /**
     * @brief True when limits are configured and the position sits on or beyond one
     */
    bool atLimit() const;

    /**
     * @brief Underlying hardware error while in FAULT, ESP_OK otherwise
     */
    esp_err_t faultCause() const { return fault_cause_; }

    /**
     * @brief Fraction of the active move completed, 0 when IDLE
     */
    float progress() const;

    /**
     * @brief Phase of the next step, COMPLETE when no move is active
     */
    MotionPhase phase() const;

    /**
     * @brief Profile of the active move
     */
    const MotionProfile& activeProfile() const { return sequencer_.profile(); }

    const char* name() const { return name_.c_str(); }
    const MechanicalConstraints& constraints() const { return constraints_; }
    uint32_t backlashSteps() const { return backlash_steps_; }

    /**
     * @brief Check if all hardware capabilities are present
     */
    bool isInitialized() const { return step_pin_ && dir_pin_ && delay_; }
};

#endif // STEPPER_MOTOR_HPP
