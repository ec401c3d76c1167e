/**
 * @file MotorSystem.hpp
 * @brief Named motor configurations with their trajectories and sequences
 *
 * Holds up to MOTOR_SYSTEM_MAX_MOTORS motor records, validates trajectories
 * and sequences against the motor they name, and builds StepperMotor
 * instances on request. Built motors are owned by the caller, the system
 * only remembers which names were registered and their constraints.
 */

#ifndef MOTOR_SYSTEM_HPP
#define MOTOR_SYSTEM_HPP

#include "StepperMotor.hpp"
#include "StepperHardware.hpp"
#include "MechanicalConstraints.hpp"
#include "TrajectoryRegistry.hpp"
#include "SequenceRegistry.hpp"
#include "motion_config.h"
#include "esp_err.h"
#include <cstddef>
#include <memory>

#define MOTOR_SYSTEM_MAX_MOTORS     8

class MotorSystem {
private:
    struct MotorEntry {
        char name[TRAJECTORY_NAME_MAX_LEN + 1];
        motor_config_t config;
        MechanicalConstraints constraints;
        bool registered;
    };

    MotorEntry motors_[MOTOR_SYSTEM_MAX_MOTORS];
    size_t motor_count_;
    TrajectoryRegistry trajectories_;
    SequenceRegistry sequences_;

    const MotorEntry* findMotor(const char* name) const;
    esp_err_t build(const MotorEntry& entry,
                    std::unique_ptr<IOutputPin> step_pin,
                    std::unique_ptr<IOutputPin> dir_pin,
                    std::unique_ptr<IStepDelay> delay,
                    std::unique_ptr<StepperMotor>* out) const;

public:
    MotorSystem();

    // Stored records point into the system's own storage
    MotorSystem(const MotorSystem&) = delete;
    MotorSystem& operator=(const MotorSystem&) = delete;

    /**
     * @brief Add a motor configuration, keyed by config.name
     *
     * @return ESP_OK, STEPPER_ERR_CONFIG, ESP_ERR_INVALID_ARG for a bad or
     *         duplicate name, ESP_ERR_NO_MEM when full
     */
    esp_err_t addMotor(const motor_config_t& config, config_field_t* bad_field = nullptr);

    /**
     * @brief Validate a trajectory against its motor and register it
     *
     * @return ESP_OK, STEPPER_ERR_MOTOR_NOT_FOUND, the validation error,
     *         or the registry error
     */
    esp_err_t addTrajectory(const char* name, const trajectory_config_t& trajectory,
                            config_field_t* bad_field = nullptr);

    /**
     * @brief Validate a waypoint sequence against its motor and register it
     */
    esp_err_t addSequence(const char* name, const waypoint_trajectory_t& sequence,
                          config_field_t* bad_field = nullptr);

    /**
     * @brief Build a configured motor and mark it registered
     *
     * @return ESP_OK, STEPPER_ERR_MOTOR_NOT_FOUND, ESP_ERR_INVALID_STATE when
     *         the name is already registered, or the StepperMotor::create() error
     */
    esp_err_t registerMotor(const char* name,
                            std::unique_ptr<IOutputPin> step_pin,
                            std::unique_ptr<IOutputPin> dir_pin,
                            std::unique_ptr<IStepDelay> delay,
                            std::unique_ptr<StepperMotor>* out);

    /**
     * @brief Build a configured motor without registering it
     */
    esp_err_t buildMotor(const char* name,
                         std::unique_ptr<IOutputPin> step_pin,
                         std::unique_ptr<IOutputPin> dir_pin,
                         std::unique_ptr<IStepDelay> delay,
                         std::unique_ptr<StepperMotor>* out) const;

    bool hasMotor(const char* name) const { return findMotor(name) != nullptr; }
    size_t motorCount() const { return motor_count_; }
    const char* motorNameAt(size_t index) const;
    const motor_config_t* motorConfig(const char* name) const;
    const MechanicalConstraints* constraints(const char* name) const;

    bool isRegistered(const char* name) const;
    size_t registeredCount() const;

    /**
     * @brief Constraints of a registered motor, nullptr if not registered
     */
    const MechanicalConstraints* registeredConstraints(const char* name) const;

    /**
     * @brief Names of the trajectories driving a motor, in registration order
     *
     * @param motor_name Motor to match
     * @param names Receives up to max_names entries (may be nullptr)
     * @param max_names Capacity of names
     * @return Number of matching trajectories, which may exceed max_names
     */
    size_t trajectoriesForMotor(const char* motor_name, const char** names, size_t max_names) const;

    const TrajectoryRegistry& trajectories() const { return trajectories_; }
    const SequenceRegistry& sequences() const { return sequences_; }
};

#endif // MOTOR_SYSTEM_HPP
