/**
 * @file MotorSystem.cpp
 * @brief Implementation of the named motor system
 */

#include "MotorSystem.hpp"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <cstring>
#include <utility>

static const char *TAG = "MotorSystem";

MotorSystem::MotorSystem() :
    motors_(),
    motor_count_(0)
{
}

const MotorSystem::MotorEntry* MotorSystem::findMotor(const char* name) const {
    if (name == nullptr) {
        return nullptr;
    }
    for (size_t i = 0; i < motor_count_; i++) {
        if (strcmp(motors_[i].name, name) == 0) {
            return &motors_[i];
        }
    }
    return nullptr;
}

esp_err_t MotorSystem::addMotor(const motor_config_t& config, config_field_t* bad_field) {
    if (!trajectory_name_is_valid(config.name)) {
        ESP_LOGE(TAG, "Invalid motor name");
        if (bad_field) {
            *bad_field = CONFIG_FIELD_MOTOR_NAME;
        }
        return ESP_ERR_INVALID_ARG;
    }
    if (findMotor(config.name) != nullptr) {
        ESP_LOGE(TAG, "Motor '%s' already configured", config.name);
        return ESP_ERR_INVALID_ARG;
    }
    if (motor_count_ >= MOTOR_SYSTEM_MAX_MOTORS) {
        ESP_LOGE(TAG, "System full (%d motors), cannot add '%s'", MOTOR_SYSTEM_MAX_MOTORS, config.name);
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = motion_config_validate_motor(&config, bad_field);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Motor '%s' rejected: %s", config.name, stepper_motion_err_to_name(err));
        return err;
    }
    MechanicalConstraints constraints;
    err = MechanicalConstraints::fromConfig(config, &constraints, bad_field);
    if (err != ESP_OK) {
        return err;
    }

    MotorEntry& entry = motors_[motor_count_];
    entry = MotorEntry();
    strncpy(entry.name, config.name, TRAJECTORY_NAME_MAX_LEN);
    entry.config = config;
    entry.config.name = entry.name;
    entry.constraints = constraints;
    entry.registered = false;
    motor_count_++;

    ESP_LOGI(TAG, "Motor '%s' configured: %lu steps/rev",
             entry.name, (unsigned long)constraints.steps_per_revolution);
    return ESP_OK;
}

esp_err_t MotorSystem::addTrajectory(const char* name, const trajectory_config_t& trajectory,
                                     config_field_t* bad_field) {
    const MotorEntry* motor = findMotor(trajectory.motor);
    if (motor == nullptr) {
        ESP_LOGE(TAG, "Trajectory '%s' names unknown motor '%s'",
                 name ? name : "(null)", trajectory.motor ? trajectory.motor : "(null)");
        if (bad_field) {
            *bad_field = CONFIG_FIELD_MOTOR_NAME;
        }
        return STEPPER_ERR_MOTOR_NOT_FOUND;
    }

    esp_err_t err = motion_config_validate_trajectory(&trajectory, &motor->config, bad_field);
    if (err != ESP_OK) {
        return err;
    }
    return trajectories_.add(name, trajectory);
}

esp_err_t MotorSystem::addSequence(const char* name, const waypoint_trajectory_t& sequence,
                                   config_field_t* bad_field) {
    const MotorEntry* motor = findMotor(sequence.motor);
    if (motor == nullptr) {
        ESP_LOGE(TAG, "Sequence '%s' names unknown motor '%s'",
                 name ? name : "(null)", sequence.motor ? sequence.motor : "(null)");
        if (bad_field) {
            *bad_field = CONFIG_FIELD_MOTOR_NAME;
        }
        return STEPPER_ERR_MOTOR_NOT_FOUND;
    }

    esp_err_t err = motion_config_validate_sequence(&sequence, &motor->config, bad_field);
    if (err != ESP_OK) {
        return err;
    }
    return sequences_.add(name, sequence);
}

esp_err_t MotorSystem::build(const MotorEntry& entry,
                             std::unique_ptr<IOutputPin> step_pin,
                             std::unique_ptr<IOutputPin> dir_pin,
                             std::unique_ptr<IStepDelay> delay,
                             std::unique_ptr<StepperMotor>* out) const {
    return StepperMotor::create(entry.config,
                                std::move(step_pin),
                                std::move(dir_pin),
                                std::move(delay),
                                out);
}

esp_err_t MotorSystem::registerMotor(const char* name,
                                     std::unique_ptr<IOutputPin> step_pin,
                                     std::unique_ptr<IOutputPin> dir_pin,
                                     std::unique_ptr<IStepDelay> delay,
                                     std::unique_ptr<StepperMotor>* out) {
    const MotorEntry* found = findMotor(name);
    if (found == nullptr) {
        ESP_LOGE(TAG, "Cannot register '%s': not configured", name ? name : "(null)");
        return STEPPER_ERR_MOTOR_NOT_FOUND;
    }
    if (found->registered) {
        ESP_LOGW(TAG, "Motor '%s' already registered", name);
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t err = build(*found, std::move(step_pin), std::move(dir_pin), std::move(delay), out);
    if (err != ESP_OK) {
        return err;
    }
    motors_[found - motors_].registered = true;
    ESP_LOGI(TAG, "Motor '%s' registered", name);
    return ESP_OK;
}

esp_err_t MotorSystem::buildMotor(const char* name,
                                  std::unique_ptr<IOutputPin> step_pin,
                                  std::unique_ptr<IOutputPin> dir_pin,
                                  std::unique_ptr<IStepDelay> delay,
                                  std::unique_ptr<StepperMotor>* out) const {
    const MotorEntry* found = findMotor(name);
    if (found == nullptr) {
        return STEPPER_ERR_MOTOR_NOT_FOUND;
    }
    return build(*found, std::move(step_pin), std::move(dir_pin), std::move(delay), out);
}

const char* MotorSystem::motorNameAt(size_t index) const {
    if (index >= motor_count_) {
        return nullptr;
    }
    return motors_[index].name;
}

const motor_config_t* MotorSystem::motorConfig(const char* name) const {
    const MotorEntry* entry = findMotor(name);
    return entry ? &entry->config : nullptr;
}

const MechanicalConstraints* MotorSystem::constraints(const char* name) const {
    const MotorEntry* entry = findMotor(name);
    return entry ? &entry->constraints : nullptr;
}

bool MotorSystem::isRegistered(const char* name) const {
    const MotorEntry* entry = findMotor(name);
    return entry != nullptr && entry->registered;
}

size_t MotorSystem::registeredCount() const {
    size_t count = 0;
    for (size_t i = 0; i < motor_count_; i++) {
        if (motors_[i].registered) {
            count++;
        }
    }
    return count;
}

const MechanicalConstraints* MotorSystem::registeredConstraints(const char* name) const {
    const MotorEntry* entry = findMotor(name);
    return (entry && entry->registered) ? &entry->constraints : nullptr;
}

size_t MotorSystem::trajectoriesForMotor(const char* motor_name, const char** names, size_t max_names) const {
    if (motor_name == nullptr) {
        return 0;
    }
    size_t matches = 0;
    for (size_t i = 0; i < trajectories_.size(); i++) {
        const char* name = trajectories_.nameAt(i);
        const trajectory_config_t* trajectory = trajectories_.find(name);
        if (trajectory == nullptr || trajectory->motor == nullptr ||
            strcmp(trajectory->motor, motor_name) != 0) {
            continue;
        }
        if (names != nullptr && matches < max_names) {
            names[matches] = name;
        }
        matches++;
    }
    return matches;
}
