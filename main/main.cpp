/**
 * @file main.cpp
 * @brief Pan/tilt demo driving two stepper motors through named trajectories
 *
 * Motor records, trajectories and waypoint sequences are collected in a
 * MotorSystem, motors are registered with their GPIO outputs and a FreeRTOS
 * task plays the program back.
 */

#include <cstring>
#include <memory>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"

#include "motion_config.h"
#include "stepper_motion_err.h"
#include "StepperHardware.hpp"
#include "StepperMotor.hpp"
#include "MotorSystem.hpp"

static const char *TAG = "MAIN";

// Pin assignment
static const gpio_num_t PAN_STEP_PIN  = GPIO_NUM_26;
static const gpio_num_t PAN_DIR_PIN   = GPIO_NUM_27;
static const gpio_num_t TILT_STEP_PIN = GPIO_NUM_32;
static const gpio_num_t TILT_DIR_PIN  = GPIO_NUM_33;

static StepperMotor* motor_pan = nullptr;
static StepperMotor* motor_tilt = nullptr;

static MotorSystem motion_system;

/**
 * @brief Playback order, each entry names a trajectory or a sequence
 */
static const char* const program[] = {
    "pan_home",
    "pan_sweep_right",
    "tilt_up",
    "pan_sweep_left",
    "tilt_level",
    "pan_scan",
    "pan_soft_stop",
};

static motor_config_t pan_config() {
    motor_config_t config = motion_config_default_motor();
    config.name = "pan";
    config.steps_per_revolution = 200;
    config.microsteps = 16;
    config.gear_ratio = 3.0f;
    config.max_velocity_deg_per_sec = 90.0f;
    config.max_acceleration_deg_per_sec2 = 180.0f;
    config.has_limits = true;
    config.limits.min_degrees = -170.0f;
    config.limits.max_degrees = 170.0f;
    config.limits.policy = LIMIT_POLICY_REJECT;
    config.backlash_compensation_deg = 0.3f;
    return config;
}

static motor_config_t tilt_config() {
    motor_config_t config = motion_config_default_motor();
    config.name = "tilt";
    config.steps_per_revolution = 200;
    config.microsteps = 8;
    config.gear_ratio = 5.0f;
    config.max_velocity_deg_per_sec = 45.0f;
    config.max_acceleration_deg_per_sec2 = 90.0f;
    config.invert_direction = true;
    config.has_limits = true;
    config.limits.min_degrees = -30.0f;
    config.limits.max_degrees = 60.0f;
    config.limits.policy = LIMIT_POLICY_CLAMP;
    return config;
}

static void add_motor(const motor_config_t& config) {
    config_field_t bad_field = CONFIG_FIELD_NONE;
    esp_err_t err = motion_system.addMotor(config, &bad_field);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Motor '%s' rejected: %s (field %s)",
                 config.name, stepper_motion_err_to_name(err), motion_config_field_name(bad_field));
    }
}

/**
 * @brief Register a configured motor with GPIO outputs and the RTOS delay
 */
static StepperMotor* init_motor(const char* name, gpio_num_t step_pin, gpio_num_t dir_pin) {
    auto step = std::make_unique<GpioOutputPin>(step_pin);
    auto dir = std::make_unique<GpioOutputPin>(dir_pin);
    if (!step->isInitialized() || !dir->isInitialized()) {
        ESP_LOGE(TAG, "Failed to initialize GPIO for motor '%s'", name);
        return nullptr;
    }

    std::unique_ptr<StepperMotor> motor;
    esp_err_t err = motion_system.registerMotor(name,
                                                std::move(step),
                                                std::move(dir),
                                                std::make_unique<RtosStepDelay>(),
                                                &motor);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Motor '%s' not registered: %s", name, stepper_motion_err_to_name(err));
        return nullptr;
    }
    ESP_LOGI(TAG, "Motor '%s' ready", name);
    return motor.release();
}

static void init_motors() {
    ESP_LOGI(TAG, "Initializing stepper motors...");
    add_motor(pan_config());
    add_motor(tilt_config());
    motor_pan = init_motor("pan", PAN_STEP_PIN, PAN_DIR_PIN);
    motor_tilt = init_motor("tilt", TILT_STEP_PIN, TILT_DIR_PIN);
}

static void add_trajectory(const char* name, const char* motor, float target_degrees,
                           uint8_t velocity_percent, uint32_t dwell_ms) {
    trajectory_config_t trajectory = motion_config_default_trajectory();
    trajectory.motor = motor;
    trajectory.target_degrees = target_degrees;
    trajectory.velocity_percent = velocity_percent;
    trajectory.dwell_ms = dwell_ms;

    config_field_t bad_field = CONFIG_FIELD_NONE;
    esp_err_t err = motion_system.addTrajectory(name, trajectory, &bad_field);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register '%s': %s (field %s)",
                 name, stepper_motion_err_to_name(err), motion_config_field_name(bad_field));
    }
}

static void init_trajectories() {
    add_trajectory("pan_home", "pan", 0.0f, 100, 250);
    add_trajectory("pan_sweep_right", "pan", 120.0f, 50, 500);
    add_trajectory("pan_sweep_left", "pan", -120.0f, 50, 500);
    add_trajectory("tilt_up", "tilt", 45.0f, 80, 250);
    add_trajectory("tilt_level", "tilt", 0.0f, 100, 1000);

    // Gentle stop: absolute deceleration below the acceleration
    trajectory_config_t soft = motion_config_default_trajectory();
    soft.motor = "pan";
    soft.target_degrees = 90.0f;
    soft.has_deceleration = true;
    soft.deceleration_deg_per_sec2 = 45.0f;
    esp_err_t err = motion_system.addTrajectory("pan_soft_stop", soft);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register 'pan_soft_stop': %s", stepper_motion_err_to_name(err));
    }

    // Scan across the field of view, pausing at each stop
    waypoint_trajectory_t scan = motion_config_default_sequence();
    scan.motor = "pan";
    scan.velocity_percent = 40;
    scan.dwell_ms = 750;
    const float stops[] = {-60.0f, -20.0f, 20.0f, 60.0f, 0.0f};
    for (float stop : stops) {
        err = motion_config_sequence_add_waypoint(&scan, stop);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Waypoint %.1f dropped: %s", stop, esp_err_to_name(err));
        }
    }
    err = motion_system.addSequence("pan_scan", scan);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register 'pan_scan': %s", stepper_motion_err_to_name(err));
    }

    for (size_t i = 0; i < motion_system.motorCount(); i++) {
        const char* motor = motion_system.motorNameAt(i);
        ESP_LOGI(TAG, "Motor '%s': %u trajectories", motor,
                 (unsigned)motion_system.trajectoriesForMotor(motor, nullptr, 0));
    }
    ESP_LOGI(TAG, "%u trajectories, %u sequences registered",
             (unsigned)motion_system.trajectories().size(), (unsigned)motion_system.sequences().size());
}

static StepperMotor* motor_for(const char* motor_name) {
    if (motor_name == nullptr) {
        return nullptr;
    }
    if (motor_pan && strcmp(motor_name, motor_pan->name()) == 0) {
        return motor_pan;
    }
    if (motor_tilt && strcmp(motor_name, motor_tilt->name()) == 0) {
        return motor_tilt;
    }
    return nullptr;
}

/**
 * @brief Clear a fault so the next program entry can run
 */
static void recover(StepperMotor* motor) {
    if (motor->state() != MOTOR_STATE_FAULT) {
        return;
    }
    esp_err_t err = motor->reset();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Reset of '%s' failed: %s", motor->name(), esp_err_to_name(err));
    }
}

/**
 * @brief Play a waypoint sequence, blocking until its last dwell ends
 */
static void play_sequence(const char* name, const waypoint_trajectory_t* sequence) {
    StepperMotor* motor = motor_for(sequence->motor);
    if (motor == nullptr) {
        ESP_LOGW(TAG, "Skipping sequence '%s': no such motor", name);
        return;
    }

    esp_err_t err = motor->executeSequence(name, motion_system.sequences());
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Sequence '%s' aborted at %.2f deg: %s",
                 name, motor->positionDegrees(), stepper_motion_err_to_name(err));
        recover(motor);
        return;
    }
    ESP_LOGI(TAG, "Sequence '%s' done", name);
}

/**
 * @brief Run one named trajectory or sequence to completion, then dwell
 */
static void play(const char* name) {
    const waypoint_trajectory_t* sequence = motion_system.sequences().find(name);
    if (sequence != nullptr) {
        play_sequence(name, sequence);
        return;
    }

    const trajectory_config_t* trajectory = motion_system.trajectories().find(name);
    StepperMotor* motor = trajectory ? motor_for(trajectory->motor) : nullptr;
    if (motor == nullptr) {
        ESP_LOGW(TAG, "Skipping '%s': no such trajectory or motor", name);
        return;
    }

    LimitViolation violation;
    esp_err_t err = motor->executeTrajectory(name, motion_system.trajectories(), &violation);
    if (err == STEPPER_ERR_LIMIT_EXCEEDED) {
        ESP_LOGW(TAG, "'%s' rejected: target %lld beyond limit %lld",
                 name, (long long)violation.requested, (long long)violation.limit);
        return;
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "'%s' failed to start: %s", name, stepper_motion_err_to_name(err));
        return;
    }

    err = motor->runToCompletion();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "'%s' aborted at %.2f deg: %s (cause %s)",
                 name, motor->positionDegrees(),
                 stepper_motion_err_to_name(err), esp_err_to_name(motor->faultCause()));
        recover(motor);
        return;
    }

    ESP_LOGI(TAG, "'%s' done, %s at %.2f deg", name, motor->name(), motor->positionDegrees());
    if (trajectory->dwell_ms > 0) {
        vTaskDelay(pdMS_TO_TICKS(trajectory->dwell_ms));
    }
}

/**
 * @brief Motion task, loops over the program forever
 */
static void motion_task(void* pvParameters) {
    const size_t program_length = sizeof(program) / sizeof(program[0]);

    while (1) {
        for (size_t i = 0; i < program_length; i++) {
            play(program[i]);
        }
        vTaskDelay(pdMS_TO_TICKS(2000));
    }
}

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "=== Stepper Motion Demo ===");

    init_motors();
    if (motor_pan == nullptr || motor_tilt == nullptr) {
        ESP_LOGE(TAG, "Motor initialization failed, halting");
        return;
    }

    init_trajectories();

    xTaskCreate(motion_task, "motion_task", 4096, nullptr, 5, nullptr);

    ESP_LOGI(TAG, "System initialized");
}
