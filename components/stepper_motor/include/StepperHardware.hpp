/**
 * @file StepperHardware.hpp
 * @brief Hardware capabilities used by the motor: output lines and delays
 *
 * The motor only talks to these interfaces, so the same state machine runs
 * against real GPIO on the target and against recording mocks on a host.
 */

#ifndef STEPPER_HARDWARE_HPP
#define STEPPER_HARDWARE_HPP

#include "stepper_motor_hal.h"
#include "esp_err.h"
#include <cstdint>

/**
 * @brief Digital output line (STEP or DIR)
 */
class IOutputPin {
public:
    virtual ~IOutputPin() = default;

    /**
     * @brief Drive the line high or low
     */
    virtual esp_err_t setLevel(bool high) = 0;
};

/**
 * @brief Blocking delay used for pulse spacing
 */
class IStepDelay {
public:
    virtual ~IStepDelay() = default;

    virtual esp_err_t delayNs(uint32_t ns) = 0;
};

/**
 * @brief GPIO output backed by the stepper HAL
 */
class GpioOutputPin : public IOutputPin {
private:
    stepper_output_handle_t handle_;
    gpio_num_t pin_;

public:
    /**
     * @brief Constructor
     * @param pin GPIO number
     * @param initial_level Level driven right after configuration
     */
    explicit GpioOutputPin(gpio_num_t pin, bool initial_level = false);

    ~GpioOutputPin() override;

    // Delete copy constructor and assignment
    GpioOutputPin(const GpioOutputPin&) = delete;
    GpioOutputPin& operator=(const GpioOutputPin&) = delete;

    // Move constructor and assignment
    GpioOutputPin(GpioOutputPin&& other) noexcept;
    GpioOutputPin& operator=(GpioOutputPin&& other) noexcept;

    esp_err_t setLevel(bool high) override;

    /**
     * @brief Last level written
     */
    bool level() const;

    gpio_num_t pin() const { return pin_; }

    /**
     * @brief Check if the GPIO was configured successfully
     */
    bool isInitialized() const { return handle_ != nullptr; }
};

/**
 * @brief Delay built on the FreeRTOS tick and the ROM busy-wait
 */
class RtosStepDelay : public IStepDelay {
public:
    esp_err_t delayNs(uint32_t ns) override;
};

#endif // STEPPER_HARDWARE_HPP
