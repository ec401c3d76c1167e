/**
 * @file StepperHardware.cpp
 * @brief GPIO and FreeRTOS implementations of the motor hardware interfaces
 */

#include "StepperHardware.hpp"
#include "esp_log.h"

static const char *TAG = "StepperHardware";

GpioOutputPin::GpioOutputPin(gpio_num_t pin, bool initial_level) :
    handle_(nullptr),
    pin_(pin)
{
    stepper_output_config_t config = {
        .pin = pin,
        .initial_level = initial_level,
    };
    esp_err_t err = stepper_output_hal_init(&config, &handle_);
    if (err != ESP_OK) {
        handle_ = nullptr;
        ESP_LOGE(TAG, "Failed to initialize output on GPIO %d: %s", pin, esp_err_to_name(err));
        // Exceptions are disabled, caller checks isInitialized()
    } else {
        ESP_LOGI(TAG, "Output initialized on GPIO %d", pin);
    }
}

GpioOutputPin::~GpioOutputPin() {
    if (handle_ != nullptr) {
        stepper_output_hal_deinit(handle_);
        handle_ = nullptr;
    }
}

GpioOutputPin::GpioOutputPin(GpioOutputPin&& other) noexcept :
    handle_(other.handle_),
    pin_(other.pin_)
{
    other.handle_ = nullptr;
}

GpioOutputPin& GpioOutputPin::operator=(GpioOutputPin&& other) noexcept {
    if (this != &other) {
        if (handle_ != nullptr) {
            stepper_output_hal_deinit(handle_);
        }
        handle_ = other.handle_;
        pin_ = other.pin_;
        other.handle_ = nullptr;
    }
    return *this;
}

esp_err_t GpioOutputPin::setLevel(bool high) {
    if (handle_ == nullptr) {
        ESP_LOGW(TAG, "Output on GPIO %d not initialized", pin_);
        return ESP_ERR_INVALID_STATE;
    }
    return stepper_output_hal_set_level(handle_, high);
}

bool GpioOutputPin::level() const {
    return stepper_output_hal_get_level(handle_);
}

esp_err_t RtosStepDelay::delayNs(uint32_t ns) {
    return stepper_hal_delay_ns(ns);
}
