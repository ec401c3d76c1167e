/**
 * @file stepper_motor_hal.h
 * @brief Hardware Abstraction Layer for STEP/DIR stepper drivers
 *
 * Provides the low-level C interface used by the motor: push-pull GPIO
 * outputs for the STEP and DIR lines and a nanosecond delay built on the
 * FreeRTOS tick plus a ROM busy-wait for the sub-tick remainder.
 * Works with any STEP/DIR driver (A4988, DRV8825, TMC2208 in legacy mode).
 */

#ifndef STEPPER_MOTOR_HAL_H
#define STEPPER_MOTOR_HAL_H

#include <stdint.h>
#include <stdbool.h>
#include "esp_err.h"
#include "driver/gpio.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Output line configuration
 */
typedef struct {
    gpio_num_t pin;
    bool initial_level;
} stepper_output_config_t;

/**
 * @brief Output line handle
 */
typedef struct stepper_output_s* stepper_output_handle_t;

/**
 * @brief Configure a GPIO as a STEP or DIR output
 *
 * @param config Pointer to output configuration
 * @param out_handle Receives the handle
 * @return ESP_OK, ESP_ERR_INVALID_ARG for a bad pin, ESP_ERR_NO_MEM,
 *         or the error reported by the GPIO driver
 *
 * @note After initialization the line is driven to initial_level.
 */
esp_err_t stepper_output_hal_init(const stepper_output_config_t* config, stepper_output_handle_t* out_handle);

/**
 * @brief Release an output line
 *
 * @note After deinitialization:
 *
 * - Line is driven low.
 *
 * - GPIO is reset to its default state.
 *
 * - Memory allocated for the handle is freed.
 */
void stepper_output_hal_deinit(stepper_output_handle_t handle);

/**
 * @brief Drive an output line
 */
esp_err_t stepper_output_hal_set_level(stepper_output_handle_t handle, bool level);

/**
 * @brief Get the last level written to an output line
 */
bool stepper_output_hal_get_level(stepper_output_handle_t handle);

/**
 * @brief Block for the given number of nanoseconds
 *
 * Whole FreeRTOS ticks are yielded with vTaskDelay(), the remainder is
 * busy-waited with microsecond resolution.
 *
 * @return ESP_OK
 */
esp_err_t stepper_hal_delay_ns(uint32_t delay_ns);

#ifdef __cplusplus
}
#endif

#endif // STEPPER_MOTOR_HAL_H
