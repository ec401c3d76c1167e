/**
 * @file stepper_motion_err.h
 * @brief Error codes for the stepper motion library
 *
 * All fallible operations return esp_err_t. Generic conditions reuse the
 * ESP-IDF codes (ESP_ERR_INVALID_STATE, ESP_ERR_INVALID_ARG, ESP_ERR_NO_MEM),
 * motion specific conditions use the codes below.
 */

#ifndef STEPPER_MOTION_ERR_H
#define STEPPER_MOTION_ERR_H

#include "esp_err.h"

#ifdef __cplusplus
extern "C" {
#endif

#define STEPPER_MOTION_ERR_BASE             0xC100

/** Mechanical parameters rejected while deriving constraints */
#define STEPPER_ERR_CONFIG                  (STEPPER_MOTION_ERR_BASE + 0x01)
/** Move target outside soft limits under the Reject policy */
#define STEPPER_ERR_LIMIT_EXCEEDED          (STEPPER_MOTION_ERR_BASE + 0x02)
/** STEP/DIR output or delay failed, motor is now in Fault */
#define STEPPER_ERR_HARDWARE                (STEPPER_MOTION_ERR_BASE + 0x03)
/** Named trajectory is not registered */
#define STEPPER_ERR_TRAJECTORY_NOT_FOUND    (STEPPER_MOTION_ERR_BASE + 0x04)
/** Planner received a non-positive rate or an unrepresentable move */
#define STEPPER_ERR_INVALID_PROFILE         (STEPPER_MOTION_ERR_BASE + 0x05)
/** Named motor is not configured */
#define STEPPER_ERR_MOTOR_NOT_FOUND         (STEPPER_MOTION_ERR_BASE + 0x06)

/**
 * @brief Name of an error code
 *
 * Returns the symbolic name of the stepper motion codes and falls back to
 * esp_err_to_name() for everything else.
 */
const char* stepper_motion_err_to_name(esp_err_t code);

#ifdef __cplusplus
}
#endif

#endif // STEPPER_MOTION_ERR_H
