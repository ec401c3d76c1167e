/**
 * @file test_mechanical_constraints.cpp
 * @brief Unit tests for constraint derivation, rate resolution and record validation
 *
 * Tests verify:
 * - Step-domain constants for typical motor setups
 * - Rejection of every malformed parameter with the right field
 * - Soft limit conversion
 * - Trajectory rate precedence and clamping
 * - Motor, trajectory and waypoint sequence record validation
 */

#include "unity.h"
#include "MechanicalConstraints.hpp"
#include "motion_config.h"
#include "stepper_motion_err.h"
#include <cmath>
#include <cstring>

// ============================================================================
// Test Helpers
// ============================================================================

/**
 * @brief 200 full steps, 16 microsteps, 1:1, 360 deg/s, 720 deg/s^2
 */
static MechanicalConstraints make_constraints(const soft_limits_t* limits = nullptr) {
    MechanicalConstraints constraints;
    TEST_ASSERT_EQUAL(ESP_OK, MechanicalConstraints::derive(200, 16, 1.0f, 360.0f, 720.0f,
                                                            limits, &constraints));
    return constraints;
}

static void expect_config_error(config_field_t expected, esp_err_t err, config_field_t actual) {
    TEST_ASSERT_EQUAL(STEPPER_ERR_CONFIG, err);
    TEST_ASSERT_EQUAL_STRING(motion_config_field_name(expected), motion_config_field_name(actual));
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Derivation
// ============================================================================

void test_derive_sixteenth_microstepping(void) {
    MechanicalConstraints c = make_constraints();

    TEST_ASSERT_EQUAL_UINT32(3200, c.steps_per_revolution);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 3200.0f / 360.0f, c.steps_per_degree);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 3200.0f, c.max_velocity_steps_per_sec);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 6400.0f, c.max_acceleration_steps_per_sec2);
    TEST_ASSERT_EQUAL_UINT32(312500, c.min_step_interval_ns);
    TEST_ASSERT_FALSE(c.has_limits);
}

void test_derive_applies_gear_ratio(void) {
    MechanicalConstraints c;
    TEST_ASSERT_EQUAL(ESP_OK, MechanicalConstraints::derive(200, 16, 3.0f, 90.0f, 180.0f, nullptr, &c));

    TEST_ASSERT_EQUAL_UINT32(9600, c.steps_per_revolution);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 9600.0f / 360.0f, c.steps_per_degree);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 2400.0f, c.max_velocity_steps_per_sec);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 4800.0f, c.max_acceleration_steps_per_sec2);
}

void test_derive_full_step_motor(void) {
    MechanicalConstraints c;
    TEST_ASSERT_EQUAL(ESP_OK, MechanicalConstraints::derive(200, 1, 1.0f, 360.0f, 360.0f, nullptr, &c));

    TEST_ASSERT_EQUAL_UINT32(200, c.steps_per_revolution);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 200.0f, c.max_velocity_steps_per_sec);
    TEST_ASSERT_EQUAL_UINT32(5000000, c.min_step_interval_ns);
}

void test_derive_rejects_zero_base_steps(void) {
    MechanicalConstraints c;
    config_field_t field = CONFIG_FIELD_NONE;
    esp_err_t err = MechanicalConstraints::derive(0, 16, 1.0f, 360.0f, 720.0f, nullptr, &c, &field);
    expect_config_error(CONFIG_FIELD_STEPS_PER_REVOLUTION, err, field);
}

void test_derive_rejects_bad_microsteps(void) {
    MechanicalConstraints c;
    config_field_t field = CONFIG_FIELD_NONE;
    const uint16_t bad[] = {0, 3, 12, 512};

    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
        field = CONFIG_FIELD_NONE;
        esp_err_t err = MechanicalConstraints::derive(200, bad[i], 1.0f, 360.0f, 720.0f, nullptr, &c, &field);
        expect_config_error(CONFIG_FIELD_MICROSTEPS, err, field);
    }
}

void test_derive_accepts_all_power_of_two_microsteps(void) {
    MechanicalConstraints c;
    for (uint16_t microsteps = 1; microsteps <= 256; microsteps *= 2) {
        TEST_ASSERT_EQUAL(ESP_OK, MechanicalConstraints::derive(200, microsteps, 1.0f, 360.0f, 720.0f, nullptr, &c));
        TEST_ASSERT_EQUAL_UINT32(200u * microsteps, c.steps_per_revolution);
    }
}

void test_derive_rejects_bad_gear_ratio(void) {
    MechanicalConstraints c;
    config_field_t field = CONFIG_FIELD_NONE;

    expect_config_error(CONFIG_FIELD_GEAR_RATIO,
                        MechanicalConstraints::derive(200, 16, 0.0f, 360.0f, 720.0f, nullptr, &c, &field), field);
    expect_config_error(CONFIG_FIELD_GEAR_RATIO,
                        MechanicalConstraints::derive(200, 16, -2.0f, 360.0f, 720.0f, nullptr, &c, &field), field);
    expect_config_error(CONFIG_FIELD_GEAR_RATIO,
                        MechanicalConstraints::derive(200, 16, NAN, 360.0f, 720.0f, nullptr, &c, &field), field);

    // 200 * 1 * 0.001 rounds to zero steps per revolution
    expect_config_error(CONFIG_FIELD_GEAR_RATIO,
                        MechanicalConstraints::derive(200, 1, 0.001f, 360.0f, 720.0f, nullptr, &c, &field), field);
}

void test_derive_rejects_bad_rates(void) {
    MechanicalConstraints c;
    config_field_t field = CONFIG_FIELD_NONE;

    expect_config_error(CONFIG_FIELD_MAX_VELOCITY,
                        MechanicalConstraints::derive(200, 16, 1.0f, 0.0f, 720.0f, nullptr, &c, &field), field);
    expect_config_error(CONFIG_FIELD_MAX_VELOCITY,
                        MechanicalConstraints::derive(200, 16, 1.0f, INFINITY, 720.0f, nullptr, &c, &field), field);
    expect_config_error(CONFIG_FIELD_MAX_ACCELERATION,
                        MechanicalConstraints::derive(200, 16, 1.0f, 360.0f, -1.0f, nullptr, &c, &field), field);
}

void test_derive_failure_leaves_output_untouched(void) {
    MechanicalConstraints c = make_constraints();
    TEST_ASSERT_EQUAL(STEPPER_ERR_CONFIG, MechanicalConstraints::derive(200, 5, 1.0f, 360.0f, 720.0f, nullptr, &c));
    TEST_ASSERT_EQUAL_UINT32(3200, c.steps_per_revolution);
}

// ============================================================================
// Soft Limits
// ============================================================================

void test_derive_converts_limits(void) {
    soft_limits_t limits = { .min_degrees = -90.0f, .max_degrees = 90.0f, .policy = LIMIT_POLICY_CLAMP };
    MechanicalConstraints c = make_constraints(&limits);

    TEST_ASSERT_TRUE(c.has_limits);
    TEST_ASSERT_EQUAL_INT64(-800, c.limits.min_steps);
    TEST_ASSERT_EQUAL_INT64(800, c.limits.max_steps);
    TEST_ASSERT_EQUAL(LIMIT_POLICY_CLAMP, c.limits.policy);
}

void test_derive_rejects_inverted_limits(void) {
    soft_limits_t limits = { .min_degrees = 10.0f, .max_degrees = -10.0f, .policy = LIMIT_POLICY_REJECT };
    MechanicalConstraints c;
    config_field_t field = CONFIG_FIELD_NONE;
    esp_err_t err = MechanicalConstraints::derive(200, 16, 1.0f, 360.0f, 720.0f, &limits, &c, &field);
    expect_config_error(CONFIG_FIELD_LIMITS, err, field);
}

void test_derive_rejects_limits_collapsing_to_one_step(void) {
    // 200 steps/rev: 10.0 and 10.05 deg both round to step 6
    soft_limits_t limits = { .min_degrees = 10.0f, .max_degrees = 10.05f, .policy = LIMIT_POLICY_REJECT };
    MechanicalConstraints c;
    config_field_t field = CONFIG_FIELD_NONE;
    esp_err_t err = MechanicalConstraints::derive(200, 1, 1.0f, 360.0f, 720.0f, &limits, &c, &field);
    expect_config_error(CONFIG_FIELD_LIMITS, err, field);
}

void test_limits_contain_bounds_inclusively(void) {
    soft_limits_t limits = { .min_degrees = -90.0f, .max_degrees = 90.0f, .policy = LIMIT_POLICY_REJECT };
    MechanicalConstraints c = make_constraints(&limits);

    TEST_ASSERT_TRUE(c.limits.contains(-800));
    TEST_ASSERT_TRUE(c.limits.contains(800));
    TEST_ASSERT_FALSE(c.limits.contains(801));
    TEST_ASSERT_EQUAL_INT64(800, c.limits.nearestBound(5000));
    TEST_ASSERT_EQUAL_INT64(-800, c.limits.nearestBound(-801));
}

// ============================================================================
// Unit Conversion
// ============================================================================

void test_degrees_round_trip(void) {
    MechanicalConstraints c = make_constraints();

    TEST_ASSERT_EQUAL_INT64(400, c.degreesToSteps(45.0f));
    TEST_ASSERT_EQUAL_INT64(-3200, c.degreesToSteps(-360.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 45.0f, c.stepsToDegrees(400));

    // Any whole step survives steps -> degrees -> steps
    for (int64_t steps = -5000; steps <= 5000; steps += 37) {
        TEST_ASSERT_EQUAL_INT64(steps, c.degreesToSteps(c.stepsToDegrees(steps)));
    }
}

void test_velocity_to_interval(void) {
    TEST_ASSERT_EQUAL_UINT32(1000000, MechanicalConstraints::velocityToIntervalNs(1000.0f));
    TEST_ASSERT_EQUAL_UINT32(UINT32_MAX, MechanicalConstraints::velocityToIntervalNs(0.0f));
    TEST_ASSERT_EQUAL_UINT32(UINT32_MAX, MechanicalConstraints::velocityToIntervalNs(0.01f));
    TEST_ASSERT_EQUAL_UINT32(1, MechanicalConstraints::velocityToIntervalNs(5e9f));
}

// ============================================================================
// Trajectory Rates
// ============================================================================

void test_default_trajectory_runs_at_maxima(void) {
    MechanicalConstraints c = make_constraints();
    MoveRates rates = c.trajectoryRates(motion_config_default_trajectory());

    TEST_ASSERT_FLOAT_WITHIN(0.05f, 3200.0f, rates.velocity);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 6400.0f, rates.acceleration);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 6400.0f, rates.deceleration);
}

void test_percentages_scale_maxima(void) {
    MechanicalConstraints c = make_constraints();
    trajectory_config_t t = motion_config_default_trajectory();
    t.velocity_percent = 50;
    t.acceleration_percent = 25;

    MoveRates rates = c.trajectoryRates(t);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 1600.0f, rates.velocity);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 1600.0f, rates.acceleration);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 1600.0f, rates.deceleration);
}

void test_absolute_acceleration_applies_to_deceleration(void) {
    MechanicalConstraints c = make_constraints();
    trajectory_config_t t = motion_config_default_trajectory();
    t.acceleration_percent = 10;
    t.has_acceleration = true;
    t.acceleration_deg_per_sec2 = 90.0f;

    MoveRates rates = c.trajectoryRates(t);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 800.0f, rates.acceleration);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 800.0f, rates.deceleration);
}

void test_absolute_deceleration_wins(void) {
    MechanicalConstraints c = make_constraints();
    trajectory_config_t t = motion_config_default_trajectory();
    t.has_acceleration = true;
    t.acceleration_deg_per_sec2 = 90.0f;
    t.has_deceleration = true;
    t.deceleration_deg_per_sec2 = 45.0f;

    MoveRates rates = c.trajectoryRates(t);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 800.0f, rates.acceleration);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 400.0f, rates.deceleration);
}

void test_absolute_deceleration_with_percentage_acceleration(void) {
    MechanicalConstraints c = make_constraints();
    trajectory_config_t t = motion_config_default_trajectory();
    t.acceleration_percent = 50;
    t.has_deceleration = true;
    t.deceleration_deg_per_sec2 = 45.0f;

    MoveRates rates = c.trajectoryRates(t);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 3200.0f, rates.acceleration);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 400.0f, rates.deceleration);
}

void test_rates_above_maxima_are_clamped(void) {
    MechanicalConstraints c = make_constraints();
    trajectory_config_t t = motion_config_default_trajectory();
    t.has_velocity = true;
    t.velocity_deg_per_sec = 720.0f;
    t.acceleration_percent = 200;

    MoveRates rates = c.trajectoryRates(t);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 3200.0f, rates.velocity);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 6400.0f, rates.acceleration);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 6400.0f, rates.deceleration);

    t.has_velocity = false;
    t.velocity_percent = 200;
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 3200.0f, c.trajectoryRates(t).velocity);
}

// ============================================================================
// Record Validation
// ============================================================================

void test_default_motor_is_valid(void) {
    motor_config_t motor = motion_config_default_motor();
    config_field_t field = CONFIG_FIELD_COUNT;

    TEST_ASSERT_EQUAL(ESP_OK, motion_config_validate_motor(&motor, &field));
    TEST_ASSERT_EQUAL(CONFIG_FIELD_NONE, field);

    MechanicalConstraints c;
    TEST_ASSERT_EQUAL(ESP_OK, MechanicalConstraints::fromConfig(motor, &c));
    TEST_ASSERT_EQUAL_UINT32(200, c.steps_per_revolution);
}

void test_validate_motor_reports_field(void) {
    config_field_t field = CONFIG_FIELD_NONE;

    motor_config_t motor = motion_config_default_motor();
    motor.backlash_compensation_deg = -0.5f;
    expect_config_error(CONFIG_FIELD_BACKLASH, motion_config_validate_motor(&motor, &field), field);

    motor = motion_config_default_motor();
    motor.has_limits = true;
    motor.limits.min_degrees = 5.0f;
    motor.limits.max_degrees = 5.0f;
    expect_config_error(CONFIG_FIELD_LIMITS, motion_config_validate_motor(&motor, &field), field);

    motor = motion_config_default_motor();
    motor.microsteps = 6;
    expect_config_error(CONFIG_FIELD_MICROSTEPS, motion_config_validate_motor(&motor, &field), field);

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, motion_config_validate_motor(nullptr, &field));
}

void test_validate_trajectory_checks_fields(void) {
    motor_config_t motor = motion_config_default_motor();
    config_field_t field = CONFIG_FIELD_NONE;

    trajectory_config_t t = motion_config_default_trajectory();
    t.motor = "motor";
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_validate_trajectory(&t, &motor, &field));

    t.motor = "other";
    expect_config_error(CONFIG_FIELD_MOTOR_NAME, motion_config_validate_trajectory(&t, &motor, &field), field);

    t.motor = "motor";
    t.velocity_percent = 0;
    expect_config_error(CONFIG_FIELD_VELOCITY_PERCENT, motion_config_validate_trajectory(&t, &motor, &field), field);

    t.velocity_percent = 100;
    t.acceleration_percent = 201;
    expect_config_error(CONFIG_FIELD_ACCELERATION_PERCENT, motion_config_validate_trajectory(&t, &motor, &field), field);

    t.acceleration_percent = 100;
    t.has_deceleration = true;
    t.deceleration_deg_per_sec2 = 0.0f;
    expect_config_error(CONFIG_FIELD_DECELERATION, motion_config_validate_trajectory(&t, &motor, &field), field);
}

void test_validate_trajectory_target_against_limits(void) {
    motor_config_t motor = motion_config_default_motor();
    motor.has_limits = true;
    motor.limits.min_degrees = -90.0f;
    motor.limits.max_degrees = 90.0f;
    motor.limits.policy = LIMIT_POLICY_REJECT;

    trajectory_config_t t = motion_config_default_trajectory();
    t.motor = "motor";
    t.target_degrees = 100.0f;

    config_field_t field = CONFIG_FIELD_NONE;
    TEST_ASSERT_EQUAL(STEPPER_ERR_LIMIT_EXCEEDED, motion_config_validate_trajectory(&t, &motor, &field));
    TEST_ASSERT_EQUAL(CONFIG_FIELD_TARGET, field);

    // Inclusive bound
    t.target_degrees = 90.0f;
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_validate_trajectory(&t, &motor, &field));

    motor.limits.policy = LIMIT_POLICY_CLAMP;
    t.target_degrees = 100.0f;
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_validate_trajectory(&t, &motor, &field));
}

void test_sequence_waypoints_are_bounded(void) {
    waypoint_trajectory_t seq = motion_config_default_sequence();
    TEST_ASSERT_EQUAL(0, seq.waypoint_count);
    TEST_ASSERT_EQUAL(100, seq.velocity_percent);

    for (int i = 0; i < MOTION_CONFIG_MAX_WAYPOINTS; i++) {
        TEST_ASSERT_EQUAL(ESP_OK, motion_config_sequence_add_waypoint(&seq, (float)i));
    }
    TEST_ASSERT_EQUAL(ESP_ERR_NO_MEM, motion_config_sequence_add_waypoint(&seq, 99.0f));
    TEST_ASSERT_EQUAL(MOTION_CONFIG_MAX_WAYPOINTS, seq.waypoint_count);
    TEST_ASSERT_EQUAL_FLOAT(31.0f, seq.waypoints_degrees[31]);

    waypoint_trajectory_t other = motion_config_default_sequence();
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, motion_config_sequence_add_waypoint(&other, NAN));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, motion_config_sequence_add_waypoint(nullptr, 1.0f));
    TEST_ASSERT_EQUAL(0, other.waypoint_count);
}

void test_validate_sequence_checks_fields(void) {
    motor_config_t motor = motion_config_default_motor();
    waypoint_trajectory_t seq = motion_config_default_sequence();
    seq.motor = "motor";
    config_field_t field = CONFIG_FIELD_NONE;

    // No waypoints
    expect_config_error(CONFIG_FIELD_WAYPOINTS, motion_config_validate_sequence(&seq, &motor, &field), field);

    TEST_ASSERT_EQUAL(ESP_OK, motion_config_sequence_add_waypoint(&seq, 45.0f));
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_validate_sequence(&seq, &motor, &field));
    TEST_ASSERT_EQUAL(CONFIG_FIELD_NONE, field);

    seq.velocity_percent = 0;
    expect_config_error(CONFIG_FIELD_VELOCITY_PERCENT, motion_config_validate_sequence(&seq, &motor, &field), field);
    seq.velocity_percent = 100;

    seq.motor = "elsewhere";
    expect_config_error(CONFIG_FIELD_MOTOR_NAME, motion_config_validate_sequence(&seq, &motor, &field), field);
    seq.motor = "motor";

    seq.waypoints_degrees[0] = INFINITY;
    expect_config_error(CONFIG_FIELD_WAYPOINTS, motion_config_validate_sequence(&seq, &motor, &field), field);

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, motion_config_validate_sequence(nullptr, &motor, &field));
}

void test_validate_sequence_waypoints_against_limits(void) {
    motor_config_t motor = motion_config_default_motor();
    motor.has_limits = true;
    motor.limits.min_degrees = -90.0f;
    motor.limits.max_degrees = 90.0f;
    motor.limits.policy = LIMIT_POLICY_REJECT;

    waypoint_trajectory_t seq = motion_config_default_sequence();
    seq.motor = "motor";
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_sequence_add_waypoint(&seq, 10.0f));
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_sequence_add_waypoint(&seq, -120.0f));

    config_field_t field = CONFIG_FIELD_NONE;
    TEST_ASSERT_EQUAL(STEPPER_ERR_LIMIT_EXCEEDED, motion_config_validate_sequence(&seq, &motor, &field));
    TEST_ASSERT_EQUAL(CONFIG_FIELD_WAYPOINTS, field);

    motor.limits.policy = LIMIT_POLICY_CLAMP;
    TEST_ASSERT_EQUAL(ESP_OK, motion_config_validate_sequence(&seq, &motor, &field));
}

void test_error_names(void) {
    TEST_ASSERT_EQUAL_STRING("STEPPER_ERR_CONFIG", stepper_motion_err_to_name(STEPPER_ERR_CONFIG));
    TEST_ASSERT_EQUAL_STRING("STEPPER_ERR_HARDWARE", stepper_motion_err_to_name(STEPPER_ERR_HARDWARE));
    TEST_ASSERT_EQUAL_STRING("gear_ratio", motion_config_field_name(CONFIG_FIELD_GEAR_RATIO));
    TEST_ASSERT_EQUAL_STRING("STEPPER_ERR_MOTOR_NOT_FOUND", stepper_motion_err_to_name(STEPPER_ERR_MOTOR_NOT_FOUND));
    TEST_ASSERT_EQUAL_STRING("waypoints", motion_config_field_name(CONFIG_FIELD_WAYPOINTS));
    TEST_ASSERT_EQUAL_STRING("unknown", motion_config_field_name(CONFIG_FIELD_COUNT));
}

// ============================================================================
// Test Runner
// ============================================================================

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_derive_sixteenth_microstepping);
    RUN_TEST(test_derive_applies_gear_ratio);
    RUN_TEST(test_derive_full_step_motor);
    RUN_TEST(test_derive_rejects_zero_base_steps);
    RUN_TEST(test_derive_rejects_bad_microsteps);
    RUN_TEST(test_derive_accepts_all_power_of_two_microsteps);
    RUN_TEST(test_derive_rejects_bad_gear_ratio);
    RUN_TEST(test_derive_rejects_bad_rates);
    RUN_TEST(test_derive_failure_leaves_output_untouched);

    RUN_TEST(test_derive_converts_limits);
    RUN_TEST(test_derive_rejects_inverted_limits);
    RUN_TEST(test_derive_rejects_limits_collapsing_to_one_step);
    RUN_TEST(test_limits_contain_bounds_inclusively);

    RUN_TEST(test_degrees_round_trip);
    RUN_TEST(test_velocity_to_interval);

    RUN_TEST(test_default_trajectory_runs_at_maxima);
    RUN_TEST(test_percentages_scale_maxima);
    RUN_TEST(test_absolute_acceleration_applies_to_deceleration);
    RUN_TEST(test_absolute_deceleration_wins);
    RUN_TEST(test_absolute_deceleration_with_percentage_acceleration);
    RUN_TEST(test_rates_above_maxima_are_clamped);

    RUN_TEST(test_default_motor_is_valid);
    RUN_TEST(test_validate_motor_reports_field);
    RUN_TEST(test_validate_trajectory_checks_fields);
    RUN_TEST(test_validate_trajectory_target_against_limits);
    RUN_TEST(test_sequence_waypoints_are_bounded);
    RUN_TEST(test_validate_sequence_checks_fields);
    RUN_TEST(test_validate_sequence_waypoints_against_limits);
    RUN_TEST(test_error_names);

    return UNITY_END();
}
