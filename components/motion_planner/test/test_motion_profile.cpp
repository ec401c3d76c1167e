/**
 * @file test_motion_profile.cpp
 * @brief Unit tests for trapezoidal / triangular profile planning
 */

#include "unity.h"
#include "MotionProfile.hpp"
#include "stepper_motion_err.h"
#include <cmath>

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Trapezoid
// ============================================================================

void test_trapezoid_asymmetric_rates(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(3200, 1600.0f, 3200.0f, 1600.0f, &p));

    TEST_ASSERT_FALSE(p.isTriangular());
    TEST_ASSERT_EQUAL_INT64(3200, p.totalSteps());
    TEST_ASSERT_EQUAL_UINT32(400, p.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(2000, p.cruiseSteps());
    TEST_ASSERT_EQUAL_UINT32(800, p.decelSteps());
    TEST_ASSERT_EQUAL_FLOAT(1600.0f, p.peakVelocity());
    TEST_ASSERT_TRUE(p.direction() == StepDirection::Forward);
}

void test_trapezoid_exact_fit_has_no_cruise(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(1000, 1000.0f, 1000.0f, 1000.0f, &p));

    TEST_ASSERT_FALSE(p.isTriangular());
    TEST_ASSERT_EQUAL_UINT32(500, p.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(0, p.cruiseSteps());
    TEST_ASSERT_EQUAL_UINT32(500, p.decelSteps());
}

void test_trapezoid_rounding_never_overshoots(void) {
    // Both ramps are 0.5 steps and round up to 1 each
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(1, 1.0f, 1.0f, 1.0f, &p));

    TEST_ASSERT_EQUAL_UINT64(1, p.stepCount());
    TEST_ASSERT_EQUAL_UINT32(1, p.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(0, p.decelSteps());
}

// ============================================================================
// Triangle
// ============================================================================

void test_triangle_when_ramps_do_not_fit(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(500, 1600.0f, 3200.0f, 1600.0f, &p));

    TEST_ASSERT_TRUE(p.isTriangular());
    TEST_ASSERT_FLOAT_WITHIN(0.1f, 1032.8f, p.peakVelocity());
    TEST_ASSERT_EQUAL_UINT32(167, p.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(0, p.cruiseSteps());
    TEST_ASSERT_EQUAL_UINT32(333, p.decelSteps());
    TEST_ASSERT_TRUE(p.peakVelocity() < 1600.0f);
}

void test_triangle_symmetric_split(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(100, 1000.0f, 1000.0f, 1000.0f, &p));

    TEST_ASSERT_TRUE(p.isTriangular());
    TEST_ASSERT_EQUAL_UINT32(50, p.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(50, p.decelSteps());

    // Odd lengths differ by at most one step
    for (int64_t n = 1; n < 200; n += 2) {
        TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(n, 5000.0f, 2000.0f, 2000.0f, &p));
        const int64_t diff = (int64_t)p.accelSteps() - (int64_t)p.decelSteps();
        TEST_ASSERT_TRUE(diff >= -1 && diff <= 1);
    }
}

void test_single_step_move(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(1, 1600.0f, 3200.0f, 1600.0f, &p));

    TEST_ASSERT_TRUE(p.isTriangular());
    TEST_ASSERT_EQUAL_UINT64(1, p.stepCount());
    TEST_ASSERT_EQUAL_UINT32(0, p.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(1, p.decelSteps());
}

// ============================================================================
// Invariants
// ============================================================================

void test_phase_lengths_always_sum_to_move(void) {
    const float caps[] = {50.0f, 800.0f, 3200.0f};
    const float accels[] = {100.0f, 3200.0f, 20000.0f};
    const float decels[] = {75.0f, 1600.0f, 20000.0f};

    for (int64_t n = 1; n <= 3000; n += 7) {
        for (size_t i = 0; i < 3; i++) {
            for (size_t j = 0; j < 3; j++) {
                MotionProfile p;
                TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(n, caps[i], accels[j], decels[(i + j) % 3], &p));
                TEST_ASSERT_EQUAL_UINT64((uint64_t)n, p.stepCount());
                TEST_ASSERT_TRUE(p.peakVelocity() <= caps[i]);
                if (p.isTriangular()) {
                    TEST_ASSERT_EQUAL_UINT32(0, p.cruiseSteps());
                }
            }
        }
    }
}

void test_negative_move_mirrors_positive(void) {
    MotionProfile forward;
    MotionProfile reverse;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(3200, 1600.0f, 3200.0f, 1600.0f, &forward));
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(-3200, 1600.0f, 3200.0f, 1600.0f, &reverse));

    TEST_ASSERT_EQUAL_INT64(-3200, reverse.totalSteps());
    TEST_ASSERT_EQUAL_UINT64(3200, reverse.stepCount());
    TEST_ASSERT_TRUE(reverse.direction() == StepDirection::Reverse);
    TEST_ASSERT_EQUAL_UINT32(forward.accelSteps(), reverse.accelSteps());
    TEST_ASSERT_EQUAL_UINT32(forward.cruiseSteps(), reverse.cruiseSteps());
    TEST_ASSERT_EQUAL_UINT32(forward.decelSteps(), reverse.decelSteps());
}

void test_zero_move_is_complete(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(0, 1600.0f, 3200.0f, 1600.0f, &p));

    TEST_ASSERT_TRUE(p.isZero());
    TEST_ASSERT_EQUAL_UINT64(0, p.stepCount());
    TEST_ASSERT_TRUE(p.phaseAt(0) == MotionPhase::Complete);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, p.estimatedDurationSec());
}

// ============================================================================
// Rejections
// ============================================================================

void test_rejects_non_positive_rates(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(100, 1600.0f, 0.0f, 1600.0f, &p));
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(100, 1600.0f, 3200.0f, -1.0f, &p));
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(100, 0.0f, 3200.0f, 1600.0f, &p));
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(100, NAN, 3200.0f, 1600.0f, &p));

    // Rates are checked before the zero-length shortcut
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(0, 1600.0f, 0.0f, 1600.0f, &p));
}

void test_rejects_oversized_move(void) {
    MotionProfile p;
    const int64_t too_far = (int64_t)UINT32_MAX + 1;
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(too_far, 1600.0f, 3200.0f, 1600.0f, &p));
    TEST_ASSERT_EQUAL(STEPPER_ERR_INVALID_PROFILE, MotionProfile::plan(-too_far, 1600.0f, 3200.0f, 1600.0f, &p));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, MotionProfile::plan(100, 1600.0f, 3200.0f, 1600.0f, nullptr));
}

// ============================================================================
// Queries
// ============================================================================

void test_phase_at_boundaries(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(3200, 1600.0f, 3200.0f, 1600.0f, &p));

    TEST_ASSERT_TRUE(p.phaseAt(0) == MotionPhase::Accelerating);
    TEST_ASSERT_TRUE(p.phaseAt(399) == MotionPhase::Accelerating);
    TEST_ASSERT_TRUE(p.phaseAt(400) == MotionPhase::Cruising);
    TEST_ASSERT_TRUE(p.phaseAt(2399) == MotionPhase::Cruising);
    TEST_ASSERT_TRUE(p.phaseAt(2400) == MotionPhase::Decelerating);
    TEST_ASSERT_TRUE(p.phaseAt(3199) == MotionPhase::Decelerating);
    TEST_ASSERT_TRUE(p.phaseAt(3200) == MotionPhase::Complete);
    TEST_ASSERT_EQUAL_STRING("CRUISING", motion_phase_name(MotionPhase::Cruising));
}

void test_estimated_duration(void) {
    MotionProfile p;
    TEST_ASSERT_EQUAL(ESP_OK, MotionProfile::plan(3200, 1600.0f, 3200.0f, 1600.0f, &p));

    // 0.5 s up, 1.25 s cruise, 1.0 s down
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 2.75f, p.estimatedDurationSec());
}

// ============================================================================
// Test Runner
// ============================================================================

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_trapezoid_asymmetric_rates);
    RUN_TEST(test_trapezoid_exact_fit_has_no_cruise);
    RUN_TEST(test_trapezoid_rounding_never_overshoots);
    RUN_TEST(test_triangle_when_ramps_do_not_fit);
    RUN_TEST(test_triangle_symmetric_split);
    RUN_TEST(test_single_step_move);
    RUN_TEST(test_phase_lengths_always_sum_to_move);
    RUN_TEST(test_negative_move_mirrors_positive);
    RUN_TEST(test_zero_move_is_complete);
    RUN_TEST(test_rejects_non_positive_rates);
    RUN_TEST(test_rejects_oversized_move);
    RUN_TEST(test_phase_at_boundaries);
    RUN_TEST(test_estimated_duration);

    return UNITY_END();
}
