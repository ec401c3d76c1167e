/**
 * @file StepperMotor.cpp
 * @brief Implementation of the stepper motor state machine
 */

#include "StepperMotor.hpp"
#include "TrajectoryRegistry.hpp"
#include "SequenceRegistry.hpp"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <cmath>
#include <utility>

static const char *TAG = "StepperMotor";

static const char* state_names[] = {
    "IDLE",
    "MOVING",
    "HOMING",
    "FAULT"
};

const char* motor_state_name(motor_state_t state) {
    if (state >= MOTOR_STATE_IDLE && state < MOTOR_STATE_COUNT) {
        return state_names[state];
    }
    return "UNKNOWN";
}

static uint32_t backlash_to_steps(float backlash_deg, float steps_per_degree) {
    if (!std::isfinite(backlash_deg) || backlash_deg <= 0.0f) {
        return 0;
    }
    const double steps = std::round(static_cast<double>(backlash_deg) * steps_per_degree);
    return steps >= static_cast<double>(UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(steps);
}

// Constructor
StepperMotor::StepperMotor(const char* name,
                           const MechanicalConstraints& constraints,
                           std::unique_ptr<IOutputPin> step_pin,
                           std::unique_ptr<IOutputPin> dir_pin,
                           std::unique_ptr<IStepDelay> delay,
                           bool invert_direction,
                           float backlash_deg) :
    name_(name ? name : ""),
    constraints_(constraints),
    step_pin_(std::move(step_pin)),
    dir_pin_(std::move(dir_pin)),
    delay_(std::move(delay)),
    invert_direction_(invert_direction),
    backlash_steps_(backlash_to_steps(backlash_deg, constraints.steps_per_degree))
{
    if (!isInitialized()) {
        ESP_LOGE(TAG, "[%s] Missing STEP, DIR or delay capability", name_.c_str());
        // Exceptions are disabled, moves are refused until isInitialized()
    } else {
        ESP_LOGI(TAG, "[%s] Initialized: %lu steps/rev, vmax %.1f steps/s, backlash %lu steps",
                 name_.c_str(),
                 (unsigned long)constraints_.steps_per_revolution,
                 constraints_.max_velocity_steps_per_sec,
                 (unsigned long)backlash_steps_);
    }
}

// Move constructor
StepperMotor::StepperMotor(StepperMotor&& other) noexcept :
    name_(std::move(other.name_)),
    constraints_(other.constraints_),
    step_pin_(std::move(other.step_pin_)),
    dir_pin_(std::move(other.dir_pin_)),
    delay_(std::move(other.delay_)),
    invert_direction_(other.invert_direction_),
    backlash_steps_(other.backlash_steps_),
    state_(other.state_),
    position_(other.position_),
    fault_cause_(other.fault_cause_),
    sequencer_(other.sequencer_),
    pending_backlash_(other.pending_backlash_),
    dir_written_(other.dir_written_),
    dir_level_(other.dir_level_),
    has_travelled_(other.has_travelled_),
    last_travel_(other.last_travel_)
{
    other.state_ = MOTOR_STATE_IDLE;
    other.position_ = 0;
    other.fault_cause_ = ESP_OK;
    other.resetMotion();
    other.dir_written_ = false;
    other.has_travelled_ = false;
}

// Move assignment operator
StepperMotor& StepperMotor::operator=(StepperMotor&& other) noexcept {
    if (this != &other) {
        // Move data, the previous outputs are released here
        name_ = std::move(other.name_);
        constraints_ = other.constraints_;
        step_pin_ = std::move(other.step_pin_);
        dir_pin_ = std::move(other.dir_pin_);
        delay_ = std::move(other.delay_);
        invert_direction_ = other.invert_direction_;
        backlash_steps_ = other.backlash_steps_;
        state_ = other.state_;
        position_ = other.position_;
        fault_cause_ = other.fault_cause_;
        sequencer_ = other.sequencer_;
        pending_backlash_ = other.pending_backlash_;
        dir_written_ = other.dir_written_;
        dir_level_ = other.dir_level_;
        has_travelled_ = other.has_travelled_;
        last_travel_ = other.last_travel_;

        // Reset other
        other.state_ = MOTOR_STATE_IDLE;
        other.position_ = 0;
        other.fault_cause_ = ESP_OK;
        other.resetMotion();
        other.dir_written_ = false;
        other.has_travelled_ = false;
    }
    return *this;
}

esp_err_t StepperMotor::create(const motor_config_t& config,
                               std::unique_ptr<IOutputPin> step_pin,
                               std::unique_ptr<IOutputPin> dir_pin,
                               std::unique_ptr<IStepDelay> delay,
                               std::unique_ptr<StepperMotor>* out,
                               config_field_t* bad_field) {
    if (out == nullptr || !step_pin || !dir_pin || !delay) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t err = motion_config_validate_motor(&config, bad_field);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "[%s] Invalid motor config: %s",
                 config.name ? config.name : "?", stepper_motion_err_to_name(err));
        return err;
    }

    MechanicalConstraints constraints;
    err = MechanicalConstraints::fromConfig(config, &constraints, bad_field);
    if (err != ESP_OK) {
        return err;
    }

    *out = std::make_unique<StepperMotor>(config.name,
                                          constraints,
                                          std::move(step_pin),
                                          std::move(dir_pin),
                                          std::move(delay),
                                          config.invert_direction,
                                          config.backlash_compensation_deg);
    return ESP_OK;
}

void StepperMotor::transitionTo(motor_state_t new_state) {
    if (new_state != state_) {
        ESP_LOGI(TAG, "[%s] Transition: %s -> %s",
                 name_.c_str(), state_names[state_], state_names[new_state]);
        state_ = new_state;
    }
}

esp_err_t StepperMotor::moveTo(int64_t target_steps, LimitViolation* violation) {
    return moveTo(target_steps, constraints_.maxRates(), violation);
}

esp_err_t StepperMotor::moveTo(int64_t target_steps, const MoveRates& rates, LimitViolation* violation) {
    if (!isInitialized()) {
        ESP_LOGW(TAG, "[%s] Motor not initialized", name_.c_str());
        return ESP_ERR_INVALID_STATE;
    }
    if (state_ != MOTOR_STATE_IDLE) {
        ESP_LOGW(TAG, "[%s] Move refused in state %s", name_.c_str(), state_names[state_]);
        return ESP_ERR_INVALID_STATE;
    }

    int64_t target = target_steps;
    if (constraints_.has_limits && !constraints_.limits.contains(target)) {
        const int64_t bound = constraints_.limits.nearestBound(target);
        if (constraints_.limits.policy == LIMIT_POLICY_REJECT) {
            if (violation) {
                violation->requested = target;
                violation->limit = bound;
            }
            ESP_LOGW(TAG, "[%s] Target %lld outside limits [%lld, %lld]",
                     name_.c_str(), (long long)target,
                     (long long)constraints_.limits.min_steps,
                     (long long)constraints_.limits.max_steps);
            return STEPPER_ERR_LIMIT_EXCEEDED;
        }
        ESP_LOGW(TAG, "[%s] Target %lld clamped to %lld", name_.c_str(), (long long)target, (long long)bound);
        target = bound;
    }

    // Committed positions stay between position_ and target once delta fits
    int64_t delta = 0;
    if (__builtin_sub_overflow(target, position_, &delta)) {
        ESP_LOGE(TAG, "[%s] Move %lld -> %lld overflows the step counter",
                 name_.c_str(), (long long)position_, (long long)target);
        return STEPPER_ERR_INVALID_PROFILE;
    }

    const MoveRates effective = constraints_.clampRates(rates);
    MotionProfile profile;
    esp_err_t err = MotionProfile::plan(delta,
                                        effective.velocity,
                                        effective.acceleration,
                                        effective.deceleration,
                                        &profile);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "[%s] Cannot plan move to %lld: %s",
                 name_.c_str(), (long long)target, stepper_motion_err_to_name(err));
        return err;
    }

    if (profile.isZero()) {
        ESP_LOGD(TAG, "[%s] Already at %lld", name_.c_str(), (long long)target);
        return ESP_OK;
    }

    sequencer_ = StepSequencer(profile);
    pending_backlash_ = (has_travelled_ && profile.direction() != last_travel_) ? backlash_steps_ : 0;

    ESP_LOGI(TAG, "[%s] Move %lld -> %lld (%lld steps, peak %.1f steps/s, ~%.2f s)",
             name_.c_str(), (long long)position_, (long long)target,
             (long long)profile.totalSteps(), profile.peakVelocity(),
             profile.estimatedDurationSec());
    transitionTo(MOTOR_STATE_MOVING);
    return ESP_OK;
}

esp_err_t StepperMotor::moveBy(int64_t relative_steps, LimitViolation* violation) {
    int64_t target = 0;
    if (__builtin_add_overflow(position_, relative_steps, &target)) {
        ESP_LOGE(TAG, "[%s] Relative move of %lld from %lld overflows the step counter",
                 name_.c_str(), (long long)relative_steps, (long long)position_);
        return STEPPER_ERR_INVALID_PROFILE;
    }
    return moveTo(target, violation);
}

esp_err_t StepperMotor::moveToDegrees(float degrees, LimitViolation* violation) {
    if (!std::isfinite(degrees)) {
        return ESP_ERR_INVALID_ARG;
    }
    return moveTo(constraints_.degreesToSteps(degrees), violation);
}

esp_err_t StepperMotor::moveByDegrees(float degrees, LimitViolation* violation) {
    if (!std::isfinite(degrees)) {
        return ESP_ERR_INVALID_ARG;
    }
    return moveBy(constraints_.degreesToSteps(degrees), violation);
}

esp_err_t StepperMotor::moveWithTrajectory(const trajectory_config_t& trajectory, LimitViolation* violation) {
    if (trajectory.motor != nullptr && name_ != trajectory.motor) {
        ESP_LOGW(TAG, "[%s] Trajectory belongs to motor '%s'", name_.c_str(), trajectory.motor);
        return ESP_ERR_INVALID_ARG;
    }
    if (!std::isfinite(trajectory.target_degrees)) {
        return ESP_ERR_INVALID_ARG;
    }
    return moveTo(constraints_.degreesToSteps(trajectory.target_degrees),
                  constraints_.trajectoryRates(trajectory),
                  violation);
}

esp_err_t StepperMotor::executeTrajectory(const char* trajectory_name,
                                          const TrajectoryRegistry& registry,
                                          LimitViolation* violation) {
    trajectory_config_t trajectory;
    esp_err_t err = registry.get(trajectory_name, &trajectory);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "[%s] Trajectory '%s' not available: %s",
                 name_.c_str(), trajectory_name ? trajectory_name : "(null)",
                 stepper_motion_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "[%s] Executing trajectory '%s'", name_.c_str(), trajectory_name);
    return moveWithTrajectory(trajectory, violation);
}

esp_err_t StepperMotor::executeSequence(const waypoint_trajectory_t& sequence, LimitViolation* violation) {
    if (!isInitialized() || state_ != MOTOR_STATE_IDLE) {
        ESP_LOGW(TAG, "[%s] Sequence refused in state %s", name_.c_str(), state_names[state_]);
        return ESP_ERR_INVALID_STATE;
    }
    if (sequence.motor != nullptr && name_ != sequence.motor) {
        ESP_LOGW(TAG, "[%s] Sequence belongs to motor '%s'", name_.c_str(), sequence.motor);
        return ESP_ERR_INVALID_ARG;
    }
    if (sequence.waypoint_count == 0 || sequence.waypoint_count > MOTION_CONFIG_MAX_WAYPOINTS ||
        sequence.velocity_percent < MOTION_CONFIG_MIN_PERCENT ||
        sequence.velocity_percent > MOTION_CONFIG_MAX_PERCENT) {
        ESP_LOGW(TAG, "[%s] Malformed sequence (%u waypoints, %u%%)", name_.c_str(),
                 (unsigned)sequence.waypoint_count, (unsigned)sequence.velocity_percent);
        return ESP_ERR_INVALID_ARG;
    }
    for (uint8_t i = 0; i < sequence.waypoint_count; i++) {
        if (!std::isfinite(sequence.waypoints_degrees[i])) {
            return ESP_ERR_INVALID_ARG;
        }
    }

    if (constraints_.has_limits && constraints_.limits.policy == LIMIT_POLICY_REJECT) {
        for (uint8_t i = 0; i < sequence.waypoint_count; i++) {
            const int64_t target = constraints_.degreesToSteps(sequence.waypoints_degrees[i]);
            if (!constraints_.limits.contains(target)) {
                if (violation) {
                    violation->requested = target;
                    violation->limit = constraints_.limits.nearestBound(target);
                }
                ESP_LOGW(TAG, "[%s] Waypoint %u (%lld steps) outside limits, sequence refused",
                         name_.c_str(), (unsigned)i, (long long)target);
                return STEPPER_ERR_LIMIT_EXCEEDED;
            }
        }
    }

    trajectory_config_t leg = motion_config_default_trajectory();
    leg.velocity_percent = sequence.velocity_percent;

    for (uint8_t i = 0; i < sequence.waypoint_count; i++) {
        leg.target_degrees = sequence.waypoints_degrees[i];
        ESP_LOGD(TAG, "[%s] Waypoint %u/%u: %.2f deg", name_.c_str(),
                 (unsigned)(i + 1), (unsigned)sequence.waypoint_count, leg.target_degrees);

        esp_err_t err = moveWithTrajectory(leg, violation);
        if (err == ESP_OK) {
            err = runToCompletion();
        }
        if (err == ESP_OK) {
            err = dwell(sequence.dwell_ms);
        }
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "[%s] Sequence stopped at waypoint %u: %s",
                     name_.c_str(), (unsigned)i, stepper_motion_err_to_name(err));
            return err;
        }
    }

    ESP_LOGI(TAG, "[%s] Sequence complete at %.2f deg", name_.c_str(), positionDegrees());
    return ESP_OK;
}

esp_err_t StepperMotor::executeSequence(const char* sequence_name,
                                        const SequenceRegistry& registry,
                                        LimitViolation* violation) {
    const waypoint_trajectory_t* sequence = registry.find(sequence_name);
    if (sequence == nullptr) {
        ESP_LOGW(TAG, "[%s] Sequence '%s' not registered",
                 name_.c_str(), sequence_name ? sequence_name : "(null)");
        return STEPPER_ERR_TRAJECTORY_NOT_FOUND;
    }
    ESP_LOGI(TAG, "[%s] Executing sequence '%s'", name_.c_str(), sequence_name);
    return executeSequence(*sequence, violation);
}

esp_err_t StepperMotor::dwell(uint32_t ms) {
    // delayNs() takes at most ~4.29 s per call
    static constexpr uint32_t CHUNK_MS = 1000;
    while (ms > 0) {
        const uint32_t chunk = ms < CHUNK_MS ? ms : CHUNK_MS;
        esp_err_t err = delay_->delayNs(chunk * 1000000UL);
        if (err != ESP_OK) {
            enterFault(err);
            return STEPPER_ERR_HARDWARE;
        }
        ms -= chunk;
    }
    return ESP_OK;
}

esp_err_t StepperMotor::applyDirection(StepDirection direction) {
    if (dir_written_ && dir_level_ == direction) {
        return ESP_OK;
    }
    const bool level = (direction == StepDirection::Forward) != invert_direction_;
    esp_err_t err = dir_pin_->setLevel(level);
    if (err != ESP_OK) {
        dir_written_ = false;
        return err;
    }
    dir_written_ = true;
    dir_level_ = direction;
    return ESP_OK;
}

esp_err_t StepperMotor::pulse(StepDirection direction, uint32_t interval_ns) {
    esp_err_t err = applyDirection(direction);
    if (err != ESP_OK) {
        return err;
    }
    err = step_pin_->setLevel(true);
    if (err != ESP_OK) {
        return err;
    }
    err = delay_->delayNs(interval_ns);

    // STEP must not be left high, even when the delay failed
    esp_err_t low_err = step_pin_->setLevel(false);
    return err != ESP_OK ? err : low_err;
}

esp_err_t StepperMotor::takeUpBacklash(StepDirection direction) {
    const uint32_t interval_ns = sequencer_.startIntervalNs();
    ESP_LOGD(TAG, "[%s] Backlash take-up: %lu pulses", name_.c_str(), (unsigned long)pending_backlash_);
    while (pending_backlash_ > 0) {
        esp_err_t err = pulse(direction, interval_ns);
        if (err != ESP_OK) {
            return err;
        }
        pending_backlash_--;
    }
    return ESP_OK;
}

void StepperMotor::enterFault(esp_err_t cause) {
    ESP_LOGE(TAG, "[%s] Hardware error at position %lld: %s",
             name_.c_str(), (long long)position_, esp_err_to_name(cause));
    resetMotion();
    fault_cause_ = cause;
    transitionTo(MOTOR_STATE_FAULT);
}

void StepperMotor::resetMotion() {
    sequencer_ = StepSequencer();
    pending_backlash_ = 0;
}

void StepperMotor::finishMove() {
    resetMotion();
    ESP_LOGI(TAG, "[%s] Move complete at %lld steps (%.2f deg)",
             name_.c_str(), (long long)position_, positionDegrees());
    transitionTo(MOTOR_STATE_IDLE);
}

esp_err_t StepperMotor::step(bool* more) {
    if (more) {
        *more = false;
    }
    if (state_ != MOTOR_STATE_MOVING) {
        ESP_LOGW(TAG, "[%s] step() called in state %s", name_.c_str(), state_names[state_]);
        return ESP_ERR_INVALID_STATE;
    }

    StepTiming timing;
    if (!sequencer_.next(&timing)) {
        finishMove();
        return ESP_OK;
    }

    esp_err_t err = ESP_OK;
    if (pending_backlash_ > 0) {
        err = takeUpBacklash(timing.direction);
    }
    if (err == ESP_OK) {
        err = pulse(timing.direction, timing.interval_ns);
    }
    if (err != ESP_OK) {
        enterFault(err);
        return STEPPER_ERR_HARDWARE;
    }

    // Commit only after the pulse completed, stays between the move start and target
    position_ += (timing.direction == StepDirection::Forward) ? 1 : -1;
    has_travelled_ = true;
    last_travel_ = timing.direction;

    if (sequencer_.isComplete()) {
        finishMove();
    } else if (more) {
        *more = true;
    }
    return ESP_OK;
}

esp_err_t StepperMotor::runToCompletion() {
    if (state_ == MOTOR_STATE_IDLE) {
        return ESP_OK;
    }
    if (state_ != MOTOR_STATE_MOVING) {
        ESP_LOGW(TAG, "[%s] Cannot run in state %s", name_.c_str(), state_names[state_]);
        return ESP_ERR_INVALID_STATE;
    }
    bool more = true;
    while (more) {
        esp_err_t err = step(&more);
        if (err != ESP_OK) {
            return err;
        }
    }
    return ESP_OK;
}

esp_err_t StepperMotor::emergencyStop() {
    if (state_ != MOTOR_STATE_MOVING) {
        ESP_LOGW(TAG, "[%s] Emergency stop ignored in state %s", name_.c_str(), state_names[state_]);
        return ESP_ERR_INVALID_STATE;
    }
    ESP_LOGW(TAG, "[%s] Emergency stop at %lld steps, %llu steps abandoned",
             name_.c_str(), (long long)position_, (unsigned long long)sequencer_.remaining());
    resetMotion();
    transitionTo(MOTOR_STATE_IDLE);
    return ESP_OK;
}

esp_err_t StepperMotor::reset() {
    if (state_ != MOTOR_STATE_FAULT) {
        ESP_LOGW(TAG, "[%s] reset() called in state %s", name_.c_str(), state_names[state_]);
        return ESP_ERR_INVALID_STATE;
    }
    ESP_LOGI(TAG, "[%s] Clearing fault (%s), position %lld kept",
             name_.c_str(), esp_err_to_name(fault_cause_), (long long)position_);
    fault_cause_ = ESP_OK;
    // DIR level is unknown after a failed write
    dir_written_ = false;
    transitionTo(MOTOR_STATE_IDLE);
    return ESP_OK;
}

esp_err_t StepperMotor::setOrigin() {
    return setPosition(0);
}

esp_err_t StepperMotor::setPosition(int64_t steps) {
    if (state_ != MOTOR_STATE_IDLE) {
        ESP_LOGW(TAG, "[%s] Position can only be set while IDLE", name_.c_str());
        return ESP_ERR_INVALID_STATE;
    }
    ESP_LOGI(TAG, "[%s] Position %lld -> %lld", name_.c_str(), (long long)position_, (long long)steps);
    position_ = steps;
    return ESP_OK;
}

bool StepperMotor::atLimit() const {
    if (!constraints_.has_limits) {
        return false;
    }
    return position_ <= constraints_.limits.min_steps || position_ >= constraints_.limits.max_steps;
}

float StepperMotor::progress() const {
    if (state_ != MOTOR_STATE_MOVING) {
        return 0.0f;
    }
    return sequencer_.progress();
}

MotionPhase StepperMotor::phase() const {
    if (state_ != MOTOR_STATE_MOVING) {
        return MotionPhase::Complete;
    }
    return sequencer_.phase();
}
