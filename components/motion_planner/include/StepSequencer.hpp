/**
 * @file StepSequencer.hpp
 * @brief Lazy per-step timing for a planned move
 *
 * Produces one (direction, interval) item per physical step, computed on
 * demand from the step index. Holds only scalars, so it never allocates
 * and its timing does not drift over long moves.
 */

#ifndef STEP_SEQUENCER_HPP
#define STEP_SEQUENCER_HPP

#include "MotionProfile.hpp"
#include <cstdint>

/**
 * @brief Timing of a single step
 */
struct StepTiming {
    StepDirection direction;
    uint32_t interval_ns;
};

class StepSequencer {
public:
    /**
     * @brief Exhausted sequencer (no steps)
     */
    StepSequencer() = default;

    explicit StepSequencer(const MotionProfile& profile);

    /**
     * @brief Produce the next step
     *
     * @param item Receives the step timing
     * @return true if an item was produced, false once the move is exhausted
     */
    bool next(StepTiming* item);

    bool isComplete() const { return emitted_ >= total_; }
    uint64_t emitted() const { return emitted_; }
    uint64_t remaining() const { return total_ - emitted_; }

    /**
     * @brief Phase of the next step to be produced
     */
    MotionPhase phase() const { return profile_.phaseAt(emitted_); }

    /**
     * @brief Fraction of steps produced, 1.0 for an empty move
     */
    float progress() const;

    /**
     * @brief Interval of the first (slowest) acceleration step
     */
    uint32_t startIntervalNs() const;

    const MotionProfile& profile() const { return profile_; }

    /**
     * @brief Interval for a velocity in steps/s, rounded to whole nanoseconds
     */
    static uint32_t intervalForVelocity(double steps_per_sec);

private:
    uint32_t intervalAt(uint64_t index) const;

    MotionProfile profile_;
    uint64_t total_ = 0;
    uint64_t emitted_ = 0;
    uint32_t cruise_interval_ns_ = 0;
};

#endif // STEP_SEQUENCER_HPP
