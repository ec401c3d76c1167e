/**
 * @file SequenceRegistry.hpp
 * @brief Fixed-capacity name -> waypoint trajectory lookup
 *
 * Same storage rules as TrajectoryRegistry: names, records and the motor
 * name are copied in, nothing is allocated.
 */

#ifndef SEQUENCE_REGISTRY_HPP
#define SEQUENCE_REGISTRY_HPP

#include "TrajectoryRegistry.hpp"
#include "motion_config.h"
#include "esp_err.h"
#include <cstddef>

#define SEQUENCE_REGISTRY_CAPACITY      16

class SequenceRegistry {
private:
    struct Entry {
        char name[TRAJECTORY_NAME_MAX_LEN + 1];
        char motor[TRAJECTORY_NAME_MAX_LEN + 1];
        waypoint_trajectory_t sequence;
    };

    Entry entries_[SEQUENCE_REGISTRY_CAPACITY];
    size_t count_;

    const Entry* findEntry(const char* name) const;

public:
    SequenceRegistry();

    SequenceRegistry(const SequenceRegistry&) = delete;
    SequenceRegistry& operator=(const SequenceRegistry&) = delete;

    /**
     * @brief Register a sequence under a unique name
     *
     * @return ESP_OK, ESP_ERR_INVALID_ARG for a bad or duplicate name or a
     *         sequence without waypoints, ESP_ERR_NO_MEM when full
     */
    esp_err_t add(const char* name, const waypoint_trajectory_t& sequence);

    const waypoint_trajectory_t* find(const char* name) const;

    /**
     * @brief Copy a sequence by name
     * @return ESP_OK or STEPPER_ERR_TRAJECTORY_NOT_FOUND
     */
    esp_err_t get(const char* name, waypoint_trajectory_t* out) const;

    bool contains(const char* name) const { return findEntry(name) != nullptr; }
    esp_err_t remove(const char* name);

    size_t size() const { return count_; }
    bool isFull() const { return count_ >= SEQUENCE_REGISTRY_CAPACITY; }
    void clear();
    const char* nameAt(size_t index) const;
};

#endif // SEQUENCE_REGISTRY_HPP
