/**
 * @file TrajectoryRegistry.hpp
 * @brief Fixed-capacity name -> trajectory record lookup
 *
 * Names and records are copied in, the registry never allocates.
 * The motor name pointer inside a stored record is redirected to the
 * registry's own copy of that string.
 */

#ifndef TRAJECTORY_REGISTRY_HPP
#define TRAJECTORY_REGISTRY_HPP

#include "motion_config.h"
#include "esp_err.h"
#include <cstddef>

#define TRAJECTORY_REGISTRY_CAPACITY    32
#define TRAJECTORY_NAME_MAX_LEN         31

/**
 * @brief Non-empty and at most TRAJECTORY_NAME_MAX_LEN characters
 */
bool trajectory_name_is_valid(const char* name);

class TrajectoryRegistry {
private:
    struct Entry {
        char name[TRAJECTORY_NAME_MAX_LEN + 1];
        char motor[TRAJECTORY_NAME_MAX_LEN + 1];
        trajectory_config_t config;
    };

    Entry entries_[TRAJECTORY_REGISTRY_CAPACITY];
    size_t count_;

    const Entry* findEntry(const char* name) const;

public:
    TrajectoryRegistry();

    // Stored records point into the registry's own storage
    TrajectoryRegistry(const TrajectoryRegistry&) = delete;
    TrajectoryRegistry& operator=(const TrajectoryRegistry&) = delete;

    /**
     * @brief Register a trajectory under a unique name
     *
     * @return ESP_OK, ESP_ERR_INVALID_ARG for an empty, too long or
     *         duplicate name (or a too long motor name), ESP_ERR_NO_MEM when full
     */
    esp_err_t add(const char* name, const trajectory_config_t& trajectory);

    /**
     * @brief Find a trajectory by name
     * @return Pointer to the stored record, nullptr if unknown
     */
    const trajectory_config_t* find(const char* name) const;

    /**
     * @brief Copy a trajectory by name
     * @return ESP_OK or STEPPER_ERR_TRAJECTORY_NOT_FOUND
     */
    esp_err_t get(const char* name, trajectory_config_t* out) const;

    bool contains(const char* name) const { return findEntry(name) != nullptr; }

    /**
     * @brief Remove a trajectory
     * @return ESP_OK or STEPPER_ERR_TRAJECTORY_NOT_FOUND
     */
    esp_err_t remove(const char* name);

    size_t size() const { return count_; }
    bool isFull() const { return count_ >= TRAJECTORY_REGISTRY_CAPACITY; }
    void clear();

    /**
     * @brief Name of the index-th registered trajectory, in insertion order
     * @return nullptr if index >= size()
     */
    const char* nameAt(size_t index) const;
};

#endif // TRAJECTORY_REGISTRY_HPP
