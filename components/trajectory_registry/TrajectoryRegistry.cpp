/**
 * @file TrajectoryRegistry.cpp
 * @brief Implementation of the trajectory registry
 */

#include "TrajectoryRegistry.hpp"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <cstring>

static const char *TAG = "TrajectoryRegistry";

bool trajectory_name_is_valid(const char* name) {
    if (name == nullptr || name[0] == '\0') {
        return false;
    }
    return strnlen(name, TRAJECTORY_NAME_MAX_LEN + 1) <= TRAJECTORY_NAME_MAX_LEN;
}

TrajectoryRegistry::TrajectoryRegistry() :
    count_(0)
{
    memset(entries_, 0, sizeof(entries_));
}

const TrajectoryRegistry::Entry* TrajectoryRegistry::findEntry(const char* name) const {
    if (name == nullptr) {
        return nullptr;
    }
    for (size_t i = 0; i < count_; i++) {
        if (strcmp(entries_[i].name, name) == 0) {
            return &entries_[i];
        }
    }
    return nullptr;
}

esp_err_t TrajectoryRegistry::add(const char* name, const trajectory_config_t& trajectory) {
    if (!trajectory_name_is_valid(name)) {
        ESP_LOGE(TAG, "Invalid trajectory name");
        return ESP_ERR_INVALID_ARG;
    }
    if (trajectory.motor != nullptr && !trajectory_name_is_valid(trajectory.motor)) {
        ESP_LOGE(TAG, "Trajectory '%s': invalid motor name", name);
        return ESP_ERR_INVALID_ARG;
    }
    if (findEntry(name) != nullptr) {
        ESP_LOGE(TAG, "Trajectory '%s' already registered", name);
        return ESP_ERR_INVALID_ARG;
    }
    if (isFull()) {
        ESP_LOGE(TAG, "Registry full (%d entries), cannot add '%s'", TRAJECTORY_REGISTRY_CAPACITY, name);
        return ESP_ERR_NO_MEM;
    }

    Entry& entry = entries_[count_];
    memset(&entry, 0, sizeof(entry));
    strncpy(entry.name, name, TRAJECTORY_NAME_MAX_LEN);
    entry.config = trajectory;
    if (trajectory.motor != nullptr) {
        strncpy(entry.motor, trajectory.motor, TRAJECTORY_NAME_MAX_LEN);
        entry.config.motor = entry.motor;
    }
    count_++;

    ESP_LOGI(TAG, "Registered '%s' for motor '%s' (target %.2f deg)",
             name, trajectory.motor ? trajectory.motor : "any", trajectory.target_degrees);
    return ESP_OK;
}

const trajectory_config_t* TrajectoryRegistry::find(const char* name) const {
    const Entry* entry = findEntry(name);
    return entry ? &entry->config : nullptr;
}

esp_err_t TrajectoryRegistry::get(const char* name, trajectory_config_t* out) const {
    if (out == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    const Entry* entry = findEntry(name);
    if (entry == nullptr) {
        return STEPPER_ERR_TRAJECTORY_NOT_FOUND;
    }
    *out = entry->config;
    return ESP_OK;
}

esp_err_t TrajectoryRegistry::remove(const char* name) {
    const Entry* found = findEntry(name);
    if (found == nullptr) {
        return STEPPER_ERR_TRAJECTORY_NOT_FOUND;
    }

    // Keep entries packed in insertion order
    size_t index = static_cast<size_t>(found - entries_);
    for (size_t i = index; i + 1 < count_; i++) {
        entries_[i] = entries_[i + 1];
        if (entries_[i].config.motor != nullptr) {
            entries_[i].config.motor = entries_[i].motor;
        }
    }
    count_--;
    memset(&entries_[count_], 0, sizeof(Entry));

    ESP_LOGI(TAG, "Removed '%s'", name);
    return ESP_OK;
}

void TrajectoryRegistry::clear() {
    memset(entries_, 0, sizeof(entries_));
    count_ = 0;
}

const char* TrajectoryRegistry::nameAt(size_t index) const {
    if (index >= count_) {
        return nullptr;
    }
    return entries_[index].name;
}
