/**
 * @file SequenceRegistry.cpp
 * @brief Implementation of the waypoint sequence registry
 */

#include "SequenceRegistry.hpp"
#include "stepper_motion_err.h"
#include "esp_log.h"
#include <cstring>

static const char *TAG = "SequenceRegistry";

SequenceRegistry::SequenceRegistry() :
    count_(0)
{
    memset(entries_, 0, sizeof(entries_));
}

const SequenceRegistry::Entry* SequenceRegistry::findEntry(const char* name) const {
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

esp_err_t SequenceRegistry::add(const char* name, const waypoint_trajectory_t& sequence) {
    if (!trajectory_name_is_valid(name)) {
        ESP_LOGE(TAG, "Invalid sequence name");
        return ESP_ERR_INVALID_ARG;
    }
    if (sequence.motor != nullptr && !trajectory_name_is_valid(sequence.motor)) {
        ESP_LOGE(TAG, "Sequence '%s': invalid motor name", name);
        return ESP_ERR_INVALID_ARG;
    }
    if (sequence.waypoint_count == 0 || sequence.waypoint_count > MOTION_CONFIG_MAX_WAYPOINTS) {
        ESP_LOGE(TAG, "Sequence '%s': %u waypoints, need 1..%d",
                 name, (unsigned)sequence.waypoint_count, MOTION_CONFIG_MAX_WAYPOINTS);
        return ESP_ERR_INVALID_ARG;
    }
    if (findEntry(name) != nullptr) {
        ESP_LOGE(TAG, "Sequence '%s' already registered", name);
        return ESP_ERR_INVALID_ARG;
    }
    if (isFull()) {
        ESP_LOGE(TAG, "Registry full (%d entries), cannot add '%s'", SEQUENCE_REGISTRY_CAPACITY, name);
        return ESP_ERR_NO_MEM;
    }

    Entry& entry = entries_[count_];
    memset(&entry, 0, sizeof(entry));
    strncpy(entry.name, name, TRAJECTORY_NAME_MAX_LEN);
    entry.sequence = sequence;
    if (sequence.motor != nullptr) {
        strncpy(entry.motor, sequence.motor, TRAJECTORY_NAME_MAX_LEN);
        entry.sequence.motor = entry.motor;
    }
    count_++;

    ESP_LOGI(TAG, "Registered '%s' for motor '%s' (%u waypoints, dwell %lu ms)",
             name, sequence.motor ? sequence.motor : "any",
             (unsigned)sequence.waypoint_count, (unsigned long)sequence.dwell_ms);
    return ESP_OK;
}

const waypoint_trajectory_t* SequenceRegistry::find(const char* name) const {
    const Entry* entry = findEntry(name);
    return entry ? &entry->sequence : nullptr;
}

esp_err_t SequenceRegistry::get(const char* name, waypoint_trajectory_t* out) const {
    if (out == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    const Entry* entry = findEntry(name);
    if (entry == nullptr) {
        return STEPPER_ERR_TRAJECTORY_NOT_FOUND;
    }
    *out = entry->sequence;
    return ESP_OK;
}

esp_err_t SequenceRegistry::remove(const char* name) {
    const Entry* found = findEntry(name);
    if (found == nullptr) {
        return STEPPER_ERR_TRAJECTORY_NOT_FOUND;
    }

    size_t index = static_cast<size_t>(found - entries_);
    for (size_t i = index; i + 1 < count_; i++) {
        entries_[i] = entries_[i + 1];
        if (entries_[i].sequence.motor != nullptr) {
            entries_[i].sequence.motor = entries_[i].motor;
        }
    }
    count_--;
    memset(&entries_[count_], 0, sizeof(Entry));

    ESP_LOGI(TAG, "Removed '%s'", name);
    return ESP_OK;
}

void SequenceRegistry::clear() {
    memset(entries_, 0, sizeof(entries_));
    count_ = 0;
}

const char* SequenceRegistry::nameAt(size_t index) const {
    if (index >= count_) {
        return nullptr;
    }
    return entries_[index].name;
}
