/**
 * @file ControlTypes.h
 * @brief Shared type definitions for the fan control system
 *
 * This header contains types that are shared across the control modules
 * (ControlLoop, EmergencyOverride, the sensor and fan drivers) to avoid
 * circular dependencies and clarify ownership.
 */

#ifndef CONTROL_TYPES_H
#define CONTROL_TYPES_H

#include "LearningTypes.h"
#include <cstddef>

/**
 * @brief State machine states for ControlLoop
 */
enum class ControlState {
    IDLE,         // Constructed, begin() not run yet
    SAMPLING,     // Reading both zones
    DECIDING,     // Override check, then policy
    ACTUATING,    // Writing fan duties
    LEARNING,     // Reward + Q update
    PERSISTING,   // Periodic Q-table save
    SLEEPING,     // Waiting for the next cycle
    SHUTTING_DOWN // Terminal: final save done, fans at max
};

/**
 * @brief Convert ControlState to display string
 */
inline const char *stateToString(ControlState state) {
    switch (state) {
    case ControlState::IDLE:
        return "IDLE";
    case ControlState::SAMPLING:
        return "SAMPLE";
    case ControlState::DECIDING:
        return "DECIDE";
    case ControlState::ACTUATING:
        return "ACTUATE";
    case ControlState::LEARNING:
        return "LEARN";
    case ControlState::PERSISTING:
        return "SAVE";
    case ControlState::SLEEPING:
        return "SLEEP";
    case ControlState::SHUTTING_DOWN:
        return "STOPPED";
    default:
        return "???";
    }
}

/**
 * @brief Fan output groups
 */
enum class FanGroup { RADIATOR, STORAGE };

inline const char *fanGroupToString(FanGroup group) {
    return group == FanGroup::RADIATOR ? "radiator" : "storage";
}

/**
 * @brief Outcome of a sampler read
 */
enum class SampleStatus {
    OK,
    UNAVAILABLE, // Probe missing or in error
    STALE,       // Last good reading older than the sample timeout
    IMPLAUSIBLE  // Outside the sanity window
};

inline const char *sampleStatusToString(SampleStatus status) {
    switch (status) {
    case SampleStatus::OK:
        return "OK";
    case SampleStatus::UNAVAILABLE:
        return "unavailable";
    case SampleStatus::STALE:
        return "stale";
    case SampleStatus::IMPLAUSIBLE:
        return "implausible";
    default:
        return "???";
    }
}

/**
 * @brief Outcome of a fan duty write
 */
enum class ActuationStatus {
    OK,
    NOT_READY,    // Output never initialized
    OUT_OF_RANGE, // Duty outside 0..100
    HARDWARE_ERROR
};

inline const char *actuationStatusToString(ActuationStatus status) {
    switch (status) {
    case ActuationStatus::OK:
        return "OK";
    case ActuationStatus::NOT_READY:
        return "not ready";
    case ActuationStatus::OUT_OF_RANGE:
        return "out of range";
    case ActuationStatus::HARDWARE_ERROR:
        return "hardware error";
    default:
        return "???";
    }
}

/**
 * @brief Outcome of a Q-table load or save
 */
enum class PersistStatus {
    OK,
    NOT_FOUND, // Nothing saved yet (load only)
    CORRUPT,   // File present but unreadable (load only)
    IO_ERROR   // Filesystem unavailable or write/rename failed
};

inline const char *persistStatusToString(PersistStatus status) {
    switch (status) {
    case PersistStatus::OK:
        return "OK";
    case PersistStatus::NOT_FOUND:
        return "not found";
    case PersistStatus::CORRUPT:
        return "corrupt";
    case PersistStatus::IO_ERROR:
        return "I/O error";
    default:
        return "???";
    }
}

/**
 * @brief Which transition rule the learner uses
 */
enum class NextStateMode {
    NEXT_STATE,     // Update (s, a) once the following state is observed
    SELF_TRANSITION // Update (s, a) immediately with s as its own successor
};

/**
 * @brief One timestamped zone reading
 */
struct TemperatureSample {
    float value;
    unsigned long timestamp; // millis()
};

constexpr size_t MAX_DEVICE_ID_LEN = 12;
constexpr size_t MAX_STORAGE_DEVICES = 8;

/**
 * @brief One storage probe reading
 */
struct StorageReading {
    char device_id[MAX_DEVICE_ID_LEN];
    float value;
};

/**
 * @brief Everything recorded about one completed control cycle
 */
struct CycleTelemetry {
    unsigned long cycle;
    float radiator_mean;
    float storage_mean;
    State state;
    Action action;
    bool has_reward; // false when no transition was learned this cycle
    float reward;
    Action rewarded_action; // Action the reward was credited to
    float epsilon;
    size_t q_states;
    bool override_active;
    bool actuation_ok;
};

#endif // CONTROL_TYPES_H
