/**
 * @file ControlLoop.cpp
 * @brief Implementation of the adaptive fan control cycle
 */

#include "ControlLoop.h"
#include "ControlConstants.h"
#include <cstdio>
#include <cstring>

ControlLoop::ControlLoop(Logger &logger, const ControllerConfig &config,
                         const ControlPorts &ports, RandomSource &rng)
    : _logger(logger), _config(config), _ports(ports),
      _actions(_config.radiator_fans, _config.storage_fans),
      _encoder(_config.bucket_step), _reward(_config.reward),
      _history(_config.history_length),
      _qtable(_config.learning.alpha, _config.learning.gamma),
      _policy(_qtable, _actions, rng, _config.learning),
      _override(logger, ports.notifier, _config.emergency,
                _actions.maxAction()),
      _state(ControlState::IDLE), _pending{false, {0, 0}, {0, 0}},
      _last_action(_actions.maxAction()), _cycle_start(0),
      _sleep_ms(_config.timing.interval_ms), _cycle_due(false),
      _cycle_count(0), _cycles_since_save(0), _consecutive_sample_failures(0),
      _consecutive_actuation_failures(0), _sensor_failsafe(false),
      _table_full_warned(false), _shutdown_requested(false) {
    _stop_reason[0] = '\0';
}

// =============================================================================
// Lifecycle
// =============================================================================

bool ControlLoop::begin(unsigned long now) {
    char reason[48];
    if (!_config.validate(reason, sizeof(reason))) {
        _logger.logf(false, "CONFIG ERROR: %s", reason);
        _ports.notifier.notify("Fan controller not started", reason);
        transitionTo(ControlState::SHUTTING_DOWN, "config error");
        snprintf(_stop_reason, sizeof(_stop_reason), "config: %s", reason);
        return false;
    }

    loadTable();
    registerDisplayLines();

    _cycle_start = now;
    _cycle_due = true;
    transitionTo(ControlState::SLEEPING, "started");

    char summary[96];
    snprintf(summary, sizeof(summary),
             "%u actions, %u states restored, eps %.3f, %s updates",
             static_cast<unsigned>(_actions.size()),
             static_cast<unsigned>(_qtable.stateCount()), _policy.epsilon(),
             _config.next_state_mode == NextStateMode::NEXT_STATE ? "next-state"
                                                                  : "self");
    _logger.logf(false, "CL: %s", summary);
    _ports.notifier.notify("Fan controller started", summary);
    return true;
}

void ControlLoop::loadTable() {
    if (_config.reset_qtable) {
        _qtable.clear();
        _logger.log("Q-table reset requested, starting empty");
        return;
    }

    PersistStatus status = _ports.storage.load(_qtable);
    switch (status) {
    case PersistStatus::OK:
        _logger.logf("Q-table loaded: %u states, %u entries",
                     static_cast<unsigned>(_qtable.stateCount()),
                     static_cast<unsigned>(_qtable.entryCount()));
        break;
    case PersistStatus::NOT_FOUND:
        _qtable.clear();
        _logger.log("No saved Q-table, starting fresh");
        break;
    default:
        _qtable.clear();
        _logger.logf(false, "WARN: Q-table load failed (%s), starting fresh",
                     persistStatusToString(status));
        break;
    }
}

void ControlLoop::registerDisplayLines() {
    char label[MAX_LINE_LABEL_LEN];
    Logger::formatLabel(label, sizeof(label), Labels::STATE);
    _logger.registerTextLine(LineId::STATE, label, stateToString(_state));
    Logger::formatLabel(label, sizeof(label), Labels::RADIATOR);
    _logger.registerLine(LineId::RADIATOR, label, Units::TEMP, 0.0f);
    Logger::formatLabel(label, sizeof(label), Labels::STORAGE);
    _logger.registerLine(LineId::STORAGE, label, Units::TEMP, 0.0f);
    Logger::formatLabel(label, sizeof(label), Labels::FANS);
    _logger.registerTextLine(LineId::FANS, label, "-");
    Logger::formatLabel(label, sizeof(label), Labels::EPSILON);
    _logger.registerLine(LineId::EPSILON, label, "", _policy.epsilon());
    Logger::formatLabel(label, sizeof(label), Labels::REWARD);
    _logger.registerTextLine(LineId::REWARD, label, "-");
    Logger::formatLabel(label, sizeof(label), Labels::QSTATES);
    _logger.registerTextLine(LineId::QSTATES, label, "0");
}

void ControlLoop::requestShutdown(const char *reason) {
    if (isStopped() || _shutdown_requested)
        return;
    _shutdown_requested = true;
    snprintf(_stop_reason, sizeof(_stop_reason), "%s",
             reason != nullptr ? reason : "requested");
}

void ControlLoop::fail(const char *reason) { shutdown(reason, true); }

void ControlLoop::update(unsigned long now) {
    if (isStopped() || _state == ControlState::IDLE)
        return;

    if (_shutdown_requested) {
        char reason[sizeof(_stop_reason)];
        memcpy(reason, _stop_reason, sizeof(reason));
        shutdown(reason, false);
        return;
    }

    if (!_cycle_due && now - _cycle_start < _sleep_ms)
        return;

    _cycle_due = false;
    runCycle(now);
}

void ControlLoop::transitionTo(ControlState state, const char *reason) {
    if (state == _state)
        return;
    if (reason != nullptr) {
        _logger.logf(false, "CL: -> %s (%s)", stateToString(state), reason);
    }
    _state = state;
    _logger.updateLineText(LineId::STATE, stateToString(state));
}

// =============================================================================
// Control cycle
// =============================================================================

void ControlLoop::runCycle(unsigned long now) {
    _cycle_start = now;

    transitionTo(ControlState::SAMPLING);
    float radiator_now = 0.0f;
    float storage_now = 0.0f;
    if (!sample(radiator_now, storage_now)) {
        _sleep_ms = _config.timing.retry_interval_ms;
        transitionTo(ControlState::SLEEPING);
        return;
    }

    _history.push(Zone::RADIATOR, radiator_now);
    _history.push(Zone::STORAGE, storage_now);
    float radiator_mean = _history.mean(Zone::RADIATOR);
    float storage_mean = _history.mean(Zone::STORAGE);
    State state = _encoder.encode(radiator_mean, storage_mean);

    bool has_reward = false;
    float reward = 0.0f;
    Action rewarded_action = {0, 0};
    const bool next_state_mode =
        _config.next_state_mode == NextStateMode::NEXT_STATE;

    // Outcome of last cycle's action is visible now
    if (next_state_mode && _pending.valid) {
        transitionTo(ControlState::LEARNING);
        reward = _reward.score(radiator_mean, storage_mean,
                               _pending.action.radiator_pct,
                               _pending.action.storage_pct);
        learn(_pending.state, _pending.action, reward, state);
        has_reward = true;
        rewarded_action = _pending.action;
        _pending.valid = false;
    }

    transitionTo(ControlState::DECIDING);
    OverrideDecision forced = _override.check(radiator_now, storage_now);
    bool explored = false;
    Action action = forced.active ? forced.action
                                  : _policy.choose(state, &explored);

    transitionTo(ControlState::ACTUATING);
    bool actuation_ok = applyAction(action);
    _last_action = action;

    transitionTo(ControlState::LEARNING);
    if (next_state_mode) {
        _pending = {true, state, action};
    } else {
        reward = _reward.score(radiator_mean, storage_mean,
                               action.radiator_pct, action.storage_pct);
        learn(state, action, reward, state);
        has_reward = true;
        rewarded_action = action;
    }
    _policy.decay();
    _cycle_count++;

    CycleTelemetry row;
    row.cycle = _cycle_count;
    row.radiator_mean = radiator_mean;
    row.storage_mean = storage_mean;
    row.state = state;
    row.action = action;
    row.has_reward = has_reward;
    row.reward = reward;
    row.rewarded_action = rewarded_action;
    row.epsilon = _policy.epsilon();
    row.q_states = _qtable.stateCount();
    row.override_active = forced.active;
    row.actuation_ok = actuation_ok;
    publish(row);
    if (explored) {
        _logger.log("CL: exploring", true);
    }

    if (++_cycles_since_save >= _config.timing.save_interval_cycles) {
        transitionTo(ControlState::PERSISTING);
        _cycles_since_save = 0;
        persist();
    }

    if (_consecutive_actuation_failures >=
        _config.timing.actuation_failure_limit) {
        char reason[48];
        snprintf(reason, sizeof(reason), "fans failed %u cycles in a row",
                 _consecutive_actuation_failures);
        shutdown(reason, true);
        return;
    }

    _sleep_ms = _config.timing.interval_ms;
    transitionTo(ControlState::SLEEPING);
}

bool ControlLoop::sample(float &radiator_c, float &storage_c) {
    TemperatureSample radiator;
    SampleStatus radiator_status = _ports.sampler.sampleRadiator(radiator);

    StorageReading readings[MAX_STORAGE_DEVICES];
    size_t count = _ports.sampler.sampleStorage(readings, MAX_STORAGE_DEVICES);
    if (count > MAX_STORAGE_DEVICES)
        count = MAX_STORAGE_DEVICES;

    if (radiator_status != SampleStatus::OK || count == 0) {
        handleSampleFailure(radiator_status, count);
        return false;
    }

    if (_consecutive_sample_failures > 0) {
        _logger.logf("Sensors back after %u failed samples",
                     _consecutive_sample_failures);
    }
    _consecutive_sample_failures = 0;
    _sensor_failsafe = false;

    // Storage zone is governed by its hottest drive
    radiator_c = radiator.value;
    storage_c = readings[0].value;
    for (size_t i = 1; i < count; i++) {
        if (readings[i].value > storage_c)
            storage_c = readings[i].value;
    }
    return true;
}

void ControlLoop::handleSampleFailure(SampleStatus radiator_status,
                                      size_t storage_count) {
    // The next good sample no longer measures the pending action alone
    _pending.valid = false;
    _consecutive_sample_failures++;
    _logger.logf(false, "WARN: Sample failed (radiator %s, %u storage probes)",
                 sampleStatusToString(radiator_status),
                 static_cast<unsigned>(storage_count));

    if (!_sensor_failsafe && _consecutive_sample_failures >=
                                 _config.timing.sensor_failsafe_cycles) {
        _sensor_failsafe = true;
        _logger.log("CRIT: Sensor loss, fans forced to max");
        applyAction(_actions.maxAction());
        _last_action = _actions.maxAction();

        char msg[64];
        snprintf(msg, sizeof(msg), "%u consecutive failed samples",
                 _consecutive_sample_failures);
        _ports.notifier.notify("Sensor loss", msg);
    }
}

bool ControlLoop::applyAction(const Action &action) {
    ActuationStatus rad = _ports.actuator.setSpeed(FanGroup::RADIATOR,
                                                   action.radiator_pct);
    ActuationStatus sto =
        _ports.actuator.setSpeed(FanGroup::STORAGE, action.storage_pct);

    if (rad != ActuationStatus::OK) {
        _logger.logf(false, "WARN: %s fans %d%% failed (%s)",
                     fanGroupToString(FanGroup::RADIATOR), action.radiator_pct,
                     actuationStatusToString(rad));
    }
    if (sto != ActuationStatus::OK) {
        _logger.logf(false, "WARN: %s fans %d%% failed (%s)",
                     fanGroupToString(FanGroup::STORAGE), action.storage_pct,
                     actuationStatusToString(sto));
    }

    bool ok = rad == ActuationStatus::OK && sto == ActuationStatus::OK;
    _consecutive_actuation_failures = ok ? 0 : _consecutive_actuation_failures + 1;
    return ok;
}

bool ControlLoop::learn(const State &state, const Action &action, float reward,
                        const State &next_state) {
    if (_qtable.update(state, action, reward, next_state))
        return true;

    if (!_table_full_warned) {
        _table_full_warned = true;
        _logger.logf("WARN: Q-table full (%u entries), new pairs not learned",
                     static_cast<unsigned>(_qtable.entryCount()));
    }
    return false;
}

void ControlLoop::persist() {
    PersistStatus status = _ports.storage.save(_qtable);
    if (status == PersistStatus::OK) {
        _logger.logf(true, "Q-table saved (%u states)",
                     static_cast<unsigned>(_qtable.stateCount()));
    } else {
        _logger.logf(false, "WARN: Q-table save failed (%s)",
                     persistStatusToString(status));
    }
}

void ControlLoop::publish(const CycleTelemetry &row) {
    _ports.telemetry.record(row);

    char reward_buf[12];
    if (row.has_reward) {
        snprintf(reward_buf, sizeof(reward_buf), "%.2f", row.reward);
    } else {
        snprintf(reward_buf, sizeof(reward_buf), "-");
    }
    _logger.logf(true,
                 "R %.1fC S %.1fC | fans %d/%d%% | r %s | eps %.3f | Q %u%s",
                 row.radiator_mean, row.storage_mean, row.action.radiator_pct,
                 row.action.storage_pct, reward_buf, row.epsilon,
                 static_cast<unsigned>(row.q_states),
                 row.override_active ? " | OVERRIDE" : "");

    char fans[MAX_LINE_VALUE_LEN];
    snprintf(fans, sizeof(fans), "%d/%d%%", row.action.radiator_pct,
             row.action.storage_pct);
    char states[MAX_LINE_VALUE_LEN];
    snprintf(states, sizeof(states), "%u", static_cast<unsigned>(row.q_states));

    _logger.updateLine(LineId::RADIATOR, row.radiator_mean);
    _logger.updateLine(LineId::STORAGE, row.storage_mean);
    _logger.updateLineText(LineId::FANS, fans);
    _logger.updateLine(LineId::EPSILON, row.epsilon);
    _logger.updateLineText(LineId::REWARD, reward_buf);
    _logger.updateLineText(LineId::QSTATES, states);
}

// =============================================================================
// Shutdown
// =============================================================================

void ControlLoop::shutdown(const char *reason, bool abnormal) {
    if (isStopped())
        return;

    bool was_running = _state != ControlState::IDLE;
    snprintf(_stop_reason, sizeof(_stop_reason), "%s", reason);
    transitionTo(ControlState::SHUTTING_DOWN, reason);

    // Known-safe speed for whatever happens after the loop stops
    applyAction(_actions.maxAction());
    _last_action = _actions.maxAction();

    if (was_running) {
        persist();
    }

    char msg[96];
    snprintf(msg, sizeof(msg), "%s after %lu cycles", reason, _cycle_count);
    if (abnormal) {
        _logger.logf(false, "CRIT: Controller stopped: %s", reason);
        _ports.notifier.notify("Fan controller stopped abnormally", msg);
    } else {
        _logger.logf(false, "Controller stopped: %s", reason);
        _ports.notifier.notify("Fan controller stopped", msg);
    }
}
