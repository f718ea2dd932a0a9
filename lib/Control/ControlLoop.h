/**
 * @file ControlLoop.h
 * @brief Adaptive fan controller: sample, decide, actuate, learn, persist
 *
 * ControlLoop is the only stateful orchestrator. It owns the learning state
 * (history, Q-table, policy, emergency guard) and drives the hardware through
 * the ControlPorts interfaces.
 *
 * CYCLE (every timing.interval_ms):
 *   SAMPLING   radiator + storage probes; failure -> retry sooner, no learning,
 *              and the pending next-state transition is dropped
 *   DECIDING   emergency override on instantaneous readings, else policy
 *   ACTUATING  both fan groups; failure is logged, learning continues
 *   LEARNING   reward on smoothed readings, TD update, epsilon decay
 *   PERSISTING every save_interval_cycles
 *   SLEEPING   until the next cycle
 *
 * With NextStateMode::NEXT_STATE the (state, action) of a cycle is learned
 * at the start of the following cycle, once its outcome and successor state
 * are known. SELF_TRANSITION learns immediately with the state as its own
 * successor.
 *
 * SHUTTING_DOWN is terminal: reached on requestShutdown(), on an
 * unrecoverable error, or when begin() rejects the configuration. It drives
 * the fans to maximum, saves the table once and notifies the operator.
 *
 * USAGE:
 * ------
 *   ControlLoop loop(logger, config, ports, rng);
 *   loop.begin(millis());
 *   // in loop():
 *   loop.update(millis());
 */

#ifndef CONTROL_LOOP_H
#define CONTROL_LOOP_H

#include "ActionSpace.h"
#include "Collaborators.h"
#include "ControlTypes.h"
#include "ControllerConfig.h"
#include "EmergencyOverride.h"
#include "HistoryBuffer.h"
#include "Logger.h"
#include "Policy.h"
#include "QTable.h"
#include "RandomSource.h"
#include "RewardModel.h"
#include "StateEncoder.h"

class ControlLoop {
  public:
    ControlLoop(Logger &logger, const ControllerConfig &config,
                const ControlPorts &ports, RandomSource &rng);

    /**
     * @brief Validate configuration, restore the Q-table, announce start
     *
     * The first cycle runs on the first update() after begin().
     * @return false on a configuration error (controller stays stopped)
     */
    bool begin(unsigned long now);

    /**
     * @brief Run a control cycle if one is due (call from loop())
     */
    void update(unsigned long now);

    /**
     * @brief Ask for a clean stop; handled on the next update()
     */
    void requestShutdown(const char *reason);

    /**
     * @brief Stop immediately after an unrecoverable error
     *
     * Also valid before begin(): the fans go to maximum and the operator is
     * told, nothing is saved.
     */
    void fail(const char *reason);

    // =========================================================================
    // Accessors
    // =========================================================================
    ControlState getState() const { return _state; }
    bool isStopped() const { return _state == ControlState::SHUTTING_DOWN; }
    unsigned long getCycleCount() const { return _cycle_count; }
    unsigned long getSleepInterval() const { return _sleep_ms; }
    float getEpsilon() const { return _policy.epsilon(); }
    const QTable &getQTable() const { return _qtable; }
    const ActionSpace &getActionSpace() const { return _actions; }
    const Action &getLastAction() const { return _last_action; }
    bool isOverrideActive() const { return _override.isActive(); }
    bool isSensorFailsafeActive() const { return _sensor_failsafe; }
    const char *getStopReason() const { return _stop_reason; }

  private:
    struct PendingTransition {
        bool valid;
        State state;
        Action action;
    };

    void runCycle(unsigned long now);
    bool sample(float &radiator_c, float &storage_c);
    void handleSampleFailure(SampleStatus radiator_status,
                             size_t storage_count);
    bool applyAction(const Action &action);
    bool learn(const State &state, const Action &action, float reward,
               const State &next_state);
    void persist();
    void publish(const CycleTelemetry &row);
    void shutdown(const char *reason, bool abnormal);
    void transitionTo(ControlState state, const char *reason = nullptr);
    void loadTable();
    void registerDisplayLines();

    Logger &_logger;
    ControllerConfig _config;
    ControlPorts _ports;

    // Learning state (construction order matters: policy refers to the
    // table and the action space)
    ActionSpace _actions;
    StateEncoder _encoder;
    RewardModel _reward;
    HistoryBuffer _history;
    QTable _qtable;
    Policy _policy;
    EmergencyOverride _override;

    ControlState _state;
    PendingTransition _pending;
    Action _last_action;

    unsigned long _cycle_start;
    unsigned long _sleep_ms;
    bool _cycle_due;
    unsigned long _cycle_count;
    unsigned long _cycles_since_save;

    unsigned int _consecutive_sample_failures;
    unsigned int _consecutive_actuation_failures;
    bool _sensor_failsafe;
    bool _table_full_warned;

    bool _shutdown_requested;
    char _stop_reason[48];
};

#endif // CONTROL_LOOP_H
