/**
 * @file QTable.h
 * @brief Tabular action-value store: State -> (Action -> value)
 *
 * One fixed pool of MAX_QTABLE_ENTRIES (state, action, value) entries shared
 * by all states, no heap. Only visited pairs take space, so the pool holds
 * every state of the plausible temperature envelope (Limits::MIN_VALID_C to
 * Limits::MAX_VALID_C at the configured bucket step, checked by
 * ControllerConfig::validate()) with room left for the actions tried there.
 *
 * A pair that has never been updated reads as 0.0. Entries are created on
 * first update and never removed during a run. When the pool is full,
 * updates for unseen pairs are refused (update() returns false) and the
 * table is otherwise unaffected.
 *
 * Update rule (one-step TD control):
 *   Q(s,a) += alpha * (reward + gamma * max_a' Q(s',a') - Q(s,a))
 * where the max runs over recorded entries of s' and is 0.0 when s' has none.
 *
 * Persistence keys encode a component pair as "<a>_<b>" (see QKey).
 */

#ifndef QTABLE_H
#define QTABLE_H

#include "LearningTypes.h"

constexpr size_t MAX_QTABLE_ENTRIES = 4608;

struct QEntry {
    State state;
    Action action;
    float value;
};

class QTable {
  public:
    QTable(float alpha, float gamma);

    float get(const State &state, const Action &action) const;

    /**
     * @brief Apply the TD update for one observed transition
     * @return false if the pair is new and the pool is full (nothing changed)
     */
    bool update(const State &state, const Action &action, float reward,
                const State &next_state);

    /**
     * @brief Overwrite a value directly (used when restoring from storage)
     * @return false if the pair is new and the pool is full
     */
    bool set(const State &state, const Action &action, float value);

    bool hasState(const State &state) const;

    /**
     * @brief Highest recorded value for a state, 0.0 if the state is unseen
     */
    float maxValue(const State &state) const;

    /**
     * @brief Recorded action with the highest value
     *
     * Ties go to the smallest Action (lowest radiator duty, then lowest
     * storage duty).
     * @return false if the state has no recorded entries
     */
    bool bestAction(const State &state, Action &out) const;

    size_t stateCount() const { return _state_count; }
    size_t entryCount() const { return _entry_count; }
    bool isFull() const { return _entry_count >= MAX_QTABLE_ENTRIES; }
    void clear();

    // Entries in insertion order (serialization, diagnostics)
    const QEntry &entry(size_t index) const { return _entries[index]; }

    float alpha() const { return _alpha; }
    float gamma() const { return _gamma; }

  private:
    const QEntry *find(const State &state, const Action &action) const;
    QEntry *findOrCreate(const State &state, const Action &action);

    float _alpha;
    float _gamma;
    QEntry _entries[MAX_QTABLE_ENTRIES];
    size_t _entry_count;
    size_t _state_count;
};

// =============================================================================
// Composite key encoding
// =============================================================================

namespace QKey {
constexpr size_t MAX_KEY_LEN = 16;
constexpr char SEPARATOR = '_';

/**
 * @brief Format "<a>_<b>" (decimal, sign allowed)
 */
void format(char *buf, size_t size, int a, int b);

/**
 * @brief Parse "<a>_<b>"; rejects anything else, including trailing text
 */
bool parse(const char *key, int &a, int &b);
} // namespace QKey

#endif // QTABLE_H
