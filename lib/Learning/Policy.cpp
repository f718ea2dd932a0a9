/**
 * @file Policy.cpp
 * @brief Implementation of epsilon-greedy selection
 */

#include "Policy.h"

Policy::Policy(const QTable &table, const ActionSpace &actions,
               RandomSource &rng, const LearningConfig &config)
    : _table(table), _actions(actions), _rng(rng), _config(config),
      _epsilon(config.epsilon_start) {}

Action Policy::explore() {
    size_t idx = _rng.index(_actions.size());
    if (idx >= _actions.size())
        idx = _actions.size() - 1;
    return _actions.at(idx);
}

Action Policy::choose(const State &state, bool *explored) {
    Action best;
    bool known = _table.bestAction(state, best);

    bool exploring = !known || _rng.uniform() < _epsilon;
    if (explored != nullptr)
        *explored = exploring;

    return exploring ? explore() : best;
}

void Policy::decay() {
    float next = _epsilon * _config.epsilon_decay;
    _epsilon = next < _config.epsilon_min ? _config.epsilon_min : next;
}
