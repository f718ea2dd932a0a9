/**
 * @file Policy.h
 * @brief Epsilon-greedy action selection with per-cycle epsilon decay
 *
 * choose(state):
 * - explore (uniform pick from the ActionSpace) when the state has no recorded
 *   entries, or when a uniform draw is below epsilon
 * - otherwise exploit: the recorded action with the highest value, ties going
 *   to the smallest Action
 *
 * An unseen state never costs a random draw for the epsilon test, so the
 * exploration path is taken even with epsilon at 0.
 *
 * decay() runs once per completed control cycle:
 *   epsilon = max(epsilon_min, epsilon * epsilon_decay)
 */

#ifndef POLICY_H
#define POLICY_H

#include "ActionSpace.h"
#include "LearningTypes.h"
#include "QTable.h"
#include "RandomSource.h"

class Policy {
  public:
    Policy(const QTable &table, const ActionSpace &actions, RandomSource &rng,
           const LearningConfig &config);

    /**
     * @param explored Optional out flag, true if the pick was exploratory
     */
    Action choose(const State &state, bool *explored = nullptr);

    void decay();

    float epsilon() const { return _epsilon; }

    /**
     * @brief Restart the exploration schedule at epsilon_start
     */
    void resetEpsilon() { _epsilon = _config.epsilon_start; }

  private:
    Action explore();

    const QTable &_table;
    const ActionSpace &_actions;
    RandomSource &_rng;
    LearningConfig _config;
    float _epsilon;
};

#endif // POLICY_H
