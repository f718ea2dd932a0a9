/**
 * @file ActionSpace.h
 * @brief Finite set of (radiator, storage) fan duty pairs
 *
 * Built once from the two fan grids and never modified. Enumeration is
 * radiator-major: all storage steps for the lowest radiator duty come first.
 * A grid that yields more than MAX_ACTIONS pairs (or an empty/invalid grid)
 * leaves the space invalid; ControllerConfig::validate() rejects such grids
 * before the controller starts.
 */

#ifndef ACTION_SPACE_H
#define ACTION_SPACE_H

#include "LearningTypes.h"

constexpr size_t MAX_ACTIONS = 64;

class ActionSpace {
  public:
    ActionSpace(const FanRange &radiator, const FanRange &storage);

    bool isValid() const { return _count > 0; }
    size_t size() const { return _count; }
    const Action &at(size_t index) const { return _actions[index]; }
    bool contains(const Action &action) const;

    /**
     * @brief Highest grid duty on both axes, used by the emergency override
     *
     * When a range's max is not reachable in whole steps from its min this is
     * the last step below it. An invalid space reports 100/100.
     */
    Action maxAction() const;

    /**
     * @brief Number of grid points on one axis, 0 if the range is invalid
     */
    static size_t axisSize(const FanRange &range);

  private:
    Action _actions[MAX_ACTIONS];
    size_t _count;
};

#endif // ACTION_SPACE_H
