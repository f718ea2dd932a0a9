/**
 * @file ActionSpace.cpp
 * @brief Implementation of the fan duty grid
 */

#include "ActionSpace.h"

size_t ActionSpace::axisSize(const FanRange &range) {
    if (range.step_pct <= 0 || range.min_pct < 0 || range.max_pct > 100 ||
        range.min_pct > range.max_pct)
        return 0;
    return static_cast<size_t>((range.max_pct - range.min_pct) /
                               range.step_pct) +
           1;
}

ActionSpace::ActionSpace(const FanRange &radiator, const FanRange &storage)
    : _count(0) {
    size_t rad_count = axisSize(radiator);
    size_t sto_count = axisSize(storage);
    if (rad_count == 0 || sto_count == 0 ||
        rad_count * sto_count > MAX_ACTIONS)
        return;

    for (size_t r = 0; r < rad_count; r++) {
        for (size_t c = 0; c < sto_count; c++) {
            Action &a = _actions[_count++];
            a.radiator_pct = static_cast<int16_t>(
                radiator.min_pct + static_cast<int>(r) * radiator.step_pct);
            a.storage_pct = static_cast<int16_t>(
                storage.min_pct + static_cast<int>(c) * storage.step_pct);
        }
    }
}

bool ActionSpace::contains(const Action &action) const {
    for (size_t i = 0; i < _count; i++) {
        if (_actions[i] == action)
            return true;
    }
    return false;
}

Action ActionSpace::maxAction() const {
    // Radiator-major order ends on the highest duty of both axes
    if (_count == 0)
        return {100, 100};
    return _actions[_count - 1];
}
