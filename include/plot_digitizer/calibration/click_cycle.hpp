#pragma once

#include <array>
#include <optional>
#include <vector>

namespace plot_digitizer::calibration {

enum class ClickCycleState {
    PickingFirst,
    PickingSecond,
    Confirmed
};

/**
 * Two-slot reference click state machine for one axis.
 *
 * Clicks alternate between slot 0 and slot 1; once both are set, further
 * clicks replace them in the same alternating order. undo() reverts the most
 * recent click, restoring the position it replaced. confirm() freezes the pair.
 * A click after confirm() re-opens the cycle.
 */
class AxisClickCycle {
public:
    void click(double position);
    // Returns false when there is nothing to undo, or the cycle is confirmed.
    bool undo();
    // Throws ValidationError unless both slots are set.
    std::array<double, 2> confirm();

    ClickCycleState state() const;
    int click_count() const { return click_count_; }
    const std::array<std::optional<double>, 2>& positions() const { return slots_; }

private:
    struct Step {
        int slot;
        std::optional<double> previous;
    };

    std::array<std::optional<double>, 2> slots_;
    std::vector<Step> history_;
    int click_count_ = 0;
    bool confirmed_ = false;
};

} // namespace plot_digitizer::calibration
