#include "plot_digitizer/calibration/click_cycle.hpp"
#include "plot_digitizer/core/errors.hpp"

namespace plot_digitizer::calibration {

void AxisClickCycle::click(double position) {
    confirmed_ = false;
    const int slot = click_count_ % 2;
    history_.push_back({slot, slots_[static_cast<size_t>(slot)]});
    slots_[static_cast<size_t>(slot)] = position;
    ++click_count_;
}

bool AxisClickCycle::undo() {
    if (confirmed_ || history_.empty()) {
        return false;
    }
    const Step step = history_.back();
    history_.pop_back();
    slots_[static_cast<size_t>(step.slot)] = step.previous;
    --click_count_;
    return true;
}

std::array<double, 2> AxisClickCycle::confirm() {
    if (!slots_[0] || !slots_[1]) {
        throw ValidationError("two reference clicks required before confirm (have " +
                              std::to_string(click_count_) + ")");
    }
    confirmed_ = true;
    return {*slots_[0], *slots_[1]};
}

ClickCycleState AxisClickCycle::state() const {
    if (confirmed_) return ClickCycleState::Confirmed;
    return (click_count_ % 2) == 0 ? ClickCycleState::PickingFirst : ClickCycleState::PickingSecond;
}

} // namespace plot_digitizer::calibration
