#include "internal/model/state_machine.hpp"

#include <array>

namespace pagequeue::model {

std::optional<LifecycleState> ParseLifecycleState(std::string_view name) {
  static constexpr std::array kStates = {LifecycleState::kQueued, LifecycleState::kProcessing, LifecycleState::kFinished,
                                         LifecycleState::kDownloaded, LifecycleState::kError};
  for (auto state : kStates) {
    if (ToString(state) == name) {
      return state;
    }
  }
  return std::nullopt;
}

} // namespace pagequeue::model
