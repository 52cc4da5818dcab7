#include "tnsw/mode_of_transport.h"

#include <utility>

namespace tnsw {

std::optional<mode_of_transport> to_mode_of_transport(std::string_view s) {
  for (auto const m : kModesOfTransport) {
    if (to_str(m) == s) {
      return m;
    }
  }
  return std::nullopt;
}

std::string_view to_str(mode_of_transport const m) {
  switch (m) {
    case mode_of_transport::kTrain: return "train";
    case mode_of_transport::kLightRail: return "light_rail";
    case mode_of_transport::kBus: return "bus";
    case mode_of_transport::kCoach: return "coach";
    case mode_of_transport::kFerry: return "ferry";
    case mode_of_transport::kSchoolBus: return "school_bus";
  }
  std::unreachable();
}

std::string_view exclusion_param(mode_of_transport const m) {
  switch (m) {
    case mode_of_transport::kTrain: return "exclMOT_1";
    case mode_of_transport::kLightRail: return "exclMOT_4";
    case mode_of_transport::kBus: return "exclMOT_5";
    case mode_of_transport::kCoach: return "exclMOT_7";
    case mode_of_transport::kFerry: return "exclMOT_9";
    case mode_of_transport::kSchoolBus: return "exclMOT_11";
  }
  std::unreachable();
}

}  // namespace tnsw
