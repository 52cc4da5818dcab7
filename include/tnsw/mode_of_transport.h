#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace tnsw {

enum class mode_of_transport {
  kTrain,
  kLightRail,
  kBus,
  kCoach,
  kFerry,
  kSchoolBus
};

constexpr auto const kModesOfTransport = std::array{
    mode_of_transport::kTrain, mode_of_transport::kLightRail,
    mode_of_transport::kBus,   mode_of_transport::kCoach,
    mode_of_transport::kFerry, mode_of_transport::kSchoolBus};

std::optional<mode_of_transport> to_mode_of_transport(std::string_view);

std::string_view to_str(mode_of_transport);

// Trip request query parameter excluding the mode, e.g. "exclMOT_5".
std::string_view exclusion_param(mode_of_transport);

}  // namespace tnsw
