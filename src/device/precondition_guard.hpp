// Calibration checks run before a command may open a connection

#pragma once

#include "blindlink/types.hpp"
#include <optional>

namespace blindlink {
namespace device {

enum class GuardResult : uint8_t {
    PASS,
    CALIBRATION_REQUIRED,   // Up end-stop not set on the motor
    FAVORITE_NOT_SET,       // No favorite position programmed
};

const char* guardResultToString(GuardResult result);

// Movement commands. Unknown info (no frame seen yet) passes.
GuardResult checkEndPositions(const std::optional<EndPositionInfo>& info, bool bypass = false);

// Favorite command: needs the up end-stop or a programmed favorite.
GuardResult checkFavorite(const std::optional<EndPositionInfo>& info);

} // namespace device
} // namespace blindlink
