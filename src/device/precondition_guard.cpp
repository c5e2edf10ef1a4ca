#include "precondition_guard.hpp"

namespace blindlink {
namespace device {

const char* guardResultToString(GuardResult result) {
    switch (result) {
        case GuardResult::PASS:                 return "PASS";
        case GuardResult::CALIBRATION_REQUIRED: return "CALIBRATION_REQUIRED";
        case GuardResult::FAVORITE_NOT_SET:     return "FAVORITE_NOT_SET";
        default: return "UNKNOWN";
    }
}

GuardResult checkEndPositions(const std::optional<EndPositionInfo>& info, bool bypass) {
    if (bypass || !info) {
        return GuardResult::PASS;
    }
    return info->up ? GuardResult::PASS : GuardResult::CALIBRATION_REQUIRED;
}

GuardResult checkFavorite(const std::optional<EndPositionInfo>& info) {
    if (!info || info->up || info->favorite) {
        return GuardResult::PASS;
    }
    return GuardResult::FAVORITE_NOT_SET;
}

} // namespace device
} // namespace blindlink
