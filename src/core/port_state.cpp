#include "openswitchsync/core/port_state.hpp"

namespace oss {

PoeDetection decodePoeDetection(std::int64_t code) {
    PoeDetection detection;
    detection.rawCode = code;
    if (code >= static_cast<std::int64_t>(PoeDetectionStatus::Disabled) &&
        code <= static_cast<std::int64_t>(PoeDetectionStatus::Other)) {
        detection.status = static_cast<PoeDetectionStatus>(code);
    } else {
        detection.status = PoeDetectionStatus::Unknown;
    }
    return detection;
}

std::string toString(const PoeDetection& detection) {
    switch (detection.status) {
    case PoeDetectionStatus::Disabled:
        return "Disabled";
    case PoeDetectionStatus::Searching:
        return "Searching";
    case PoeDetectionStatus::Delivering:
        return "Delivering";
    case PoeDetectionStatus::Fault:
        return "Fault";
    case PoeDetectionStatus::Test:
        return "Test";
    case PoeDetectionStatus::Other:
        return "Other";
    case PoeDetectionStatus::Unknown:
        break;
    }
    return std::to_string(detection.rawCode);
}

const char* toString(PortOperStatus status) {
    return status == PortOperStatus::Up ? "Up" : "Down";
}

} // namespace oss
