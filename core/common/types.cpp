// ==============================================================================
// Common Type Implementations
// ==============================================================================

#include "types.hpp"

namespace logsim {

const char* device_kind_to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::SWITCH: return "SWITCH";
        case DeviceKind::CLOCK:  return "CLOCK";
        case DeviceKind::AND:    return "AND";
        case DeviceKind::OR:     return "OR";
        case DeviceKind::NAND:   return "NAND";
        case DeviceKind::NOR:    return "NOR";
        case DeviceKind::XOR:    return "XOR";
        case DeviceKind::DTYPE:  return "DTYPE";
        case DeviceKind::RC:     return "RC";
        case DeviceKind::SIGGEN: return "SIGGEN";
    }
    return "unknown";
}

std::optional<DeviceKind> device_kind_from_string(const std::string& keyword) {
    for (DeviceKind kind : all_device_kinds()) {
        if (keyword == device_kind_to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool is_multi_input_gate(DeviceKind kind) {
    return kind == DeviceKind::AND || kind == DeviceKind::OR ||
           kind == DeviceKind::NAND || kind == DeviceKind::NOR;
}

const std::vector<DeviceKind>& all_device_kinds() {
    static const std::vector<DeviceKind> kinds = {
        DeviceKind::SWITCH, DeviceKind::CLOCK, DeviceKind::AND,
        DeviceKind::OR, DeviceKind::NAND, DeviceKind::NOR,
        DeviceKind::XOR, DeviceKind::DTYPE, DeviceKind::RC,
        DeviceKind::SIGGEN
    };
    return kinds;
}

}  // namespace logsim
