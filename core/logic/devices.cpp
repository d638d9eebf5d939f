// ==============================================================================
// Device Registry Implementation
// ==============================================================================

#include "devices.hpp"
#include "error.hpp"
#include <algorithm>

namespace logsim {

// ==============================================================================
// Parameter Parsing
// ==============================================================================

namespace {

// Largest parameter we accept; keeps the value well inside size_t
constexpr size_t kMaxParameterDigits = 9;

size_t parse_count(const std::string& text, const std::string& what) {
    if (text.empty()) {
        throw InvalidParameterError(what + " is missing");
    }
    if (text.size() > kMaxParameterDigits) {
        throw InvalidParameterError(what + " '" + text + "' is too large");
    }
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw InvalidParameterError(what + " '" + text + "' is not a number");
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

}  // namespace

bool PinIds::is_input_name(NameId id) const {
    if (id == data || id == clk || id == set || id == clear) return true;
    return std::find(gate_inputs.begin(), gate_inputs.end(), id) != gate_inputs.end();
}

bool PinIds::is_output_name(NameId id) const {
    return id == q || id == qbar;
}

// ==============================================================================
// Construction
// ==============================================================================

DeviceRegistry::DeviceRegistry(NameTable& names)
    : names_(names)
{
    for (size_t i = 1; i <= kMaxGateInputs; i++) {
        pins_.gate_inputs.push_back(names_.lookup("I" + std::to_string(i)));
    }
    pins_.data = names_.lookup("DATA");
    pins_.clk = names_.lookup("CLK");
    pins_.set = names_.lookup("SET");
    pins_.clear = names_.lookup("CLEAR");
    pins_.q = names_.lookup("Q");
    pins_.qbar = names_.lookup("QBAR");
}

NameId DeviceRegistry::create(DeviceKind kind, NameId id, const std::string& parameter) {
    if (has_device(id)) {
        throw DuplicateDeviceError("Device " + names_.get_text(id) + " already exists");
    }

    Device device;
    device.id = id;
    device.kind = kind;

    auto add_gate_inputs = [&](size_t count) {
        for (size_t i = 0; i < count; i++) {
            device.inputs[pins_.gate_inputs[i]] = std::nullopt;
        }
    };
    auto no_parameter = [&]() {
        if (!parameter.empty()) {
            throw InvalidParameterError(build_error_message(
                device_kind_to_string(kind), " takes no parameter, got '", parameter, "'"));
        }
    };

    switch (kind) {
        case DeviceKind::SWITCH: {
            if (parameter != "0" && parameter != "1") {
                throw InvalidParameterError("Switch state should be 0 or 1, got '" +
                                            parameter + "'");
            }
            SwitchState sw;
            sw.initial = to_signal(parameter == "1");
            sw.setting = sw.initial;
            device.state = sw;
            device.outputs[std::nullopt] = sw.initial;
            break;
        }
        case DeviceKind::CLOCK: {
            ClockState clock;
            clock.half_period = parse_count(parameter, "Clock half period");
            if (clock.half_period == 0) {
                throw InvalidParameterError("Clock half period should be a positive integer");
            }
            device.state = clock;
            device.outputs[std::nullopt] = Signal::LOW;
            break;
        }
        case DeviceKind::AND:
        case DeviceKind::OR:
        case DeviceKind::NAND:
        case DeviceKind::NOR: {
            GateState gate;
            gate.input_count = parse_count(parameter, "Number of inputs");
            if (gate.input_count < 1 || gate.input_count > kMaxGateInputs) {
                throw InvalidParameterError(build_error_message(
                    "Number of inputs for ", device_kind_to_string(kind),
                    " should be between 1 and ", kMaxGateInputs, ", got ", parameter));
            }
            add_gate_inputs(gate.input_count);
            device.state = gate;
            device.outputs[std::nullopt] = Signal::LOW;
            break;
        }
        case DeviceKind::XOR: {
            no_parameter();
            add_gate_inputs(2);
            device.state = XorState{};
            device.outputs[std::nullopt] = Signal::LOW;
            break;
        }
        case DeviceKind::DTYPE: {
            no_parameter();
            device.inputs[pins_.data] = std::nullopt;
            device.inputs[pins_.clk] = std::nullopt;
            device.inputs[pins_.set] = std::nullopt;
            device.inputs[pins_.clear] = std::nullopt;
            device.state = DtypeState{};
            device.outputs[OptionalPin(pins_.q)] = Signal::LOW;
            device.outputs[OptionalPin(pins_.qbar)] = Signal::HIGH;
            break;
        }
        case DeviceKind::RC: {
            RcState rc;
            rc.period = parse_count(parameter, "RC period");
            if (rc.period == 0) {
                throw InvalidParameterError("RC period should be a positive integer");
            }
            rc.countdown = rc.period;
            device.state = rc;
            device.outputs[std::nullopt] = Signal::HIGH;
            break;
        }
        case DeviceKind::SIGGEN: {
            if (parameter.empty()) {
                throw InvalidParameterError("Siggen waveform is missing");
            }
            SiggenState gen;
            for (char c : parameter) {
                if (c != '0' && c != '1') {
                    throw InvalidParameterError(
                        "Siggen waveform should only consist of 0s and 1s, got '" +
                        parameter + "'");
                }
                gen.waveform.push_back(to_signal(c == '1'));
            }
            device.state = gen;
            device.outputs[std::nullopt] = gen.waveform.front();
            break;
        }
    }

    index_[id] = devices_.size();
    devices_.push_back(std::move(device));
    return id;
}

// ==============================================================================
// Connections
// ==============================================================================

ConnectStatus DeviceRegistry::connect_input(NameId device, NameId input_pin,
                                            NameId source_device, OptionalPin source_pin) {
    Device* dst = get_device(device);
    if (!dst || !has_device(source_device)) {
        return ConnectStatus::DEVICE_ABSENT;
    }
    if (!is_output_pin(source_device, source_pin)) {
        return ConnectStatus::PORT_ABSENT;
    }
    auto it = dst->inputs.find(input_pin);
    if (it == dst->inputs.end()) {
        return ConnectStatus::PORT_ABSENT;
    }
    if (it->second.has_value()) {
        return ConnectStatus::INPUT_CONNECTED;
    }
    it->second = PinSource{source_device, source_pin};
    return ConnectStatus::OK;
}

// ==============================================================================
// Lookup
// ==============================================================================

const Device* DeviceRegistry::get_device(NameId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &devices_[it->second];
}

Device* DeviceRegistry::get_device(NameId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &devices_[it->second];
}

std::vector<NameId> DeviceRegistry::find_devices() const {
    std::vector<NameId> ids;
    ids.reserve(devices_.size());
    for (const auto& device : devices_) {
        ids.push_back(device.id);
    }
    return ids;
}

std::vector<NameId> DeviceRegistry::find_devices(DeviceKind kind) const {
    std::vector<NameId> ids;
    for (const auto& device : devices_) {
        if (device.kind == kind) ids.push_back(device.id);
    }
    return ids;
}

bool DeviceRegistry::is_input_pin(NameId device, NameId pin) const {
    const Device* dev = get_device(device);
    return dev && dev->inputs.count(pin) != 0;
}

bool DeviceRegistry::is_output_pin(NameId device, OptionalPin pin) const {
    const Device* dev = get_device(device);
    return dev && dev->outputs.count(pin) != 0;
}

std::optional<Signal> DeviceRegistry::get_output(NameId device, OptionalPin pin) const {
    const Device* dev = get_device(device);
    if (!dev) return std::nullopt;
    auto it = dev->outputs.find(pin);
    if (it == dev->outputs.end()) return std::nullopt;
    return it->second;
}

std::string DeviceRegistry::pin_label(NameId device, OptionalPin pin) const {
    std::string label = names_.get_text(device);
    if (pin) {
        label += "." + names_.get_text(*pin);
    }
    return label;
}

// ==============================================================================
// State
// ==============================================================================

bool DeviceRegistry::set_switch(NameId device, Signal value) {
    Device* dev = get_device(device);
    if (!dev) return false;
    auto* sw = std::get_if<SwitchState>(&dev->state);
    if (!sw) return false;
    sw->setting = value;
    dev->outputs[std::nullopt] = value;
    return true;
}

void DeviceRegistry::reset_device(Device& device) const {
    std::visit(Overloaded{
        [&](SwitchState& sw) {
            sw.setting = sw.initial;
            device.outputs[std::nullopt] = sw.initial;
        },
        [&](ClockState& clock) {
            clock.counter = 0;
            device.outputs[std::nullopt] = Signal::LOW;
        },
        [&](GateState&) {
            device.outputs[std::nullopt] = Signal::LOW;
        },
        [&](XorState&) {
            device.outputs[std::nullopt] = Signal::LOW;
        },
        [&](DtypeState& dtype) {
            dtype.q = Signal::LOW;
            dtype.last_clk = Signal::LOW;
            device.outputs[OptionalPin(pins_.q)] = Signal::LOW;
            device.outputs[OptionalPin(pins_.qbar)] = Signal::HIGH;
        },
        [&](RcState& rc) {
            rc.countdown = rc.period;
            device.outputs[std::nullopt] = Signal::HIGH;
        },
        [&](SiggenState& gen) {
            gen.cursor = 0;
            device.outputs[std::nullopt] = gen.waveform.front();
        },
    }, device.state);
}

void DeviceRegistry::cold_startup() {
    for (auto& device : devices_) {
        reset_device(device);
    }
}

void DeviceRegistry::restore_state(std::vector<Device> saved) {
    devices_ = std::move(saved);
}

}  // namespace logsim
