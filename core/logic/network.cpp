// ==============================================================================
// Logic Network Implementation
// ==============================================================================

#include "network.hpp"
#include "error.hpp"

namespace logsim {

Network::Network(DeviceRegistry& devices)
    : devices_(devices)
{}

// ==============================================================================
// Connectivity
// ==============================================================================

ConnectStatus Network::make_connection(NameId source_device, OptionalPin source_pin,
                                       NameId device, NameId input_pin) {
    return devices_.connect_input(device, input_pin, source_device, source_pin);
}

std::optional<PinSource> Network::get_connected_output(NameId device, NameId input_pin) const {
    const Device* dev = devices_.get_device(device);
    if (!dev) return std::nullopt;
    auto it = dev->inputs.find(input_pin);
    if (it == dev->inputs.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<NameId, NameId>> Network::find_floating_inputs() const {
    std::vector<std::pair<NameId, NameId>> floating;
    for (const auto& device : devices_.devices()) {
        for (const auto& [pin, source] : device.inputs) {
            if (!source) floating.emplace_back(device.id, pin);
        }
    }
    return floating;
}

size_t Network::settle_limit() const {
    return kSettlePassesPerDevice * devices_.size() + kSettleBasePasses;
}

// ==============================================================================
// Cycle Execution
// ==============================================================================

void Network::execute_cycle() {
    auto floating = find_floating_inputs();
    if (!floating.empty()) {
        const NameTable& names = devices_.names();
        throw FloatingInputError(names.get_text(floating.front().first),
                                 names.get_text(floating.front().second));
    }

    std::vector<Device> saved = devices_.save_state();
    try {
        advance_sources();
        size_t passes = settle();
        if (update_dtypes()) {
            passes += settle();
        }
        last_settle_passes_ = passes;
    } catch (const LogsimError&) {
        devices_.restore_state(std::move(saved));
        throw;
    }
}

Signal Network::read_input(const Device& device, NameId input_pin) const {
    auto it = device.inputs.find(input_pin);
    if (it == device.inputs.end() || !it->second) {
        const NameTable& names = devices_.names();
        throw FloatingInputError(names.get_text(device.id), names.get_text(input_pin));
    }
    const PinSource& source = *it->second;
    std::optional<Signal> value = devices_.get_output(source.device, source.pin);
    if (!value) {
        throw InternalError("Input " + devices_.pin_label(device.id, input_pin) +
                            " is driven by missing output " +
                            devices_.pin_label(source.device, source.pin));
    }
    return *value;
}

void Network::advance_sources() {
    for (auto& device : devices_.devices()) {
        std::visit(Overloaded{
            [&](SwitchState& sw) {
                device.outputs[std::nullopt] = sw.setting;
            },
            [&](ClockState& clock) {
                clock.counter++;
                if (clock.counter >= clock.half_period) {
                    Signal& out = device.outputs[std::nullopt];
                    out = invert(out);
                    clock.counter = 0;
                }
            },
            [&](RcState& rc) {
                if (rc.countdown == 0) {
                    device.outputs[std::nullopt] = Signal::LOW;
                } else {
                    device.outputs[std::nullopt] = Signal::HIGH;
                    rc.countdown--;
                }
            },
            [&](SiggenState& gen) {
                device.outputs[std::nullopt] = gen.waveform[gen.cursor];
                gen.cursor = (gen.cursor + 1) % gen.waveform.size();
            },
            [&](GateState&) {},
            [&](XorState&) {},
            [&](DtypeState&) {},
        }, device.state);
    }
}

bool Network::evaluate_combinational(Device& device) {
    const PinIds& pins = devices_.pins();
    Signal result = Signal::LOW;

    bool combinational = std::visit(Overloaded{
        [&](GateState& gate) {
            bool all_high = true;
            bool any_high = false;
            for (size_t i = 0; i < gate.input_count; i++) {
                bool v = to_bool(read_input(device, pins.gate_inputs[i]));
                all_high = all_high && v;
                any_high = any_high || v;
            }
            switch (device.kind) {
                case DeviceKind::AND:  result = to_signal(all_high); break;
                case DeviceKind::NAND: result = to_signal(!all_high); break;
                case DeviceKind::OR:   result = to_signal(any_high); break;
                case DeviceKind::NOR:  result = to_signal(!any_high); break;
                case DeviceKind::SWITCH:
                case DeviceKind::CLOCK:
                case DeviceKind::XOR:
                case DeviceKind::DTYPE:
                case DeviceKind::RC:
                case DeviceKind::SIGGEN:
                    throw InternalError(build_error_message(
                        "Gate state on a ", device_kind_to_string(device.kind), " device"));
            }
            return true;
        },
        [&](XorState&) {
            Signal a = read_input(device, pins.gate_inputs[0]);
            Signal b = read_input(device, pins.gate_inputs[1]);
            result = to_signal(a != b);
            return true;
        },
        [&](SwitchState&) { return false; },
        [&](ClockState&) { return false; },
        [&](DtypeState&) { return false; },
        [&](RcState&) { return false; },
        [&](SiggenState&) { return false; },
    }, device.state);

    if (!combinational) return false;

    Signal& out = device.outputs[std::nullopt];
    if (out == result) return false;
    out = result;
    return true;
}

size_t Network::settle() {
    size_t limit = settle_limit();
    for (size_t pass = 1; pass <= limit; pass++) {
        bool changed = false;
        for (auto& device : devices_.devices()) {
            if (evaluate_combinational(device)) changed = true;
        }
        if (!changed) return pass;
    }
    throw OscillationError(limit);
}

bool Network::update_dtypes() {
    const PinIds& pins = devices_.pins();

    // Sample every flip-flop before committing any, so chained DTYPEs
    // (shift registers) see the values from before the edge.
    struct Latch {
        Device* device;
        Signal q;
        Signal clk;
    };
    std::vector<Latch> latches;

    for (auto& device : devices_.devices()) {
        auto* dtype = std::get_if<DtypeState>(&device.state);
        if (!dtype) continue;

        Signal clk = read_input(device, pins.clk);
        Signal q = dtype->q;
        if (to_bool(read_input(device, pins.set))) {
            q = Signal::HIGH;
        } else if (to_bool(read_input(device, pins.clear))) {
            q = Signal::LOW;
        } else if (clk == Signal::HIGH && dtype->last_clk == Signal::LOW) {
            q = read_input(device, pins.data);
        }
        latches.push_back({&device, q, clk});
    }

    bool changed = false;
    for (const auto& latch : latches) {
        auto& dtype = std::get<DtypeState>(latch.device->state);
        if (dtype.q != latch.q) changed = true;
        dtype.q = latch.q;
        dtype.last_clk = latch.clk;
        latch.device->outputs[OptionalPin(pins.q)] = latch.q;
        latch.device->outputs[OptionalPin(pins.qbar)] = invert(latch.q);
    }
    return changed;
}

}  // namespace logsim
