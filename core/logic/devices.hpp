// ==============================================================================
// Device Registry
// ==============================================================================
// Owns every device of a circuit: its kind, input pin sources, output values
// and the hidden state of its kind. Devices live in an arena in creation
// order and refer to each other only by id, so feedback loops in a circuit
// are plain data.
// ==============================================================================

#ifndef LOGSIM_LOGIC_DEVICES_HPP
#define LOGSIM_LOGIC_DEVICES_HPP

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include "types.hpp"
#include "names.hpp"

namespace logsim {

// ==============================================================================
// Device Model
// ==============================================================================

// The output pin that drives an input
struct PinSource {
    NameId device;
    OptionalPin pin;    // std::nullopt = the device's unnamed output

    bool operator==(const PinSource& other) const {
        return device == other.device && pin == other.pin;
    }
};

// Hidden state per kind. Gates other than XOR only need their input count.
struct SwitchState {
    Signal initial = Signal::LOW;
    Signal setting = Signal::LOW;
};

struct ClockState {
    size_t half_period = 1;
    size_t counter = 0;
};

struct GateState {
    size_t input_count = 2;
};

struct XorState {};

struct DtypeState {
    Signal q = Signal::LOW;
    Signal last_clk = Signal::LOW;  // CLK as sampled at the previous edge update
};

struct RcState {
    size_t period = 1;
    size_t countdown = 1;
};

struct SiggenState {
    std::vector<Signal> waveform;
    size_t cursor = 0;
};

using DeviceState = std::variant<SwitchState, ClockState, GateState, XorState,
                                 DtypeState, RcState, SiggenState>;

// Visitor helper for std::visit over DeviceState
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

struct Device {
    NameId id = 0;
    DeviceKind kind = DeviceKind::SWITCH;

    // Input pin -> source; an empty optional means the input floats
    std::map<NameId, std::optional<PinSource>> inputs;

    // Output pin (std::nullopt = unnamed) -> current value
    std::map<OptionalPin, Signal> outputs;

    DeviceState state;
};

// Interned ids of every pin name the language knows
struct PinIds {
    std::vector<NameId> gate_inputs;    // I1..I16
    NameId data = 0;
    NameId clk = 0;
    NameId set = 0;
    NameId clear = 0;
    NameId q = 0;
    NameId qbar = 0;

    bool is_input_name(NameId id) const;
    bool is_output_name(NameId id) const;
};

enum class ConnectStatus {
    OK,
    DEVICE_ABSENT,      // either device does not exist
    PORT_ABSENT,        // input pin foreign to the kind, or source pin not an output
    INPUT_CONNECTED     // input already has a source; the first one stands
};

// ==============================================================================
// Registry
// ==============================================================================

class DeviceRegistry {
public:
    explicit DeviceRegistry(NameTable& names);

    /**
     * @brief Create a device of the given kind
     *
     * @param kind Device kind
     * @param id Interned device name
     * @param parameter Parameter text as written in the circuit file: switch
     *        state (0/1), clock half period or RC period (positive), gate
     *        input count (1-16), SIGGEN waveform (0/1 digits); empty for
     *        DTYPE and XOR
     * @return The device id
     * @throws DuplicateDeviceError if the id is already a device
     * @throws InvalidParameterError if the parameter is outside the kind's domain
     */
    NameId create(DeviceKind kind, NameId id, const std::string& parameter);

    /**
     * @brief Give an input pin its source
     *
     * A second source for an already connected input is rejected, never
     * overwritten.
     */
    ConnectStatus connect_input(NameId device, NameId input_pin,
                                NameId source_device, OptionalPin source_pin);

    // Lookup (nullptr if absent)
    const Device* get_device(NameId id) const;
    Device* get_device(NameId id);
    bool has_device(NameId id) const { return index_.count(id) != 0; }

    // Device ids in creation order
    std::vector<NameId> find_devices() const;
    std::vector<NameId> find_devices(DeviceKind kind) const;

    bool is_input_pin(NameId device, NameId pin) const;
    bool is_output_pin(NameId device, OptionalPin pin) const;

    // Current value of an output (std::nullopt if the device/pin doesn't exist)
    std::optional<Signal> get_output(NameId device, OptionalPin pin) const;

    // Change a switch's setting; false if the device is not a switch
    bool set_switch(NameId device, Signal value);

    /**
     * @brief Reset every device to its initial state
     *
     * Switches return to their declared state, clocks to counter zero with a
     * LOW output, RC devices to a full countdown with a HIGH output, DTYPEs
     * to Q=0/QBAR=1, SIGGENs to the start of their waveform and gates to LOW.
     */
    void cold_startup();

    // Whole-registry snapshot used to make a simulation cycle atomic
    std::vector<Device> save_state() const { return devices_; }
    void restore_state(std::vector<Device> saved);

    // Arena access for the network
    std::vector<Device>& devices() { return devices_; }
    const std::vector<Device>& devices() const { return devices_; }

    size_t size() const { return devices_.size(); }
    const PinIds& pins() const { return pins_; }
    NameTable& names() const { return names_; }

    // "name" or "name.PIN" for messages
    std::string pin_label(NameId device, OptionalPin pin) const;

private:
    void reset_device(Device& device) const;

    NameTable& names_;
    PinIds pins_;
    std::vector<Device> devices_;
    std::unordered_map<NameId, size_t> index_;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_DEVICES_HPP
