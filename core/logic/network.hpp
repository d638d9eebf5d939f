// ==============================================================================
// Logic Network
// ==============================================================================
// The connectivity between device pins and the cycle-stepping simulation.
// A cycle advances the signal sources, settles the combinational logic,
// clocks the DTYPE flip-flops once and settles again if they changed.
// Each cycle is atomic: on failure the devices are left as they were.
// ==============================================================================

#ifndef LOGSIM_LOGIC_NETWORK_HPP
#define LOGSIM_LOGIC_NETWORK_HPP

#include <utility>
#include <vector>
#include "devices.hpp"

namespace logsim {

class Network {
public:
    explicit Network(DeviceRegistry& devices);

    // Connect an output to an input (see DeviceRegistry::connect_input)
    ConnectStatus make_connection(NameId source_device, OptionalPin source_pin,
                                  NameId device, NameId input_pin);

    // Source driving an input, std::nullopt if the input floats or doesn't exist
    std::optional<PinSource> get_connected_output(NameId device, NameId input_pin) const;

    // (device, input pin) of every floating input, in creation and pin order
    std::vector<std::pair<NameId, NameId>> find_floating_inputs() const;

    // True if every input of every device has a source
    bool check_network() const { return find_floating_inputs().empty(); }

    /**
     * @brief Advance the simulation by one cycle
     *
     * @throws FloatingInputError if any input has no source
     * @throws OscillationError if the logic doesn't settle within settle_limit()
     *
     * Device state is restored to its value before the call when either is
     * thrown.
     */
    void execute_cycle();

    // Most passes a single settle may take before it counts as oscillation
    size_t settle_limit() const;

    // Passes used by the most recent successful cycle (both settles)
    size_t last_settle_passes() const { return last_settle_passes_; }

    DeviceRegistry& devices() { return devices_; }
    const DeviceRegistry& devices() const { return devices_; }

private:
    Signal read_input(const Device& device, NameId input_pin) const;

    void advance_sources();
    size_t settle();
    bool evaluate_combinational(Device& device);
    bool update_dtypes();

    DeviceRegistry& devices_;
    size_t last_settle_passes_ = 0;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_NETWORK_HPP
