// ==============================================================================
// Circuit
// ==============================================================================
// The registries built from one circuit file: devices, the network over
// them, and the monitors. A circuit is built once by the parser and never
// re-parsed in place; loading another file makes a new Circuit.
// ==============================================================================

#ifndef LOGSIM_LOGIC_CIRCUIT_HPP
#define LOGSIM_LOGIC_CIRCUIT_HPP

#include "devices.hpp"
#include "network.hpp"
#include "monitors.hpp"

namespace logsim {

struct Circuit {
    explicit Circuit(NameTable& names)
        : devices(names), network(devices), monitors(devices)
    {}

    // network and monitors refer to devices, so a Circuit stays put
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    DeviceRegistry devices;
    Network network;
    MonitorSet monitors;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_CIRCUIT_HPP
