// ==============================================================================
// Logic Simulation Engine
// ==============================================================================
// Main orchestrator for logic simulation: circuit loading, running and
// continuing simulations, switch settings and monitors. Signals are addressed
// by name ("sw1", "dff.Q") so front ends never handle name ids.
// ==============================================================================

#ifndef LOGSIM_LOGIC_ENGINE_HPP
#define LOGSIM_LOGIC_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "circuit.hpp"
#include "diagnostics.hpp"
#include "names.hpp"

namespace logsim {

enum class LogicState {
    EMPTY,      // no circuit loaded
    READY,      // circuit loaded, nothing simulated since the load
    RUNNING,
    HALTED,     // the requested cycles completed
    ERROR
};

const char* logic_state_to_string(LogicState state);

struct LogicStats {
    uint64_t cycles_executed = 0;
    uint64_t settle_passes = 0;
    uint64_t runs = 0;
    void reset() { cycles_executed = 0; settle_passes = 0; runs = 0; }
};

// A monitored signal and its history aligned to the longest one
using NamedTrace = std::pair<std::string, AlignedTrace>;

class LogicEngine {
public:
    LogicEngine();

    /**
     * @brief Parse a circuit and make it the current one
     *
     * The previous circuit is discarded in every case. On failure no circuit
     * is loaded, the state is ERROR and get_diagnostics() explains why.
     *
     * @return True if the circuit was built without errors
     */
    bool load_string(const std::string& source, const std::string& name = "<circuit>");
    bool load_file(const std::string& path);

    // Simulation
    LogicState run(size_t cycles);            // cold start, clear monitors, simulate
    LogicState continue_run(size_t cycles);   // simulate on from the current state
    bool execute_cycle();
    void cold_startup();

    // Switches; set_switch takes 0 or 1
    bool set_switch(const std::string& name, int value);
    std::optional<Signal> get_switch(const std::string& name) const;
    std::vector<std::string> switch_names() const;

    // Every output of every device, "name" or "name.PIN"
    std::vector<std::string> output_names() const;
    std::optional<Signal> get_output(const std::string& signal) const;

    // Monitors
    bool add_monitor(const std::string& signal);
    bool remove_monitor(const std::string& signal);
    bool is_monitored(const std::string& signal) const;
    std::vector<std::string> monitored_names() const;
    std::vector<NamedTrace> get_signals() const;

    // Access
    bool has_circuit() const { return circuit_ != nullptr; }
    const Circuit* get_circuit() const { return circuit_.get(); }
    const NameTable& get_names() const { return names_; }
    const Diagnostics& get_diagnostics() const { return diagnostics_; }

    // State
    LogicState get_state() const { return state_; }
    const LogicStats& get_stats() const { return stats_; }
    const std::string& get_error_message() const { return error_message_; }

private:
    // Split "device" / "device.PIN" into ids; std::nullopt if either is unknown
    std::optional<std::pair<NameId, OptionalPin>> resolve_signal(const std::string& signal) const;

    bool require_circuit();
    LogicState simulate(size_t cycles);

    // State
    LogicState state_ = LogicState::EMPTY;
    LogicStats stats_;
    std::string error_message_;
    bool has_run_ = false;

    // The name table outlives every circuit that refers to it
    NameTable names_;
    std::unique_ptr<Circuit> circuit_;
    Diagnostics diagnostics_;

    void set_error(const std::string& msg);
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_ENGINE_HPP
