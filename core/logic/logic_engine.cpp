// ==============================================================================
// Logic Simulation Engine Implementation
// ==============================================================================

#include "logic_engine.hpp"
#include "parser.hpp"
#include "error.hpp"
#include <fstream>
#include <sstream>

namespace logsim {

const char* logic_state_to_string(LogicState state) {
    switch (state) {
        case LogicState::EMPTY:   return "EMPTY";
        case LogicState::READY:   return "READY";
        case LogicState::RUNNING: return "RUNNING";
        case LogicState::HALTED:  return "HALTED";
        case LogicState::ERROR:   return "ERROR";
        default:                  return "UNKNOWN";
    }
}

LogicEngine::LogicEngine() {
    state_ = LogicState::EMPTY;
}

// ==============================================================================
// Loading
// ==============================================================================

bool LogicEngine::load_string(const std::string& source, const std::string& name) {
    circuit_.reset();
    stats_.reset();
    has_run_ = false;
    error_message_.clear();

    try {
        BuildResult result = build_network(names_, source, name);
        diagnostics_ = std::move(result.diagnostics);
        if (!result.success) {
            set_error(build_error_message(name, ": ", diagnostics_.error_count(),
                                          " error(s) in circuit definition"));
            return false;
        }
        circuit_ = std::move(result.circuit);
        state_ = LogicState::READY;
        return true;
    } catch (const LogsimError& e) {
        set_error(e.what());
        return false;
    }
}

bool LogicEngine::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        circuit_.reset();
        diagnostics_ = Diagnostics();
        set_error(FileError(path, "Could not open circuit file").what());
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return load_string(ss.str(), path);
}

// ==============================================================================
// Simulation
// ==============================================================================

bool LogicEngine::require_circuit() {
    if (circuit_) return true;
    set_error("No circuit loaded");
    return false;
}

LogicState LogicEngine::run(size_t cycles) {
    if (!require_circuit()) return state_;

    cold_startup();
    circuit_->monitors.reset_monitors();
    stats_.runs++;
    has_run_ = true;
    return simulate(cycles);
}

LogicState LogicEngine::continue_run(size_t cycles) {
    if (!require_circuit()) return state_;
    if (!has_run_) {
        set_error("Nothing to continue; run the circuit first");
        return state_;
    }
    return simulate(cycles);
}

LogicState LogicEngine::simulate(size_t cycles) {
    state_ = LogicState::RUNNING;
    error_message_.clear();
    for (size_t i = 0; i < cycles; i++) {
        if (!execute_cycle()) return state_;
    }
    state_ = LogicState::HALTED;
    return state_;
}

bool LogicEngine::execute_cycle() {
    if (!require_circuit()) return false;
    try {
        circuit_->network.execute_cycle();
        circuit_->monitors.record_cycle();
        stats_.cycles_executed++;
        stats_.settle_passes += circuit_->network.last_settle_passes();
        return true;
    } catch (const LogsimError& e) {
        set_error(e.what());
        return false;
    }
}

void LogicEngine::cold_startup() {
    if (!circuit_) return;
    circuit_->devices.cold_startup();
}

// ==============================================================================
// Switches and Outputs
// ==============================================================================

std::optional<std::pair<NameId, OptionalPin>>
LogicEngine::resolve_signal(const std::string& signal) const {
    if (!circuit_) return std::nullopt;

    std::string device_name = signal;
    std::string pin_name;
    auto dot = signal.find('.');
    if (dot != std::string::npos) {
        device_name = signal.substr(0, dot);
        pin_name = signal.substr(dot + 1);
    }

    auto device = names_.query(device_name);
    if (!device || !circuit_->devices.has_device(*device)) return std::nullopt;

    OptionalPin pin;
    if (dot != std::string::npos) {
        auto pin_id = names_.query(pin_name);
        if (!pin_id) return std::nullopt;
        pin = *pin_id;
    }
    return std::make_pair(*device, pin);
}

bool LogicEngine::set_switch(const std::string& name, int value) {
    if (!require_circuit()) return false;
    if (value != 0 && value != 1) {
        error_message_ = "Switch value should be 0 or 1, got " + std::to_string(value);
        return false;
    }
    auto device = names_.query(name);
    if (!device || !circuit_->devices.set_switch(*device, to_signal(value == 1))) {
        error_message_ = "Invalid switch: " + name;
        return false;
    }
    return true;
}

std::optional<Signal> LogicEngine::get_switch(const std::string& name) const {
    if (!circuit_) return std::nullopt;
    auto device = names_.query(name);
    if (!device) return std::nullopt;
    const Device* dev = circuit_->devices.get_device(*device);
    if (!dev) return std::nullopt;
    if (const auto* sw = std::get_if<SwitchState>(&dev->state)) {
        return sw->setting;
    }
    return std::nullopt;
}

std::vector<std::string> LogicEngine::switch_names() const {
    std::vector<std::string> result;
    if (!circuit_) return result;
    for (NameId id : circuit_->devices.find_devices(DeviceKind::SWITCH)) {
        result.push_back(names_.get_text(id));
    }
    return result;
}

std::vector<std::string> LogicEngine::output_names() const {
    std::vector<std::string> result;
    if (!circuit_) return result;
    for (const auto& device : circuit_->devices.devices()) {
        for (const auto& [pin, value] : device.outputs) {
            result.push_back(circuit_->devices.pin_label(device.id, pin));
        }
    }
    return result;
}

std::optional<Signal> LogicEngine::get_output(const std::string& signal) const {
    auto resolved = resolve_signal(signal);
    if (!resolved) return std::nullopt;
    return circuit_->devices.get_output(resolved->first, resolved->second);
}

// ==============================================================================
// Monitors
// ==============================================================================

bool LogicEngine::add_monitor(const std::string& signal) {
    if (!require_circuit()) return false;
    auto resolved = resolve_signal(signal);
    if (!resolved) {
        error_message_ = "Unknown signal: " + signal;
        return false;
    }
    switch (circuit_->monitors.make_monitor(resolved->first, resolved->second)) {
        case MonitorStatus::OK:
            return true;
        case MonitorStatus::MONITOR_PRESENT:
            error_message_ = signal + " is already monitored";
            return false;
        default:
            error_message_ = signal + " is not an output";
            return false;
    }
}

bool LogicEngine::remove_monitor(const std::string& signal) {
    if (!require_circuit()) return false;
    auto resolved = resolve_signal(signal);
    if (!resolved ||
        circuit_->monitors.remove_monitor(resolved->first, resolved->second) != MonitorStatus::OK) {
        error_message_ = signal + " is not monitored";
        return false;
    }
    return true;
}

bool LogicEngine::is_monitored(const std::string& signal) const {
    auto resolved = resolve_signal(signal);
    return resolved && circuit_->monitors.is_monitored(resolved->first, resolved->second);
}

std::vector<std::string> LogicEngine::monitored_names() const {
    std::vector<std::string> result;
    if (!circuit_) return result;
    for (const auto& monitor : circuit_->monitors.get_monitors()) {
        result.push_back(circuit_->monitors.get_signal_name(monitor));
    }
    return result;
}

std::vector<NamedTrace> LogicEngine::get_signals() const {
    std::vector<NamedTrace> result;
    if (!circuit_) return result;

    const MonitorSet& monitors = circuit_->monitors;
    std::vector<AlignedTrace> traces = monitors.get_aligned_traces();
    for (size_t i = 0; i < traces.size(); i++) {
        result.emplace_back(monitors.get_signal_name(monitors.get_monitors()[i]),
                            std::move(traces[i]));
    }
    return result;
}

// ==============================================================================
// Error Handling
// ==============================================================================

void LogicEngine::set_error(const std::string& msg) {
    state_ = LogicState::ERROR;
    error_message_ = msg;
}

}  // namespace logsim
