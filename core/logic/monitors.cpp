// ==============================================================================
// Monitor Set Implementation
// ==============================================================================

#include "monitors.hpp"
#include "error.hpp"
#include <algorithm>
#include <ostream>

namespace logsim {

MonitorSet::MonitorSet(const DeviceRegistry& devices)
    : devices_(devices)
{}

std::vector<Monitor>::iterator MonitorSet::find(NameId device, OptionalPin pin) {
    return std::find_if(monitors_.begin(), monitors_.end(), [&](const Monitor& m) {
        return m.device == device && m.pin == pin;
    });
}

std::vector<Monitor>::const_iterator MonitorSet::find(NameId device, OptionalPin pin) const {
    return std::find_if(monitors_.begin(), monitors_.end(), [&](const Monitor& m) {
        return m.device == device && m.pin == pin;
    });
}

// ==============================================================================
// Registration
// ==============================================================================

MonitorStatus MonitorSet::make_monitor(NameId device, OptionalPin pin) {
    if (!devices_.has_device(device)) {
        return MonitorStatus::DEVICE_ABSENT;
    }
    if (!devices_.is_output_pin(device, pin)) {
        return MonitorStatus::NOT_OUTPUT;
    }
    if (find(device, pin) != monitors_.end()) {
        return MonitorStatus::MONITOR_PRESENT;
    }
    monitors_.push_back(Monitor{device, pin, {}});
    return MonitorStatus::OK;
}

MonitorStatus MonitorSet::remove_monitor(NameId device, OptionalPin pin) {
    auto it = find(device, pin);
    if (it == monitors_.end()) {
        return MonitorStatus::NOT_MONITORED;
    }
    monitors_.erase(it);
    return MonitorStatus::OK;
}

bool MonitorSet::is_monitored(NameId device, OptionalPin pin) const {
    return find(device, pin) != monitors_.end();
}

const std::vector<Signal>* MonitorSet::get_history(NameId device, OptionalPin pin) const {
    auto it = find(device, pin);
    if (it == monitors_.end()) return nullptr;
    return &it->history;
}

// ==============================================================================
// Recording
// ==============================================================================

void MonitorSet::record_cycle() {
    for (auto& monitor : monitors_) {
        std::optional<Signal> value = devices_.get_output(monitor.device, monitor.pin);
        if (!value) {
            throw InternalError("Monitored output " + get_signal_name(monitor) +
                                " no longer exists");
        }
        monitor.history.push_back(*value);
    }
}

void MonitorSet::reset_monitors() {
    for (auto& monitor : monitors_) {
        monitor.history.clear();
    }
}

// ==============================================================================
// Display
// ==============================================================================

std::string MonitorSet::get_signal_name(const Monitor& monitor) const {
    return devices_.pin_label(monitor.device, monitor.pin);
}

size_t MonitorSet::max_history_length() const {
    size_t longest = 0;
    for (const auto& monitor : monitors_) {
        longest = std::max(longest, monitor.history.size());
    }
    return longest;
}

std::vector<AlignedTrace> MonitorSet::get_aligned_traces() const {
    size_t longest = max_history_length();
    std::vector<AlignedTrace> traces;
    traces.reserve(monitors_.size());
    for (const auto& monitor : monitors_) {
        AlignedTrace trace(longest - monitor.history.size(), std::nullopt);
        for (Signal s : monitor.history) {
            trace.push_back(s);
        }
        traces.push_back(std::move(trace));
    }
    return traces;
}

void MonitorSet::render_traces(std::ostream& os) const {
    size_t width = 0;
    for (const auto& monitor : monitors_) {
        width = std::max(width, get_signal_name(monitor).size());
    }

    std::vector<AlignedTrace> traces = get_aligned_traces();
    for (size_t i = 0; i < monitors_.size(); i++) {
        std::string name = get_signal_name(monitors_[i]);
        os << name << std::string(width - name.size(), ' ') << " : ";
        for (const auto& sample : traces[i]) {
            if (!sample) {
                os << ' ';
            } else {
                os << (to_bool(*sample) ? '-' : '_');
            }
        }
        os << "\n";
    }
}

}  // namespace logsim
