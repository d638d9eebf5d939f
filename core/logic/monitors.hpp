// ==============================================================================
// Monitor Set
// ==============================================================================
// Records the value of selected outputs after every simulated cycle. A new
// monitor starts with an empty history; earlier cycles are never backfilled.
// Monitors are kept in the order they were registered.
// ==============================================================================

#ifndef LOGSIM_LOGIC_MONITORS_HPP
#define LOGSIM_LOGIC_MONITORS_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "devices.hpp"

namespace logsim {

enum class MonitorStatus {
    OK,
    DEVICE_ABSENT,      // no such device
    NOT_OUTPUT,         // the pin is not an output of the device
    MONITOR_PRESENT,    // already monitored; nothing changed
    NOT_MONITORED       // remove_monitor() on a pin that isn't monitored
};

struct Monitor {
    NameId device;
    OptionalPin pin;
    std::vector<Signal> history;
};

// A history padded on the left so that all traces end on the same cycle
using AlignedTrace = std::vector<std::optional<Signal>>;

class MonitorSet {
public:
    explicit MonitorSet(const DeviceRegistry& devices);

    MonitorStatus make_monitor(NameId device, OptionalPin pin);
    MonitorStatus remove_monitor(NameId device, OptionalPin pin);

    // Append the current value of every monitored output
    void record_cycle();

    // Empty every history, keeping the registrations
    void reset_monitors();

    bool is_monitored(NameId device, OptionalPin pin) const;

    // nullptr if not monitored
    const std::vector<Signal>* get_history(NameId device, OptionalPin pin) const;

    const std::vector<Monitor>& get_monitors() const { return monitors_; }
    size_t size() const { return monitors_.size(); }

    // "device" or "device.PIN"
    std::string get_signal_name(const Monitor& monitor) const;

    // Length of the longest history
    size_t max_history_length() const;

    /**
     * @brief Every history, left-padded with std::nullopt to the longest one
     *
     * A monitor added after some cycles have run has a shorter history; the
     * padding lines its samples up with the cycles they were taken on.
     */
    std::vector<AlignedTrace> get_aligned_traces() const;

    /**
     * @brief Print one text waveform per monitor
     *
     * '-' is HIGH, '_' is LOW and ' ' is a cycle from before the monitor
     * existed. Names are padded to a common width.
     */
    void render_traces(std::ostream& os) const;

private:
    std::vector<Monitor>::iterator find(NameId device, OptionalPin pin);
    std::vector<Monitor>::const_iterator find(NameId device, OptionalPin pin) const;

    const DeviceRegistry& devices_;
    std::vector<Monitor> monitors_;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_MONITORS_HPP
