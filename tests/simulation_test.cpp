// ==============================================================================
// Simulation Tests
// ==============================================================================
// Devices, the network cycle and monitors, driven directly on a parsed
// Circuit.
// ==============================================================================

#include "parser.hpp"
#include "error.hpp"
#include <iostream>
#include <sstream>
#include <cassert>

using namespace logsim;

static int test_count = 0;
static int pass_count = 0;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << std::endl;
    } else {
        std::cout << "FAIL: " << name << std::endl;
        assert(false);
    }
}

// ==============================================================================
// Helpers
// ==============================================================================

static std::unique_ptr<Circuit> build(NameTable& names, const std::string& source) {
    BuildResult result = build_network(names, source);
    if (!result.success) {
        result.diagnostics.render_to(std::cout);
    }
    check(result.success, "Circuit builds");
    return std::move(result.circuit);
}

static NameId id_of(const NameTable& names, const std::string& text) {
    return names.query(text).value();
}

static Signal out(const Circuit& circuit, const NameTable& names,
                  const std::string& device, const std::string& pin = "") {
    OptionalPin pin_id;
    if (!pin.empty()) pin_id = id_of(names, pin);
    return circuit.devices.get_output(id_of(names, device), pin_id).value();
}

static void set(Circuit& circuit, const NameTable& names, const std::string& sw, Signal value) {
    bool ok = circuit.devices.set_switch(id_of(names, sw), value);
    assert(ok);
    (void)ok;
}

// execute_cycle followed by record_cycle, like the driver does
static void run_cycles(Circuit& circuit, size_t cycles) {
    for (size_t i = 0; i < cycles; i++) {
        circuit.network.execute_cycle();
        circuit.monitors.record_cycle();
    }
}

static std::vector<Signal> history(const Circuit& circuit, const NameTable& names,
                                   const std::string& device, const std::string& pin = "") {
    OptionalPin pin_id;
    if (!pin.empty()) pin_id = id_of(names, pin);
    const std::vector<Signal>* h = circuit.monitors.get_history(id_of(names, device), pin_id);
    return h ? *h : std::vector<Signal>{};
}

static std::vector<Signal> bits(const std::string& pattern) {
    std::vector<Signal> result;
    for (char c : pattern) {
        result.push_back(c == '1' ? Signal::HIGH : Signal::LOW);
    }
    return result;
}

static const Signal H = Signal::HIGH;
static const Signal L = Signal::LOW;

// ==============================================================================
// Combinational Logic
// ==============================================================================

void test_fan_out_and() {
    std::cout << "\n--- Network: Fan-out AND ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH s1 1, AND a1 2;
        CONNECT: s1 > a1.I1, s1 > a1.I2;
        MONITOR: a1;
        END;
    )");

    circuit->devices.cold_startup();
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "a1") == H, "AND of two 1 inputs is 1");

    set(*circuit, names, "s1", L);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "a1") == L, "After switching s1 off the output is 0");
    check(history(*circuit, names, "a1") == bits("10"), "Monitor recorded both cycles");
}

void test_gate_truth_tables() {
    std::cout << "\n--- Network: Gate Truth Tables ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH a 0, SWITCH b 0,
                 AND g_and 2, OR g_or 2, NAND g_nand 2, NOR g_nor 2, XOR g_xor;
        CONNECT: a > g_and.I1, b > g_and.I2, a > g_or.I1, b > g_or.I2,
                 a > g_nand.I1, b > g_nand.I2, a > g_nor.I1, b > g_nor.I2,
                 a > g_xor.I1, b > g_xor.I2;
        MONITOR: ;
        END;
    )");
    circuit->devices.cold_startup();

    struct Row { Signal a, b, and_, or_, nand_, nor_, xor_; };
    const Row rows[] = {
        {L, L, L, L, H, H, L},
        {L, H, L, H, H, L, H},
        {H, L, L, H, H, L, H},
        {H, H, H, H, L, L, L},
    };

    bool all_ok = true;
    for (const Row& row : rows) {
        set(*circuit, names, "a", row.a);
        set(*circuit, names, "b", row.b);
        circuit->network.execute_cycle();
        all_ok = all_ok &&
                 out(*circuit, names, "g_and") == row.and_ &&
                 out(*circuit, names, "g_or") == row.or_ &&
                 out(*circuit, names, "g_nand") == row.nand_ &&
                 out(*circuit, names, "g_nor") == row.nor_ &&
                 out(*circuit, names, "g_xor") == row.xor_;
    }
    check(all_ok, "AND, OR, NAND, NOR and XOR match their truth tables");
}

void test_wide_gate() {
    std::cout << "\n--- Network: Sixteen Input NAND ---\n";

    std::string source = "DEVICES: SWITCH on 1, SWITCH off 0, NAND n 16; CONNECT: ";
    for (int i = 1; i <= 16; i++) {
        source += std::string(i == 1 ? "" : ", ") + (i == 16 ? "off" : "on") +
                  " > n.I" + std::to_string(i);
    }
    source += "; MONITOR: n; END;";

    NameTable names;
    auto circuit = build(names, source);
    circuit->devices.cold_startup();
    circuit->network.execute_cycle();
    check(out(*circuit, names, "n") == H, "One LOW input keeps NAND HIGH");

    set(*circuit, names, "off", H);
    circuit->network.execute_cycle();
    check(out(*circuit, names, "n") == L, "All sixteen HIGH drives NAND LOW");
}

void test_sr_latch_settles() {
    std::cout << "\n--- Network: Cross-coupled NOR Latch ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH s 0, SWITCH r 0, NOR n1 2, NOR n2 2;
        CONNECT: s > n1.I1, n2 > n1.I2, r > n2.I1, n1 > n2.I2;
        MONITOR: n1, n2;
        END;
    )");
    circuit->devices.cold_startup();

    run_cycles(*circuit, 1);
    check(out(*circuit, names, "n1") != out(*circuit, names, "n2"),
          "Latch settles to complementary outputs");

    set(*circuit, names, "s", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "n1") == L && out(*circuit, names, "n2") == H, "Set");

    set(*circuit, names, "s", L);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "n1") == L && out(*circuit, names, "n2") == H,
          "Holds after set is released");

    set(*circuit, names, "r", H);
    run_cycles(*circuit, 1);
    set(*circuit, names, "r", L);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "n1") == H && out(*circuit, names, "n2") == L,
          "Reset and hold");
    check(circuit->network.last_settle_passes() <= circuit->network.settle_limit(),
          "Settled within the limit");
}

// ==============================================================================
// Sources
// ==============================================================================

void test_clock() {
    std::cout << "\n--- Devices: Clock ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: CLOCK slow 2, CLOCK fast 1;
        CONNECT: ;
        MONITOR: slow, fast;
        END;
    )");
    circuit->devices.cold_startup();
    check(out(*circuit, names, "slow") == L, "Clock starts LOW");

    run_cycles(*circuit, 8);
    check(history(*circuit, names, "slow") == bits("01100110"),
          "Half period 2 toggles every second cycle");
    check(history(*circuit, names, "fast") == bits("10101010"),
          "Half period 1 toggles every cycle");

    circuit->devices.cold_startup();
    check(out(*circuit, names, "fast") == L, "Cold start returns the clock to LOW");
    circuit->monitors.reset_monitors();
    run_cycles(*circuit, 2);
    check(history(*circuit, names, "slow") == bits("01"), "Counter restarts from zero");
}

void test_rc() {
    std::cout << "\n--- Devices: RC ---\n";

    NameTable names;
    auto circuit = build(names, "DEVICES: RC rc 2; CONNECT: ; MONITOR: rc; END;");
    circuit->devices.cold_startup();
    check(out(*circuit, names, "rc") == H, "RC starts HIGH");

    run_cycles(*circuit, 5);
    check(history(*circuit, names, "rc") == bits("11000"), "HIGH for its period, then LOW");

    circuit->devices.cold_startup();
    circuit->monitors.reset_monitors();
    run_cycles(*circuit, 3);
    check(history(*circuit, names, "rc") == bits("110"), "Cold start recharges");
}

void test_siggen() {
    std::cout << "\n--- Devices: Signal Generator ---\n";

    NameTable names;
    auto circuit = build(names, "DEVICES: SIGGEN g 0110; CONNECT: ; MONITOR: g; END;");
    circuit->devices.cold_startup();

    run_cycles(*circuit, 9);
    check(history(*circuit, names, "g") == bits("011001100"),
          "Waveform is emitted in order and wraps");
}

void test_switch_settings() {
    std::cout << "\n--- Devices: Switches ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH s 1, XOR x;
        CONNECT: s > x.I1, s > x.I2;
        MONITOR: ;
        END;
    )");

    check(!circuit->devices.set_switch(id_of(names, "x"), H), "Only switches can be set");

    set(*circuit, names, "s", L);
    check(out(*circuit, names, "s") == L, "Setting takes effect on the output");
    circuit->devices.cold_startup();
    check(out(*circuit, names, "s") == H, "Cold start restores the declared state");
    check(circuit->devices.find_devices(DeviceKind::SWITCH).size() == 1, "One switch");
}

// ==============================================================================
// DTYPE
// ==============================================================================

static const char* kDtypeCircuit = R"(
    DEVICES: SWITCH data 0, SWITCH clk 0, SWITCH set 0, SWITCH clr 0, DTYPE d;
    CONNECT: data > d.DATA, clk > d.CLK, set > d.SET, clr > d.CLEAR;
    MONITOR: d.Q;
    END;
)";

void test_dtype_edge() {
    std::cout << "\n--- DTYPE: Rising Edge ---\n";

    NameTable names;
    auto circuit = build(names, kDtypeCircuit);
    circuit->devices.cold_startup();
    check(out(*circuit, names, "d", "Q") == L && out(*circuit, names, "d", "QBAR") == H,
          "Cold start gives Q=0, QBAR=1");

    set(*circuit, names, "data", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == L, "No latch while CLK stays LOW");

    set(*circuit, names, "clk", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == H, "Latches DATA on the rising edge");
    check(out(*circuit, names, "d", "QBAR") == L, "QBAR is the complement");

    set(*circuit, names, "data", L);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == H, "No latch while CLK stays HIGH");

    set(*circuit, names, "clk", L);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == H, "No latch on the falling edge");

    set(*circuit, names, "clk", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == L, "Next rising edge latches the new DATA");
}

void test_dtype_set_clear() {
    std::cout << "\n--- DTYPE: Set and Clear ---\n";

    NameTable names;
    auto circuit = build(names, kDtypeCircuit);
    circuit->devices.cold_startup();

    set(*circuit, names, "set", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == H, "SET forces Q=1 without a clock edge");

    set(*circuit, names, "clk", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == H, "SET wins over DATA on a rising edge");

    set(*circuit, names, "set", L);
    set(*circuit, names, "clr", H);
    set(*circuit, names, "data", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == L, "CLEAR forces Q=0");
    check(out(*circuit, names, "d", "QBAR") == H, "QBAR follows");

    set(*circuit, names, "set", H);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d", "Q") == H, "SET takes priority over CLEAR");
}

void test_dtype_divider() {
    std::cout << "\n--- DTYPE: Clock Divider ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: CLOCK c 1, SWITCH zero 0, DTYPE d;
        CONNECT: c > d.CLK, d.QBAR > d.DATA, zero > d.SET, zero > d.CLEAR;
        MONITOR: c, d.Q;
        END;
    )");
    circuit->devices.cold_startup();

    run_cycles(*circuit, 6);
    check(history(*circuit, names, "c") == bits("101010"), "Clock toggles every cycle");
    check(history(*circuit, names, "d", "Q") == bits("110011"),
          "Q toggles once per clock period");
}

void test_dtype_shift_register() {
    std::cout << "\n--- DTYPE: Shift Register ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: CLOCK c 1, SWITCH in 1, SWITCH zero 0, DTYPE d1, DTYPE d2;
        CONNECT: c > d1.CLK, c > d2.CLK, in > d1.DATA, d1.Q > d2.DATA,
                 zero > d1.SET, zero > d1.CLEAR, zero > d2.SET, zero > d2.CLEAR;
        MONITOR: d1.Q, d2.Q;
        END;
    )");
    circuit->devices.cold_startup();

    run_cycles(*circuit, 1);
    check(out(*circuit, names, "d1", "Q") == H, "First stage latches on the edge");
    check(out(*circuit, names, "d2", "Q") == L, "Second stage sees the value from before the edge");

    run_cycles(*circuit, 2);
    check(out(*circuit, names, "d2", "Q") == H, "Second stage latches on the next edge");
}

// ==============================================================================
// Runtime Errors
// ==============================================================================

void test_floating_input() {
    std::cout << "\n--- Runtime: Floating Input ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH s 1, AND a 2, CLOCK c 1;
        CONNECT: s > a.I1;
        MONITOR: c;
        END;
    )");
    circuit->devices.cold_startup();

    auto floating = circuit->network.find_floating_inputs();
    check(floating.size() == 1, "One floating input");
    check(!circuit->network.check_network(), "Network check fails");

    std::string message;
    try {
        circuit->network.execute_cycle();
    } catch (const FloatingInputError& e) {
        message = e.what();
        check(e.device() == "a" && e.pin() == "I2", "Error names the device and pin");
    }
    check(message.find("a.I2") != std::string::npos, "Message mentions a.I2");
    check(out(*circuit, names, "c") == L, "Clock did not advance");
    check(circuit->monitors.get_monitors()[0].history.empty(), "Nothing recorded");
}

void test_oscillation_is_atomic() {
    std::cout << "\n--- Runtime: Oscillation ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH s 0, NAND n 2, CLOCK c 1, SIGGEN g 01;
        CONNECT: s > n.I1, n > n.I2;
        MONITOR: n;
        END;
    )");
    circuit->devices.cold_startup();

    run_cycles(*circuit, 1);
    check(out(*circuit, names, "n") == H, "Stable while s is LOW");
    check(out(*circuit, names, "c") == H, "Clock advanced");
    auto saved = circuit->devices.save_state();

    set(*circuit, names, "s", H);
    bool threw = false;
    try {
        circuit->network.execute_cycle();
    } catch (const OscillationError& e) {
        threw = (e.passes() == circuit->network.settle_limit());
    }
    check(threw, "NAND feeding itself oscillates");
    check(circuit->network.settle_limit() == 2 * 4 + 20, "Limit is 2 per device plus 20");
    check(out(*circuit, names, "n") == H, "Gate output restored");
    check(out(*circuit, names, "c") == H, "Clock restored");
    check(std::get<SiggenState>(circuit->devices.get_device(id_of(names, "g"))->state).cursor ==
          std::get<SiggenState>(saved[3].state).cursor, "Siggen cursor restored");
    check(history(*circuit, names, "n").size() == 1, "Failed cycle is not recorded");

    set(*circuit, names, "s", L);
    run_cycles(*circuit, 1);
    check(out(*circuit, names, "c") == L, "Simulation continues after the circuit is fixed");
}

// ==============================================================================
// Monitors
// ==============================================================================

static const char* kMonitorCircuit = R"(
    DEVICES: SWITCH s 1, AND a 1;
    CONNECT: s > a.I1;
    MONITOR: s;
    END;
)";

void test_late_monitor() {
    std::cout << "\n--- Monitors: Added Late ---\n";

    NameTable names;
    auto circuit = build(names, kMonitorCircuit);
    circuit->devices.cold_startup();
    run_cycles(*circuit, 3);

    MonitorSet& monitors = circuit->monitors;
    check(monitors.make_monitor(id_of(names, "a"), std::nullopt) == MonitorStatus::OK,
          "Monitor added after three cycles");
    check(history(*circuit, names, "a").empty(), "New monitor starts empty");

    run_cycles(*circuit, 2);
    check(history(*circuit, names, "a").size() == 2, "Two cycles recorded, not five");
    check(history(*circuit, names, "s").size() == 5, "Older monitor has all five");
    check(monitors.max_history_length() == 5, "Longest history");

    auto traces = monitors.get_aligned_traces();
    check(traces.size() == 2 && traces[1].size() == 5, "Traces padded to the same length");
    check(!traces[1][0] && !traces[1][2] && traces[1][3] == H, "Padding comes first");

    std::ostringstream os;
    monitors.render_traces(os);
    check(os.str() == "s : -----\na :    --\n", "Text waveforms");
}

void test_monitor_registration() {
    std::cout << "\n--- Monitors: Registration ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: SWITCH s 1, DTYPE d;
        CONNECT: s > d.DATA, s > d.CLK, s > d.SET, s > d.CLEAR;
        MONITOR: ;
        END;
    )");
    MonitorSet& monitors = circuit->monitors;
    NameId s = id_of(names, "s");
    NameId d = id_of(names, "d");

    check(monitors.make_monitor(s, std::nullopt) == MonitorStatus::OK, "Switch monitored");
    check(monitors.make_monitor(s, std::nullopt) == MonitorStatus::MONITOR_PRESENT,
          "Second registration refused");
    check(monitors.make_monitor(d, std::nullopt) == MonitorStatus::NOT_OUTPUT,
          "DTYPE has no unnamed output");
    check(monitors.make_monitor(id_of(names, "I1"), std::nullopt) ==
          MonitorStatus::DEVICE_ABSENT, "Pin name is not a device");
    check(monitors.make_monitor(d, id_of(names, "QBAR")) == MonitorStatus::OK, "d.QBAR monitored");
    check(monitors.get_signal_name(monitors.get_monitors()[1]) == "d.QBAR", "Signal name");

    check(monitors.remove_monitor(s, std::nullopt) == MonitorStatus::OK, "Monitor removed");
    check(!monitors.is_monitored(s, std::nullopt), "No longer monitored");
    check(monitors.remove_monitor(s, std::nullopt) == MonitorStatus::NOT_MONITORED,
          "Removing twice is refused");
    check(monitors.size() == 1, "One monitor left");
}

void test_reset_semantics() {
    std::cout << "\n--- Monitors: Reset ---\n";

    NameTable names;
    auto circuit = build(names, R"(
        DEVICES: CLOCK c 1;
        CONNECT: ;
        MONITOR: c;
        END;
    )");
    circuit->devices.cold_startup();
    run_cycles(*circuit, 3);

    circuit->devices.cold_startup();
    check(history(*circuit, names, "c").size() == 3, "Cold start keeps the histories");
    check(out(*circuit, names, "c") == L, "Cold start resets the devices");

    circuit->monitors.reset_monitors();
    check(history(*circuit, names, "c").empty(), "reset_monitors empties the histories");
    check(circuit->monitors.is_monitored(id_of(names, "c"), std::nullopt),
          "Registrations survive the reset");
    check(out(*circuit, names, "c") == L, "reset_monitors leaves the devices alone");
}

// ==============================================================================
// Determinism and Registry
// ==============================================================================

void test_determinism() {
    std::cout << "\n--- Network: Determinism ---\n";

    const std::string source = R"(
        DEVICES: CLOCK c 2, SIGGEN g 1101, RC r 3, SWITCH zero 0,
                 DTYPE d, XOR x, NOR n 2;
        CONNECT: c > d.CLK, x > d.DATA, zero > d.SET, zero > d.CLEAR,
                 g > x.I1, d.Q > x.I2, r > n.I1, d.QBAR > n.I2;
        MONITOR: d.Q, x, n;
        END;
    )";

    NameTable names_a;
    NameTable names_b;
    auto first = build(names_a, source);
    auto second = build(names_b, source);
    first->devices.cold_startup();
    second->devices.cold_startup();
    run_cycles(*first, 30);
    run_cycles(*second, 30);

    bool same = true;
    for (const char* device : {"x", "n"}) {
        same = same && history(*first, names_a, device) == history(*second, names_b, device);
    }
    same = same && history(*first, names_a, "d", "Q") == history(*second, names_b, "d", "Q");
    check(same, "Two runs of the same circuit give identical traces");
}

void test_registry_direct() {
    std::cout << "\n--- Registry: Direct Construction ---\n";

    NameTable names;
    Circuit circuit(names);
    NameId sw = names.lookup("sw");
    NameId gate = names.lookup("gate");

    circuit.devices.create(DeviceKind::SWITCH, sw, "1");
    circuit.devices.create(DeviceKind::OR, gate, "2");

    bool duplicate = false;
    try {
        circuit.devices.create(DeviceKind::SWITCH, sw, "0");
    } catch (const DuplicateDeviceError&) {
        duplicate = true;
    }
    check(duplicate, "Duplicate id throws DuplicateDeviceError");

    bool bad_parameter = false;
    try {
        circuit.devices.create(DeviceKind::XOR, names.lookup("x"), "2");
    } catch (const InvalidParameterError&) {
        bad_parameter = true;
    }
    check(bad_parameter, "XOR with a parameter throws InvalidParameterError");
    check(!circuit.devices.has_device(names.lookup("x")), "Rejected device is not added");

    const PinIds& pins = circuit.devices.pins();
    Network& network = circuit.network;
    check(network.make_connection(sw, std::nullopt, gate, pins.gate_inputs[0]) ==
          ConnectStatus::OK, "Connect sw > gate.I1");
    check(network.make_connection(sw, std::nullopt, gate, pins.gate_inputs[0]) ==
          ConnectStatus::INPUT_CONNECTED, "Second source refused");
    check(network.make_connection(sw, std::nullopt, gate, pins.gate_inputs[2]) ==
          ConnectStatus::PORT_ABSENT, "I3 does not exist on a 2-input gate");
    check(network.make_connection(sw, pins.q, gate, pins.gate_inputs[1]) ==
          ConnectStatus::PORT_ABSENT, "Switch has no Q output");
    check(network.make_connection(names.lookup("nobody"), std::nullopt, gate,
                                  pins.gate_inputs[1]) == ConnectStatus::DEVICE_ABSENT,
          "Unknown source device");

    auto floating = network.find_floating_inputs();
    check(floating.size() == 1 && floating[0].first == gate &&
          floating[0].second == pins.gate_inputs[1], "gate.I2 floats");
    check(circuit.devices.find_devices() == std::vector<NameId>({sw, gate}),
          "Devices in creation order");
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "==================================================\n";
    std::cout << "Simulation Tests\n";
    std::cout << "==================================================\n";

    // Combinational logic
    test_fan_out_and();
    test_gate_truth_tables();
    test_wide_gate();
    test_sr_latch_settles();

    // Sources
    test_clock();
    test_rc();
    test_siggen();
    test_switch_settings();

    // DTYPE
    test_dtype_edge();
    test_dtype_set_clear();
    test_dtype_divider();
    test_dtype_shift_register();

    // Runtime errors
    test_floating_input();
    test_oscillation_is_atomic();

    // Monitors
    test_late_monitor();
    test_monitor_registration();
    test_reset_semantics();

    // Determinism and registry
    test_determinism();
    test_registry_direct();

    std::cout << "\n==================================================\n";
    std::cout << "Results: " << pass_count << "/" << test_count << " passed\n";
    std::cout << "==================================================\n";

    return (pass_count == test_count) ? 0 : 1;
}
