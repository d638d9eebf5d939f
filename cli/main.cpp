// ==============================================================================
// logsim - Command Line Logic Simulator
// ==============================================================================
// Usage: logsim <circuit file>
//
// Parses the circuit, prints any diagnostics and then reads commands from
// standard input until 'q' or end of input.
// ==============================================================================

#include <cctype>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include "logic_engine.hpp"

using namespace logsim;

namespace {

void print_usage(std::ostream& os) {
    os << "Usage: logsim <circuit file>\n"
       << "       logsim -h\n";
}

void print_help() {
    std::cout << "User commands:\n"
              << "r N       - run the simulation for N cycles\n"
              << "c N       - continue the simulation for N cycles\n"
              << "s X N     - set switch X to N (0 or 1)\n"
              << "m X       - set a monitor on signal X\n"
              << "z X       - zap the monitor on signal X\n"
              << "h         - help (this command)\n"
              << "q         - quit the program\n";
}

void print_traces(const LogicEngine& engine) {
    const Circuit* circuit = engine.get_circuit();
    if (!circuit || circuit->monitors.size() == 0) return;
    circuit->monitors.render_traces(std::cout);
}

// Positive cycle count, or std::nullopt with a message printed
std::optional<size_t> read_cycles(std::istringstream& args) {
    std::string text;
    if (!(args >> text)) {
        std::cout << "Error! Expected a number of cycles\n";
        return std::nullopt;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            std::cout << "Error! Expected a positive integer, got '" << text << "'\n";
            return std::nullopt;
        }
    }
    size_t cycles = 0;
    try {
        cycles = std::stoul(text);
    } catch (const std::out_of_range&) {
        std::cout << "Error! Number of cycles is too large\n";
        return std::nullopt;
    }
    if (cycles == 0) {
        std::cout << "Error! Expected a positive integer, got '" << text << "'\n";
        return std::nullopt;
    }
    return cycles;
}

std::optional<std::string> read_signal(std::istringstream& args) {
    std::string signal;
    if (!(args >> signal)) {
        std::cout << "Error! Expected a signal name\n";
        return std::nullopt;
    }
    return signal;
}

void report_run(const LogicEngine& engine, LogicState state, size_t cycles,
                const std::string& verb) {
    if (state == LogicState::ERROR) {
        std::cout << "Error! " << engine.get_error_message() << "\n";
    } else {
        std::cout << verb << " for " << cycles << " cycles\n";
    }
    print_traces(engine);
}

void command_loop(LogicEngine& engine) {
    std::cout << "Logic Simulator: interactive command line user interface.\n"
              << "Enter 'h' for help.\n";

    std::string line;
    while (true) {
        std::cout << "#: " << std::flush;
        if (!std::getline(std::cin, line)) break;

        std::istringstream args(line);
        std::string command;
        if (!(args >> command)) continue;

        if (command == "q") {
            break;
        } else if (command == "h") {
            print_help();
        } else if (command == "r") {
            if (auto cycles = read_cycles(args)) {
                report_run(engine, engine.run(*cycles), *cycles, "Running");
            }
        } else if (command == "c") {
            if (auto cycles = read_cycles(args)) {
                report_run(engine, engine.continue_run(*cycles), *cycles, "Continuing");
            }
        } else if (command == "s") {
            auto name = read_signal(args);
            if (!name) continue;
            int value = -1;
            if (!(args >> value) || !engine.set_switch(*name, value)) {
                std::cout << "Error! " << (value == -1 ? "Expected 0 or 1"
                                                       : engine.get_error_message()) << "\n";
                continue;
            }
            std::cout << "Successfully set switch " << *name << "\n";
        } else if (command == "m") {
            auto signal = read_signal(args);
            if (!signal) continue;
            if (engine.add_monitor(*signal)) {
                std::cout << "Successfully made monitor " << *signal << "\n";
            } else {
                std::cout << "Error! " << engine.get_error_message() << "\n";
            }
        } else if (command == "z") {
            auto signal = read_signal(args);
            if (!signal) continue;
            if (engine.remove_monitor(*signal)) {
                std::cout << "Successfully zapped monitor " << *signal << "\n";
            } else {
                std::cout << "Error! " << engine.get_error_message() << "\n";
            }
        } else {
            std::cout << "Invalid command. Enter 'h' for help.\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        print_usage(std::cerr);
        return 1;
    }
    std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
        print_usage(std::cout);
        print_help();
        return 0;
    }

    LogicEngine engine;
    bool loaded = engine.load_file(arg);
    engine.get_diagnostics().render_to(std::cerr);
    if (!loaded) {
        std::cerr << engine.get_error_message() << "\n";
        return 1;
    }

    command_loop(engine);
    return 0;
}
