// ==============================================================================
// Circuit Parser Implementation
// ==============================================================================

#include "parser.hpp"
#include "error.hpp"

namespace logsim {

namespace {

const char* const kSectionNames[] = {"DEVICES", "CONNECT", "MONITOR", "END"};

const char* parameter_description(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::SWITCH: return "switch state (0 or 1)";
        case DeviceKind::CLOCK:  return "clock half period";
        case DeviceKind::RC:     return "RC period";
        case DeviceKind::SIGGEN: return "waveform of 0s and 1s";
        case DeviceKind::AND:
        case DeviceKind::OR:
        case DeviceKind::NAND:
        case DeviceKind::NOR:    return "number of inputs (1-16)";
        case DeviceKind::XOR:
        case DeviceKind::DTYPE:  break;
    }
    return "parameter";
}

bool takes_parameter(DeviceKind kind) {
    return kind != DeviceKind::XOR && kind != DeviceKind::DTYPE;
}

// Parameters that are plain decimal numbers (no leading zero allowed)
bool is_decimal_parameter(DeviceKind kind) {
    return kind == DeviceKind::CLOCK || kind == DeviceKind::RC || is_multi_input_gate(kind);
}

}  // namespace

Parser::Parser(NameTable& names, const std::string& source, const std::string& filename)
    : names_(names)
    , scanner_(names, source)
    , filename_(filename)
    , circuit_(std::make_unique<Circuit>(names))
{
    for (int i = 0; i < 4; i++) {
        section_keywords_[i] = names_.lookup(kSectionNames[i]);
    }
}

BuildResult build_network(NameTable& names, const std::string& source,
                          const std::string& filename) {
    Parser parser(names, source, filename);
    return parser.build_network();
}

// ==============================================================================
// Public API
// ==============================================================================

BuildResult Parser::build_network() {
    if (built_) {
        throw InternalError("Parser::build_network called twice; parse into a new Parser");
    }
    built_ = true;

    advance();
    parse_section(DEVICES, false, &Parser::parse_device);
    parse_section(CONNECT, true, &Parser::parse_connection);
    parse_section(MONITOR, true, &Parser::parse_monitor);
    parse_end();

    BuildResult result;
    result.success = !diagnostics_.has_errors();
    result.diagnostics = std::move(diagnostics_);
    result.circuit = std::move(circuit_);
    return result;
}

// ==============================================================================
// Symbol Handling
// ==============================================================================

void Parser::advance() {
    current_ = scanner_.get_symbol();
    while (current_.type == SymbolType::INVALID) {
        if (current_.text == "!") {
            report(current_, ErrorCategory::LEXICAL_ERROR, DiagnosticCode::UNTERMINATED_COMMENT,
                   "Comment opened with '!' is never closed", Severity::ERROR);
        } else {
            report(current_, ErrorCategory::LEXICAL_ERROR, DiagnosticCode::INVALID_CHARACTER,
                   "Invalid character '" + current_.text + "'", Severity::ERROR);
        }
        current_ = scanner_.get_symbol();
    }
}

bool Parser::at_keyword(NameId keyword) const {
    return current_.type == SymbolType::KEYWORD && current_.id == keyword;
}

bool Parser::at_section_keyword() const {
    for (NameId keyword : section_keywords_) {
        if (at_keyword(keyword)) return true;
    }
    return false;
}

bool Parser::at_later_section(Section section) const {
    for (int i = section + 1; i <= END; i++) {
        if (at_keyword(section_keywords_[i])) return true;
    }
    return false;
}

std::optional<Symbol> Parser::expect(SymbolType type, const std::string& what) {
    if (at(type)) {
        Symbol sym = current_;
        advance();
        return sym;
    }
    if (at(SymbolType::END_OF_FILE)) {
        unexpected_end_of_file();
    } else {
        syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                     "Expected " + what + ", got " + describe(current_));
    }
    return std::nullopt;
}

void Parser::skip_to_separator() {
    while (!at(SymbolType::COMMA) && !at(SymbolType::SEMICOLON) &&
           !at(SymbolType::END_OF_FILE) && !at_section_keyword()) {
        advance();
    }
}

// ==============================================================================
// Sections
// ==============================================================================

void Parser::parse_section(Section section, bool allow_empty, ItemParser item) {
    const std::string name = kSectionNames[section];
    const NameId keyword = section_keywords_[section];

    if (!at_keyword(keyword)) {
        if (at(SymbolType::END_OF_FILE)) {
            unexpected_end_of_file();
            return;
        }
        syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                     "Expected '" + name + ":', got " + describe(current_));
        while (!at(SymbolType::END_OF_FILE) && !at_keyword(keyword) &&
               !at_later_section(section)) {
            advance();
        }
        if (!at_keyword(keyword)) return;   // section missing altogether
    }
    advance();

    if (at(SymbolType::COLON)) {
        advance();
    } else {
        syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                     "Expected ':' after " + name + ", got " + describe(current_));
    }

    if (at(SymbolType::SEMICOLON)) {
        if (!allow_empty) {
            syntax_error(current_, DiagnosticCode::MISSING_DEVICES,
                         "There should be at least one device");
        }
        advance();
        return;
    }

    while (true) {
        if (!(this->*item)()) {
            skip_to_separator();
        } else if (!at(SymbolType::COMMA) && !at(SymbolType::SEMICOLON) &&
                   !at(SymbolType::END_OF_FILE) && !at_section_keyword()) {
            syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                         "Expected ',' or ';', got " + describe(current_));
            skip_to_separator();
        }

        if (at(SymbolType::COMMA)) {
            advance();
            continue;
        }
        if (at(SymbolType::SEMICOLON)) {
            advance();
            return;
        }
        if (at(SymbolType::END_OF_FILE)) {
            unexpected_end_of_file();
            return;
        }
        syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                     "Expected ';' to end the " + name + " section before " +
                     describe(current_));
        return;
    }
}

void Parser::parse_end() {
    if (!at_keyword(section_keywords_[END])) {
        if (at(SymbolType::END_OF_FILE)) {
            unexpected_end_of_file();
        } else {
            syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                         "Expected 'END;', got " + describe(current_));
        }
        return;
    }
    advance();
    if (!expect(SymbolType::SEMICOLON, "';' after END")) return;

    if (!at(SymbolType::END_OF_FILE)) {
        syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                     "Unexpected " + describe(current_) + " after 'END;'");
    }
}

// ==============================================================================
// Statements
// ==============================================================================

bool Parser::parse_device() {
    std::optional<DeviceKind> kind;
    if (at(SymbolType::KEYWORD)) {
        kind = device_kind_from_string(current_.text);
    }
    if (!kind) {
        if (at(SymbolType::END_OF_FILE)) {
            unexpected_end_of_file();
        } else {
            syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                         "Expected a device kind (SWITCH, CLOCK, AND, NAND, OR, NOR, "
                         "XOR, DTYPE, RC, SIGGEN), got " + describe(current_));
        }
        return false;
    }
    advance();

    std::optional<Symbol> name = parse_device_name();
    if (!name) return false;

    Symbol parameter = current_;
    if (takes_parameter(*kind)) {
        if (!at(SymbolType::NUMBER)) {
            if (at(SymbolType::END_OF_FILE)) {
                unexpected_end_of_file();
            } else {
                syntax_error(current_, DiagnosticCode::UNEXPECTED_SYMBOL,
                             build_error_message("Expected ", parameter_description(*kind),
                                                 " for ", device_kind_to_string(*kind),
                                                 " ", name->text, ", got ", describe(current_)));
            }
            declared_devices_.insert(name->id);
            broken_devices_.insert(name->id);
            return false;
        }
        if (is_decimal_parameter(*kind) && parameter.text.size() > 1 &&
            parameter.text[0] == '0') {
            syntax_error(parameter, DiagnosticCode::UNEXPECTED_SYMBOL,
                         "Number '" + parameter.text + "' should not have a leading zero");
            declared_devices_.insert(name->id);
            broken_devices_.insert(name->id);
            advance();
            return false;
        }
        advance();
    } else {
        parameter.text.clear();
    }

    check_device(*kind, *name, parameter);
    return true;
}

bool Parser::parse_connection() {
    std::optional<Symbol> source = parse_device_name();
    if (!source) return false;

    std::optional<Symbol> source_pin;
    if (at(SymbolType::DOT)) {
        advance();
        source_pin = parse_output_pin();
        if (!source_pin) return false;
    }

    if (!expect(SymbolType::ARROW, "'>'")) return false;

    std::optional<Symbol> target = parse_device_name();
    if (!target) return false;
    if (!expect(SymbolType::DOT, "'.' and an input pin after " + target->text)) return false;
    std::optional<Symbol> target_pin = parse_input_pin();
    if (!target_pin) return false;

    check_connection(*source, source_pin, *target, *target_pin);
    return true;
}

bool Parser::parse_monitor() {
    std::optional<Symbol> device = parse_device_name();
    if (!device) return false;

    std::optional<Symbol> pin;
    if (at(SymbolType::DOT)) {
        advance();
        pin = parse_output_pin();
        if (!pin) return false;
    }

    check_monitor(*device, pin);
    return true;
}

std::optional<Symbol> Parser::parse_device_name() {
    if (at(SymbolType::NAME)) {
        Symbol sym = current_;
        advance();
        return sym;
    }
    if (at(SymbolType::END_OF_FILE)) {
        unexpected_end_of_file();
    } else {
        syntax_error(current_, DiagnosticCode::INVALID_DEVICE_NAME,
                     "Expected a device name (a letter followed by letters, digits "
                     "or '_'), got " + describe(current_));
    }
    return std::nullopt;
}

std::optional<Symbol> Parser::parse_output_pin() {
    const PinIds& pins = circuit_->devices.pins();
    if (at(SymbolType::NAME) && pins.is_output_name(current_.id)) {
        Symbol sym = current_;
        advance();
        return sym;
    }
    if (at(SymbolType::END_OF_FILE)) {
        unexpected_end_of_file();
    } else {
        syntax_error(current_, DiagnosticCode::INVALID_PIN_NAME,
                     "Output pins can only be Q or QBAR, got " + describe(current_));
    }
    return std::nullopt;
}

std::optional<Symbol> Parser::parse_input_pin() {
    const PinIds& pins = circuit_->devices.pins();
    if (at(SymbolType::NAME) && pins.is_input_name(current_.id)) {
        Symbol sym = current_;
        advance();
        return sym;
    }
    if (at(SymbolType::END_OF_FILE)) {
        unexpected_end_of_file();
    } else {
        syntax_error(current_, DiagnosticCode::INVALID_PIN_NAME,
                     "The input pin should be one of I1..I16, DATA, CLK, SET, CLEAR, got " +
                     describe(current_));
    }
    return std::nullopt;
}

// ==============================================================================
// Semantic Checks
// ==============================================================================

void Parser::check_device(DeviceKind kind, const Symbol& name, const Symbol& parameter) {
    DeviceRegistry& devices = circuit_->devices;

    if (!declared_devices_.insert(name.id).second) {
        semantic_error(name, DiagnosticCode::DUPLICATE_DEVICE,
                       "Device names are not unique. " + name.text +
                       " is already the name of a device");
        return;
    }

    try {
        devices.create(kind, name.id, parameter.text);
    } catch (const InvalidParameterError& e) {
        semantic_error(parameter, DiagnosticCode::INVALID_ARGUMENT, e.message());
        broken_devices_.insert(name.id);
    }
}

bool Parser::check_defined(const Symbol& device) {
    if (circuit_->devices.has_device(device.id)) return true;
    if (broken_devices_.count(device.id) == 0) {
        semantic_error(device, DiagnosticCode::UNDEFINED_DEVICE,
                       "Device " + device.text + " is not defined");
    }
    return false;
}

bool Parser::check_output_pin(const Symbol& device, const std::optional<Symbol>& pin) {
    const DeviceRegistry& devices = circuit_->devices;
    OptionalPin pin_id = pin ? OptionalPin(pin->id) : std::nullopt;
    if (devices.is_output_pin(device.id, pin_id)) return true;

    const Device* dev = devices.get_device(device.id);
    const char* kind = device_kind_to_string(dev->kind);
    if (pin) {
        semantic_error(*pin, DiagnosticCode::INVALID_PIN,
                       build_error_message("Port ", pin->text, " is not defined for device ",
                                           device.text, " (", kind, " has a single unnamed output)"));
    } else {
        semantic_error(device, DiagnosticCode::INVALID_PIN,
                       build_error_message("Device ", device.text, " (", kind,
                                           ") has no unnamed output; use ", device.text,
                                           ".Q or ", device.text, ".QBAR"));
    }
    return false;
}

void Parser::check_connection(const Symbol& source, const std::optional<Symbol>& source_pin,
                              const Symbol& target, const Symbol& target_pin) {
    if (!check_defined(source) || !check_defined(target)) return;
    if (!check_output_pin(source, source_pin)) return;

    DeviceRegistry& devices = circuit_->devices;
    if (!devices.is_input_pin(target.id, target_pin.id)) {
        semantic_error(target_pin, DiagnosticCode::INVALID_PIN,
                       build_error_message("Port ", target_pin.text, " is not defined for device ",
                                           target.text, " (",
                                           device_kind_to_string(devices.get_device(target.id)->kind),
                                           ")"));
        return;
    }

    OptionalPin source_pin_id = source_pin ? OptionalPin(source_pin->id) : std::nullopt;
    ConnectStatus status = circuit_->network.make_connection(
        source.id, source_pin_id, target.id, target_pin.id);

    switch (status) {
        case ConnectStatus::OK:
            break;
        case ConnectStatus::INPUT_CONNECTED: {
            auto existing = circuit_->network.get_connected_output(target.id, target_pin.id);
            std::string driver = existing ? devices.pin_label(existing->device, existing->pin) : "?";
            semantic_error(target_pin, DiagnosticCode::INPUT_ALREADY_CONNECTED,
                           "A signal is already connected to input " + target.text + "." +
                           target_pin.text + " (from " + driver +
                           "). Only one signal may drive an input");
            break;
        }
        case ConnectStatus::DEVICE_ABSENT:
        case ConnectStatus::PORT_ABSENT:
            throw InternalError("Connection " + source.text + " > " + target.text + "." +
                                target_pin.text + " rejected after its checks passed");
    }
}

void Parser::check_monitor(const Symbol& device, const std::optional<Symbol>& pin) {
    if (!check_defined(device)) return;
    if (!check_output_pin(device, pin)) return;

    OptionalPin pin_id = pin ? OptionalPin(pin->id) : std::nullopt;
    MonitorStatus status = circuit_->monitors.make_monitor(device.id, pin_id);
    if (status == MonitorStatus::MONITOR_PRESENT) {
        semantic_error(pin ? *pin : device, DiagnosticCode::DUPLICATE_MONITOR,
                       "Monitor exists at " + circuit_->devices.pin_label(device.id, pin_id) +
                       " already; ignored", Severity::WARNING);
    } else if (status != MonitorStatus::OK) {
        throw InternalError("Monitor " + circuit_->devices.pin_label(device.id, pin_id) +
                            " rejected after its checks passed");
    }
}

// ==============================================================================
// Diagnostics
// ==============================================================================

std::string Parser::describe(const Symbol& symbol) {
    switch (symbol.type) {
        case SymbolType::END_OF_FILE:
            return "end of file";
        case SymbolType::KEYWORD:
        case SymbolType::NAME:
        case SymbolType::NUMBER:
            return std::string(symbol_type_to_string(symbol.type)) + " '" + symbol.text + "'";
        default:
            return symbol_type_to_string(symbol.type);
    }
}

void Parser::report(const Symbol& at, ErrorCategory category, DiagnosticCode code,
                    const std::string& message, Severity severity) {
    Diagnostic d;
    d.severity = severity;
    d.category = category;
    d.code = code;
    d.message = message;
    d.location.file = filename_;
    d.location.line = at.line;
    d.location.column = at.column;
    d.source_line = scanner_.get_line_text(at.line);
    diagnostics_.add(std::move(d));
}

void Parser::syntax_error(const Symbol& at, DiagnosticCode code, const std::string& message) {
    // One syntax error per position; the second is always a knock-on
    if (at.line == last_syntax_line_ && at.column == last_syntax_column_) return;
    last_syntax_line_ = at.line;
    last_syntax_column_ = at.column;
    report(at, ErrorCategory::SYNTAX_ERROR, code, message, Severity::ERROR);
}

void Parser::semantic_error(const Symbol& at, DiagnosticCode code, const std::string& message,
                            Severity severity) {
    report(at, ErrorCategory::SEMANTIC_ERROR, code, message, severity);
}

void Parser::unexpected_end_of_file() {
    if (eof_reported_) return;
    eof_reported_ = true;
    syntax_error(current_, DiagnosticCode::UNEXPECTED_END_OF_FILE,
                 "File ends too early. Check for missing sections or 'END;'");
}

}  // namespace logsim
