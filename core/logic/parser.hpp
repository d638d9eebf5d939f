// ==============================================================================
// Circuit Parser
// ==============================================================================
// One-pass recursive descent parser for circuit definition files:
//
//   DEVICES: <device>, ... ;  CONNECT: <connection>, ... ;
//   MONITOR: <monitor>, ... ;  END;
//
// Syntax errors are recorded and the parser skips to the next ',' or ';' so
// later errors in the same file are still found. Well-formed statements are
// checked for meaning (duplicate/undefined devices, bad pins, inputs that
// already have a source, parameters out of range, repeated monitors) and
// then used to build a fresh Circuit.
// ==============================================================================

#ifndef LOGSIM_LOGIC_PARSER_HPP
#define LOGSIM_LOGIC_PARSER_HPP

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include "circuit.hpp"
#include "diagnostics.hpp"
#include "names.hpp"
#include "scanner.hpp"

namespace logsim {

struct BuildResult {
    // True iff no lexical, syntax or semantic error was found (warnings allowed)
    bool success = false;
    Diagnostics diagnostics;

    // Whatever could be built, also on failure; never simulate it unless
    // success is true
    std::unique_ptr<Circuit> circuit;
};

class Parser {
public:
    Parser(NameTable& names, const std::string& source,
           const std::string& filename = "<circuit>");

    /**
     * @brief Parse the whole source and return the built circuit
     *
     * A Parser builds exactly one circuit.
     *
     * @throws InternalError if called a second time
     */
    BuildResult build_network();

private:
    enum Section { DEVICES = 0, CONNECT = 1, MONITOR = 2, END = 3 };
    using ItemParser = bool (Parser::*)();

    // Symbol handling
    void advance();
    bool at(SymbolType type) const { return current_.type == type; }
    bool at_keyword(NameId keyword) const;
    bool at_section_keyword() const;
    bool at_later_section(Section section) const;
    std::optional<Symbol> expect(SymbolType type, const std::string& what);
    void skip_to_separator();

    // Grammar
    void parse_section(Section section, bool allow_empty, ItemParser item);
    void parse_end();
    bool parse_device();
    bool parse_connection();
    bool parse_monitor();
    std::optional<Symbol> parse_device_name();
    std::optional<Symbol> parse_output_pin();
    std::optional<Symbol> parse_input_pin();

    // Semantics
    void check_device(DeviceKind kind, const Symbol& name, const Symbol& parameter);
    void check_connection(const Symbol& source, const std::optional<Symbol>& source_pin,
                          const Symbol& target, const Symbol& target_pin);
    void check_monitor(const Symbol& device, const std::optional<Symbol>& pin);
    bool check_defined(const Symbol& device);
    bool check_output_pin(const Symbol& device, const std::optional<Symbol>& pin);

    // Diagnostics
    void syntax_error(const Symbol& at, DiagnosticCode code, const std::string& message);
    void semantic_error(const Symbol& at, DiagnosticCode code, const std::string& message,
                        Severity severity = Severity::ERROR);
    void report(const Symbol& at, ErrorCategory category, DiagnosticCode code,
                const std::string& message, Severity severity);
    void unexpected_end_of_file();
    static std::string describe(const Symbol& symbol);

    NameTable& names_;
    Scanner scanner_;
    std::string filename_;

    Symbol current_;
    Diagnostics diagnostics_;
    std::unique_ptr<Circuit> circuit_;

    // Devices whose declaration had a syntax error or a bad parameter;
    // later references to them aren't reported as undefined
    std::unordered_set<NameId> broken_devices_;
    // Every name a declaration got as far as, built or not
    std::unordered_set<NameId> declared_devices_;

    NameId section_keywords_[4];
    bool eof_reported_ = false;
    LineNumber last_syntax_line_ = 0;
    ColumnNumber last_syntax_column_ = 0;
    bool built_ = false;
};

/**
 * @brief Parse circuit source text into a fresh circuit
 *
 * @param names Name table shared with the simulation driver
 * @param source Circuit definition text
 * @param filename Name used in diagnostics
 */
BuildResult build_network(NameTable& names, const std::string& source,
                          const std::string& filename = "<circuit>");

}  // namespace logsim

#endif  // LOGSIM_LOGIC_PARSER_HPP
