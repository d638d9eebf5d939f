// ==============================================================================
// Error Handling
// ==============================================================================
// This file defines error categories and exception classes for the simulator.
// Problems found in a circuit file are collected as diagnostics (see
// diagnostics.hpp) so that many can be reported at once; the exceptions here
// cover everything that has to abort an operation instead.
// ==============================================================================

#ifndef LOGSIM_COMMON_ERROR_HPP
#define LOGSIM_COMMON_ERROR_HPP

#include <exception>
#include <string>
#include <sstream>
#include "types.hpp"

namespace logsim {

// ==============================================================================
// Error Categories
// ==============================================================================

/**
 * @brief Different categories of errors that can occur
 *
 * - LEXICAL_ERROR: A character the circuit language does not know
 * - SYNTAX_ERROR: The symbols don't follow the grammar
 * - SEMANTIC_ERROR: Well-formed, but meaningless (duplicate device, bad pin...)
 * - RUNTIME_ERROR: Error during simulation (floating input, oscillation)
 * - FILE_ERROR: Couldn't read a circuit file
 * - INTERNAL_ERROR: Bug in the simulator itself (shouldn't happen!)
 */
enum class ErrorCategory {
    LEXICAL_ERROR,
    SYNTAX_ERROR,
    SEMANTIC_ERROR,
    RUNTIME_ERROR,
    FILE_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert ErrorCategory to string for display
 */
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::LEXICAL_ERROR:  return "Lexical Error";
        case ErrorCategory::SYNTAX_ERROR:   return "Syntax Error";
        case ErrorCategory::SEMANTIC_ERROR: return "Semantic Error";
        case ErrorCategory::RUNTIME_ERROR:  return "Runtime Error";
        case ErrorCategory::FILE_ERROR:     return "File Error";
        case ErrorCategory::INTERNAL_ERROR: return "Internal Error";
        default:                            return "Unknown Error";
    }
}

// ==============================================================================
// Base Exception Class
// ==============================================================================

/**
 * @brief Base exception class for all simulator errors
 *
 * Example usage:
 *   throw LogsimError(ErrorCategory::FILE_ERROR, "adder.def", 0,
 *                     "Could not open circuit file");
 *
 * This will produce:
 *   File Error in adder.def - Could not open circuit file
 */
class LogsimError : public std::exception {
public:
    /**
     * @brief Construct an error with full context
     *
     * @param category What kind of error
     * @param file Which file the error is in
     * @param line Which line number (0 if unknown)
     * @param message Description of what went wrong
     */
    LogsimError(ErrorCategory category,
                const std::string& file,
                LineNumber line,
                const std::string& message)
        : category_(category)
        , file_(file)
        , line_(line)
        , message_(message)
    {
        std::ostringstream oss;
        oss << error_category_to_string(category);

        if (!file.empty()) {
            oss << " in " << file;
            if (line > 0) {
                oss << ":" << line;
            }
        }

        oss << " - " << message;
        full_message_ = oss.str();
    }

    /**
     * @brief Construct a simple error without file context
     */
    LogsimError(ErrorCategory category, const std::string& message)
        : LogsimError(category, "", 0, message)
    {}

    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCategory category() const { return category_; }
    const std::string& file() const { return file_; }
    LineNumber line() const { return line_; }

    /**
     * @brief Get just the error message (without category/file/line)
     */
    const std::string& message() const { return message_; }

private:
    ErrorCategory category_;
    std::string file_;
    LineNumber line_;
    std::string message_;
    std::string full_message_;  // Cached formatted message
};

// ==============================================================================
// Specific Exception Types
// ==============================================================================

/**
 * @brief Semantic error raised by the device registry
 *
 * The parser catches these and turns them into diagnostics.
 */
class SemanticError : public LogsimError {
public:
    explicit SemanticError(const std::string& message)
        : LogsimError(ErrorCategory::SEMANTIC_ERROR, message)
    {}
};

/**
 * @brief A device parameter outside the domain of its kind
 *
 * Examples:
 * - AND gate with 17 inputs
 * - CLOCK with a period of 0
 * - SIGGEN waveform containing a 2
 */
class InvalidParameterError : public SemanticError {
public:
    explicit InvalidParameterError(const std::string& message)
        : SemanticError(message)
    {}
};

/**
 * @brief A device id that is already taken in the registry
 */
class DuplicateDeviceError : public SemanticError {
public:
    explicit DuplicateDeviceError(const std::string& message)
        : SemanticError(message)
    {}
};

/**
 * @brief Runtime error - something went wrong while simulating a cycle
 */
class RuntimeError : public LogsimError {
public:
    explicit RuntimeError(const std::string& message)
        : LogsimError(ErrorCategory::RUNTIME_ERROR, message)
    {}
};

/**
 * @brief An input pin with no source was reached during a cycle
 */
class FloatingInputError : public RuntimeError {
public:
    FloatingInputError(const std::string& device, const std::string& pin)
        : RuntimeError("Input " + device + "." + pin + " is not connected")
        , device_(device)
        , pin_(pin)
    {}

    const std::string& device() const { return device_; }
    const std::string& pin() const { return pin_; }

private:
    std::string device_;
    std::string pin_;
};

/**
 * @brief Combinational logic did not settle within the iteration cap
 */
class OscillationError : public RuntimeError {
public:
    explicit OscillationError(size_t passes)
        : RuntimeError("Network did not settle after " + std::to_string(passes) +
                       " passes (combinational loop is oscillating)")
        , passes_(passes)
    {}

    size_t passes() const { return passes_; }

private:
    size_t passes_;
};

/**
 * @brief File error - couldn't read a circuit file
 */
class FileError : public LogsimError {
public:
    FileError(const std::string& file, const std::string& message)
        : LogsimError(ErrorCategory::FILE_ERROR, file, 0, message)
    {}
};

/**
 * @brief Internal error - bug in the simulator itself
 *
 * These should never happen in a correct implementation.
 */
class InternalError : public LogsimError {
public:
    explicit InternalError(const std::string& message)
        : LogsimError(ErrorCategory::INTERNAL_ERROR, message)
    {}
};

/**
 * @brief A NameId that the NameTable never handed out
 */
class UnknownIdError : public InternalError {
public:
    explicit UnknownIdError(NameId id)
        : InternalError("Unknown name id: " + std::to_string(id))
        , id_(id)
    {}

    NameId id() const { return id_; }

private:
    NameId id_;
};

// ==============================================================================
// Error Reporting Helpers
// ==============================================================================

/**
 * @brief Build a message from any streamable pieces
 *
 * Example:
 *   build_error_message("Device ", name, " has no input ", pin)
 */
template<typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

}  // namespace logsim

#endif  // LOGSIM_COMMON_ERROR_HPP
