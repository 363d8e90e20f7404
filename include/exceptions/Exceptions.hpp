#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace cyberrisk {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the risk quantification core.
 */
class RiskModelException : public std::runtime_error {
public:
    /**
     * @brief Construct a RiskModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    RiskModelException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    RiskModelException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Malformed or constraint-violating input, detected before any computation.
 */
class InvalidParameterException : public RiskModelException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : RiskModelException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : RiskModelException(file, line, functionName, "Invalid Parameter", message) {}
};

/**
 * @brief A well-formed query whose answer is mathematically undefined.
 */
class DomainErrorException : public RiskModelException {
public:
    DomainErrorException(const std::string& functionName, const std::string& message)
        : RiskModelException(functionName, "Domain Error: " + message) {}
    DomainErrorException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : RiskModelException(file, line, functionName, category, message) {}
};

/**
 * @brief Conditioning event or denominator with zero probability.
 */
class DivisionByZeroException : public DomainErrorException {
public:
    DivisionByZeroException(const std::string& functionName, const std::string& message)
        : DomainErrorException(functionName, "Division By Zero: " + message) {}
    DivisionByZeroException(const char* file, int line, const std::string& functionName, const std::string& message)
        : DomainErrorException(file, line, functionName, "Division By Zero", message) {}
};

/**
 * @brief Raised at a cooperative cancellation point. No partial result exists.
 */
class SimulationCancelledException : public RiskModelException {
public:
    /**
     * @brief Construct a SimulationCancelledException.
     * @param functionName Name of the function that observed the cancellation.
     * @param message Phase at which the run was abandoned.
     */
    SimulationCancelledException(const std::string& functionName, const std::string& message)
        : RiskModelException(functionName, "Cancelled: " + message) {}
    SimulationCancelledException(const char* file, int line, const std::string& functionName, const std::string& message)
        : RiskModelException(file, line, functionName, "Cancelled", message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public RiskModelException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : RiskModelException(functionName, "Data Format Error: " + message) {}
};

} // namespace cyberrisk

#define THROW_INVALID_PARAM(func, msg) throw cyberrisk::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_DIVISION_BY_ZERO(func, msg) throw cyberrisk::DivisionByZeroException(__FILE__, __LINE__, func, msg)
#define THROW_CANCELLED(func, msg) throw cyberrisk::SimulationCancelledException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
