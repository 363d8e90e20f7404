#ifndef CONFIG_READ_EXCEPTION_HPP
#define CONFIG_READ_EXCEPTION_HPP

#include "exceptions/Exceptions.hpp"
#include <string>

namespace cyberrisk {

/**
 * @brief Exception class for configuration file reading errors
 *
 * Represents the errors that can occur when loading scenario, control history,
 * optimization or joint-table configuration files.
 */
class ConfigReadException : public DataFormatException {
public:
    /**
     * @brief Types of configuration errors that can occur
     */
    enum class ErrorType {
        FileOpenError,       ///< Failed to open the configuration file
        MissingKey,          ///< A required key was not present
        InvalidNumberFormat, ///< Could not parse a value as a number
        WrongValueCount      ///< A key carried the wrong number of values
    };

    /**
     * @brief Constructs a new configuration read exception
     *
     * @param type The specific type of error that occurred
     * @param functionName Name of the reader that failed
     * @param details Additional information about the error
     */
    ConfigReadException(ErrorType type, const std::string& functionName, const std::string& details);

    /**
     * @brief Get the type of error that occurred
     *
     * @return ErrorType The error type
     */
    ErrorType getErrorType() const noexcept;

private:
    ErrorType errorType; ///< Stores the type of error that occurred

    static std::string createMessage(ErrorType type, const std::string& details);
};

} // namespace cyberrisk

#endif // CONFIG_READ_EXCEPTION_HPP
