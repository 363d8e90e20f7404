#include "exceptions/ConfigReadException.hpp"
#include <string>

namespace cyberrisk {

    ConfigReadException::ConfigReadException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, createMessage(type, details)),
      errorType(type) {}

    ConfigReadException::ErrorType ConfigReadException::getErrorType() const noexcept {
        return errorType;
    }

    std::string ConfigReadException::createMessage(ErrorType type, const std::string& details) {
        std::string baseMsg;
        switch (type) {
            case ErrorType::FileOpenError:
                baseMsg = "Could not open file";
                break;
            case ErrorType::MissingKey:
                baseMsg = "Missing required key";
                break;
            case ErrorType::InvalidNumberFormat:
                baseMsg = "Invalid number format";
                break;
            case ErrorType::WrongValueCount:
                baseMsg = "Wrong number of values";
                break;
            default:
                 baseMsg = "Unknown configuration error";
                 break;
        }
        return baseMsg + (details.empty() ? "" : ": " + details);
    }
}
