#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include "exceptions/Exceptions.hpp"
#include <atomic>
#include <string>

namespace cyberrisk {

/**
 * @brief Cooperative cancellation flag shared between a caller and a running engine.
 *
 * The caller may call cancel() from any thread; the engine polls it between phases.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true); }

    bool isCancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Abandon the current run if cancellation was requested.
     * @param functionName Engine method performing the check.
     * @param phase Description of the phase about to start.
     * @throws SimulationCancelledException if cancel() has been called.
     */
    void throwIfCancelled(const std::string& functionName, const std::string& phase) const {
        if (isCancelled()) {
            THROW_CANCELLED(functionName, "run cancelled before " + phase + ".");
        }
    }

private:
    std::atomic<bool> cancelled_;
};

} // namespace cyberrisk

#endif // CANCELLATION_TOKEN_HPP
