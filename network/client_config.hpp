#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <ostream>

namespace minihttp {

enum class EVerbosity : std::uint8_t {
    Silent = 0,
    Error = 0x10,
    Warning = 0x20,
    Debug = 0xFF,
};

/// @brief Per-client settings. It is copied into each request, so streams must outlive the client.
struct TClientConfig
{
    EVerbosity verbosity{EVerbosity::Silent};
    /// Read/write timeout of the socket, zero means wait forever.
    std::chrono::seconds timeout{30};
    /// Check server's certificate and host name on TLS handshake.
    bool verifyTls{true};
    std::reference_wrapper<std::ostream> outStream{std::cout};
    std::reference_wrapper<std::ostream> errorStream{std::cerr};

    /// @brief Checks if the verbosity level is fitting.
    [[nodiscard]]
    bool IsFittingVerbosity(const EVerbosity value) const
    {
        return static_cast<std::uint8_t>(verbosity) >= static_cast<std::uint8_t>(value);
    }

    /// @brief Executes the given function if the verbosity level is fitting. Usable for logging.
    /// Passes the output stream to the function.
    /// @param value The verbosity level to check against. If it's higher or equal, the function
    /// will be executed.
    /// @param func The function to execute if the verbosity level is fitting. It should take an
    /// std::ostream& as parameter.
    template <typename taFunc>
    void ExecIfFittingVerbosity(const EVerbosity value, const taFunc &func) const
    {
        if (IsFittingVerbosity(value))
        {
            func(value == EVerbosity::Error ? errorStream.get() : outStream.get());
        }
    }

    /// @brief Checks if the configuration is valid.
    [[nodiscard]]
    bool Validate() const
    {
        return timeout.count() >= 0;
    }
};

} // namespace minihttp
