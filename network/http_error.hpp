#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace minihttp {

/// @brief Kind of the failure which stopped the request.
enum class EHttpError : std::uint8_t {
    InvalidUrl,
    InvalidConfig,
    DnsResolutionFailed,
    ConnectionRefused,
    TlsHandshakeFailed,
    ProxyConnectFailed,
    TransportError,
    MalformedStatusLine,
    MalformedHeader,
    MalformedChunk,
    UnexpectedEof,
    InvalidUtf8,
};

/// @returns printable name of the @p kind, e.g. "MalformedChunk".
std::string_view ToString(EHttpError kind) noexcept;

/// @brief The only exception type thrown by the library. Carries kind of the error and the detail
/// text (for EHttpError::ProxyConnectFailed it is status line received from the proxy).
class CHttpError : public std::runtime_error
{
  public:
    CHttpError(EHttpError kind, std::string detail);

    [[nodiscard]]
    EHttpError Kind() const noexcept
    {
        return iKind;
    }

    [[nodiscard]]
    const std::string &Detail() const noexcept
    {
        return iDetail;
    }

  private:
    EHttpError iKind;
    std::string iDetail;
};

} // namespace minihttp
