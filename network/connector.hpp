#pragma once

#include "client_config.hpp" // IWYU pragma: keep
#include "transport.hpp"     // IWYU pragma: keep
#include "url.hpp"           // IWYU pragma: keep

#include <memory>
#include <optional>

namespace minihttp {

/// @brief Opens transport to the target: direct TCP, TLS over TCP, CONNECT tunnel through the
/// proxy or TLS inside of the tunnel.
class CConnector
{
  public:
    /// @throws CHttpError with EHttpError::DnsResolutionFailed, ConnectionRefused,
    /// ProxyConnectFailed, TlsHandshakeFailed or TransportError.
    [[nodiscard]]
    static std::unique_ptr<ITransport> Connect(const CUrl &target, const std::optional<CUrl> &proxy,
                                               const TClientConfig &config);
};

} // namespace minihttp
