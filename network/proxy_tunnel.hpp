#pragma once

#include "http_headers.hpp" // IWYU pragma: keep
#include "transport.hpp"    // IWYU pragma: keep
#include "url.hpp"          // IWYU pragma: keep

#include <cstddef>
#include <string>

namespace minihttp {

/// @brief Makes HTTP proxy to open raw byte pipe to the target using CONNECT method.
class CProxyTunnel
{
  public:
    /// @brief Longest CONNECT reply (status line and headers) accepted from the proxy.
    inline static constexpr std::size_t kMaxReplySize = 16 * 1024;

    /// @returns "CONNECT host:port HTTP/1.1\r\nHost: host:port\r\n\r\n" for the @p target.
    static std::string BuildConnectRequest(const CUrl &target);

    /// @brief Sends CONNECT over @p proxyConnection and reads proxy's reply. On success the same
    /// transport is connected to the @p target. Reply is read byte by byte, so nothing which
    /// belongs to the target's stream is consumed.
    /// @returns status line of the proxy's reply.
    /// @throws CHttpError(EHttpError::ProxyConnectFailed) with proxy's status line if it is not
    /// 2xx, CHttpError(EHttpError::TransportError) on IO failure.
    static CHttpResponseLine Establish(ITransport &proxyConnection, const CUrl &target);
};

} // namespace minihttp
