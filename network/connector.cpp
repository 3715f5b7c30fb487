#include "connector.hpp" // IWYU pragma: keep

#include "http_error.hpp"
#include "proxy_tunnel.hpp"
#include "socket.hpp"
#include "tls_transport.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <utility>

namespace minihttp {

namespace {
CClientSocket ConnectTcp(const CUrl &endpoint, const TClientConfig &config)
{
    config.ExecIfFittingVerbosity(EVerbosity::Debug, [&endpoint](auto &ostream) {
        ostream << "[DEBUG] Connecting to " << endpoint.Authority() << std::endl;
    });

    CTcpClientConnection connection;
    switch (connection.connect(endpoint.Host(), endpoint.Port()))
    {
        case EConnectStatus::Ok:
            break;
        case EConnectStatus::ResolveFailed:
            throw CHttpError(EHttpError::DnsResolutionFailed,
                             "could not resolve " + endpoint.Host());
        case EConnectStatus::Refused:
            throw CHttpError(EHttpError::ConnectionRefused,
                             "could not connect to " + endpoint.Authority());
    }

    auto socket = connection.release_socket();
    if (config.timeout.count() > 0 && !socket.set_timeouts(config.timeout))
    {
        config.ExecIfFittingVerbosity(EVerbosity::Warning, [](auto &ostream) {
            ostream << "[WARNING] Could not set socket timeouts, IO may block forever."
                    << std::endl;
        });
    }
    return socket;
}
} // namespace

std::unique_ptr<ITransport> CConnector::Connect(const CUrl &target,
                                                const std::optional<CUrl> &proxy,
                                                const TClientConfig &config)
{
    auto plain = std::make_unique<CSocketTransport>(ConnectTcp(proxy ? *proxy : target, config));

    if (proxy)
    {
        const auto reply = CProxyTunnel::Establish(*plain, target);
        config.ExecIfFittingVerbosity(EVerbosity::Debug, [&reply, &target](auto &ostream) {
            ostream << "[DEBUG] Tunnel to " << target.Authority()
                    << " is established: " << reply.ToString() << std::endl;
        });
    }

    if (target.IsTls())
    {
        return std::make_unique<CTlsTransport>(plain->ReleaseSocket(), target.Host(),
                                               config.verifyTls);
    }
    return plain;
}

} // namespace minihttp
