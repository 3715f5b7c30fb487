#include "proxy_tunnel.hpp" // IWYU pragma: keep

#include "http_error.hpp"
#include "http_headers.hpp"

#include <string>
#include <string_view>

namespace minihttp {

namespace {
constexpr std::string_view kEndOfHeaders = "\r\n\r\n";
// Bare LF line ends are accepted, same as for the response.
constexpr std::string_view kEndOfHeadersLf = "\n\n";

bool EndsWith(const std::string &text, std::string_view suffix)
{
    return text.size() >= suffix.size()
           && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// @returns 1st line of the @p reply without line end.
std::string FirstLine(const std::string &reply)
{
    auto line = reply.substr(0, reply.find('\n'));
    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    return line;
}

/// @brief Reads reply until empty line.
std::string ReadConnectReply(ITransport &proxyConnection)
{
    std::string reply;
    while (!EndsWith(reply, kEndOfHeaders) && !EndsWith(reply, kEndOfHeadersLf))
    {
        if (reply.size() >= CProxyTunnel::kMaxReplySize)
        {
            throw CHttpError(EHttpError::ProxyConnectFailed, "reply is too long");
        }
        char byte = 0;
        const auto [status, readSize] = proxyConnection.ReadSome(&byte, 1u);
        if (status == EIoStatus::OkReceivedZero)
        {
            throw CHttpError(EHttpError::ProxyConnectFailed,
                             "proxy closed connection, got: " + FirstLine(reply));
        }
        if (status != EIoStatus::Ok)
        {
            throw CHttpError(EHttpError::TransportError, "reading proxy reply failed");
        }
        reply.append(&byte, readSize);
    }
    return reply;
}
} // namespace

std::string CProxyTunnel::BuildConnectRequest(const CUrl &target)
{
    const auto authority = target.Authority();
    return "CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority + "\r\n\r\n";
}

CHttpResponseLine CProxyTunnel::Establish(ITransport &proxyConnection, const CUrl &target)
{
    proxyConnection.WriteOrThrow(BuildConnectRequest(target));

    const auto reply = ReadConnectReply(proxyConnection);
    const auto statusLine = FirstLine(reply);

    CHttpResponseLine parsed;
    try
    {
        parsed = CHttpResponseLine::Parse(statusLine);
    }
    catch (const CHttpError &)
    {
        throw CHttpError(EHttpError::ProxyConnectFailed, statusLine);
    }
    if (!parsed.IsSuccess())
    {
        throw CHttpError(EHttpError::ProxyConnectFailed, statusLine);
    }
    return parsed;
}

} // namespace minihttp
