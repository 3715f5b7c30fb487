#include "http_error.hpp" // IWYU pragma: keep

#include <string>
#include <string_view>
#include <utility>

namespace minihttp {

std::string_view ToString(const EHttpError kind) noexcept
{
    switch (kind)
    {
        case EHttpError::InvalidUrl:
            return "InvalidUrl";
        case EHttpError::InvalidConfig:
            return "InvalidConfig";
        case EHttpError::DnsResolutionFailed:
            return "DnsResolutionFailed";
        case EHttpError::ConnectionRefused:
            return "ConnectionRefused";
        case EHttpError::TlsHandshakeFailed:
            return "TlsHandshakeFailed";
        case EHttpError::ProxyConnectFailed:
            return "ProxyConnectFailed";
        case EHttpError::TransportError:
            return "TransportError";
        case EHttpError::MalformedStatusLine:
            return "MalformedStatusLine";
        case EHttpError::MalformedHeader:
            return "MalformedHeader";
        case EHttpError::MalformedChunk:
            return "MalformedChunk";
        case EHttpError::UnexpectedEof:
            return "UnexpectedEof";
        case EHttpError::InvalidUtf8:
            return "InvalidUtf8";
    }
    return "Unknown";
}

CHttpError::CHttpError(EHttpError kind, std::string detail) :
    std::runtime_error(std::string(ToString(kind)) + ": " + detail),
    iKind(kind),
    iDetail(std::move(detail))
{
}

} // namespace minihttp
