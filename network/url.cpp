#include "url.hpp" // IWYU pragma: keep

#include "http_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace minihttp {

namespace {
constexpr std::string_view kSchemeSeparator = "://";
constexpr std::uint16_t kHttpPort = 80;
constexpr std::uint16_t kHttpsPort = 443;

std::uint16_t DefaultPort(const std::string &scheme)
{
    return scheme == "https" ? kHttpsPort : kHttpPort;
}

std::uint16_t ParsePort(const std::string &digits, const std::string &input)
{
    const bool allDigits = std::all_of(digits.begin(), digits.end(), [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    // 5 digits is max for the valid port, it also protects from overflow below.
    if (digits.empty() || digits.size() > 5 || !allDigits)
    {
        throw CHttpError(EHttpError::InvalidUrl, "bad port in url: " + input);
    }
    const auto value = std::stoul(digits);
    if (value == 0 || value > 65535)
    {
        throw CHttpError(EHttpError::InvalidUrl, "port is out of range in url: " + input);
    }
    return static_cast<std::uint16_t>(value);
}
} // namespace

bool utility::IsIpLiteral(const std::string &host)
{
    in_addr v4{};
    in6_addr v6{};
    return inet_pton(AF_INET, host.c_str(), &v4) == 1
           || inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

CUrl CUrl::Parse(const std::string &input)
{
    const auto schemeEnd = input.find(kSchemeSeparator);
    if (schemeEnd == std::string::npos)
    {
        throw CHttpError(EHttpError::InvalidUrl, "missing scheme in url: " + input);
    }

    CUrl url;
    url.iScheme = input.substr(0, schemeEnd);
    std::transform(url.iScheme.begin(), url.iScheme.end(), url.iScheme.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (url.iScheme != "http" && url.iScheme != "https")
    {
        throw CHttpError(EHttpError::InvalidUrl, "unsupported scheme in url: " + input);
    }
    url.iPort = DefaultPort(url.iScheme);

    const auto hostStart = schemeEnd + kSchemeSeparator.size();
    const auto hostEnd = input.find_first_of(":/?", hostStart);
    url.iHost = input.substr(hostStart, hostEnd - hostStart);
    if (url.iHost.empty())
    {
        throw CHttpError(EHttpError::InvalidUrl, "empty host in url: " + input);
    }

    auto pathStart = hostEnd;
    if (hostEnd != std::string::npos && input[hostEnd] == ':')
    {
        pathStart = input.find_first_of("/?", hostEnd + 1);
        url.iPort = ParsePort(input.substr(hostEnd + 1, pathStart - hostEnd - 1), input);
    }

    if (pathStart != std::string::npos)
    {
        url.iPathAndQuery = input.substr(pathStart);
        if (url.iPathAndQuery.front() == '?')
        {
            url.iPathAndQuery.insert(0, "/");
        }
    }
    return url;
}

std::optional<std::string> CUrl::Query() const
{
    const auto pos = iPathAndQuery.find('?');
    if (pos == std::string::npos)
    {
        return std::nullopt;
    }
    return iPathAndQuery.substr(pos + 1);
}

bool CUrl::IsTls() const
{
    return iScheme == "https";
}

bool CUrl::IsDefaultPort() const
{
    return iPort == DefaultPort(iScheme);
}

bool CUrl::IsIpHost() const
{
    return utility::IsIpLiteral(iHost);
}

std::string CUrl::Authority() const
{
    return iHost + ":" + std::to_string(iPort);
}

std::string CUrl::HostHeader() const
{
    return IsDefaultPort() ? iHost : Authority();
}

std::string CUrl::ToString() const
{
    return iScheme + "://" + HostHeader() + iPathAndQuery;
}

bool CUrl::operator==(const CUrl &other) const
{
    const auto tie = [](const CUrl &what) {
        return std::tie(what.iScheme, what.iHost, what.iPort, what.iPathAndQuery);
    };
    return tie(*this) == tie(other);
}

} // namespace minihttp
