#pragma once

#include <common/cm_ctors.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace minihttp {

/// @brief Parsed http(s) URL. Created once by Parse(), immutable afterwards.
class CUrl
{
  public:
    /// @brief Parses strings like "https://host[:port][/path][?query]".
    /// @throws CHttpError(EHttpError::InvalidUrl) if scheme is not http/https, host is empty or
    /// port is not valid.
    static CUrl Parse(const std::string &input);

    [[nodiscard]]
    const std::string &Scheme() const
    {
        return iScheme;
    }

    [[nodiscard]]
    const std::string &Host() const
    {
        return iHost;
    }

    [[nodiscard]]
    std::uint16_t Port() const
    {
        return iPort;
    }

    /// @returns path with query, exactly as it should go into request line, at least "/".
    [[nodiscard]]
    const std::string &PathAndQuery() const
    {
        return iPathAndQuery;
    }

    /// @returns text after the 1st '?' if any.
    [[nodiscard]]
    std::optional<std::string> Query() const;

    [[nodiscard]]
    bool IsTls() const;

    [[nodiscard]]
    bool IsDefaultPort() const;

    /// @returns true if host is IPv4 / IPv6 address rather than a domain name.
    [[nodiscard]]
    bool IsIpHost() const;

    /// @returns "host:port", it is used by CONNECT request.
    [[nodiscard]]
    std::string Authority() const;

    /// @returns value for "Host" header: host, plus ":port" if port is not default for the scheme.
    [[nodiscard]]
    std::string HostHeader() const;

    [[nodiscard]]
    std::string ToString() const;

    bool operator==(const CUrl &other) const;

  private:
    CUrl() = default;

    std::string iScheme;
    std::string iHost;
    std::uint16_t iPort{0};
    std::string iPathAndQuery{"/"};
};
MINIHTTP_TEST_MOVE_NOEX(CUrl);

namespace utility {
/// @returns true if @p host is textual IPv4 or IPv6 address.
bool IsIpLiteral(const std::string &host);
} // namespace utility

} // namespace minihttp
