#pragma once

#include "client_config.hpp" // IWYU pragma: keep
#include "http_headers.hpp"  // IWYU pragma: keep
#include "http_response.hpp" // IWYU pragma: keep
#include "request_spec.hpp"  // IWYU pragma: keep

#include <common/cm_ctors.h>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace minihttp {

/// @brief Request builder. Every setter leaves this object as is and returns modified copy, so
/// the same base client can be reused for many requests:
/// @code
///   const CClient api("https://example.com/api");
///   const auto response = api.Post().Header("Content-Type", "application/json").Body(json).Send();
/// @endcode
class CClient
{
  public:
    /// @throws CHttpError(EHttpError::InvalidUrl).
    explicit CClient(const std::string &url);
    ~CClient() = default;
    DEFAULT_COPYMOVE(CClient);

    [[nodiscard]]
    CClient Get() const;
    [[nodiscard]]
    CClient Post() const;
    [[nodiscard]]
    CClient Put() const;
    [[nodiscard]]
    CClient Head() const;
    [[nodiscard]]
    CClient Delete() const;
    [[nodiscard]]
    CClient Options() const;
    /// @brief Any other method token, sent as is.
    [[nodiscard]]
    CClient Method(std::string method) const;

    /// @brief Merges @p pairs into headers, later value for the same case-insensitive name wins.
    [[nodiscard]]
    CClient Headers(const CHttpHeaders::TPairs &pairs) const;
    [[nodiscard]]
    CClient Header(const std::string &name, std::string value) const;

    [[nodiscard]]
    CClient Body(std::vector<char> body) const;
    [[nodiscard]]
    CClient Body(std::string_view body) const;

    /// @brief Sends request through CONNECT tunnel of the HTTP proxy at @p proxyUrl.
    /// @throws CHttpError(EHttpError::InvalidUrl).
    [[nodiscard]]
    CClient Proxy(const std::string &proxyUrl) const;

    /// @throws CHttpError(EHttpError::InvalidConfig) if @p timeout is negative.
    [[nodiscard]]
    CClient Timeout(std::chrono::seconds timeout) const;

    /// @brief Enables / disables check of server's certificate.
    /// @throws CHttpError(EHttpError::InvalidConfig) if target is not https.
    [[nodiscard]]
    CClient Verify(bool verify) const;

    /// @throws CHttpError(EHttpError::InvalidConfig) if @p config is not valid.
    [[nodiscard]]
    CClient Config(TClientConfig config) const;

    /// @brief Connects, writes request and reads response. Connection is closed on return.
    /// @throws CHttpError.
    [[nodiscard]]
    CHttpResponse Send() const;

    [[nodiscard]]
    const TRequestSpec &Spec() const
    {
        return iSpec;
    }

    [[nodiscard]]
    const TClientConfig &GetConfig() const
    {
        return iConfig;
    }

  private:
    template <typename taChange>
    CClient With(const taChange &change) const
    {
        CClient copy(*this);
        change(copy);
        return copy;
    }

    TRequestSpec iSpec;
    TClientConfig iConfig;
};

/// @brief Shortcuts which send request with default settings.
/// @throws CHttpError.
CHttpResponse Get(const std::string &url);
CHttpResponse Post(const std::string &url);
CHttpResponse Put(const std::string &url);
CHttpResponse Head(const std::string &url);
CHttpResponse Delete(const std::string &url);
CHttpResponse Options(const std::string &url);

} // namespace minihttp
