#pragma once

#include "http_headers.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>

#include <optional>
#include <string>
#include <vector>

namespace minihttp {

/// @brief Fully received HTTP response.
class CHttpResponse
{
  public:
    CHttpResponse(CHttpResponseLine statusLine, CHttpHeaders headers, std::vector<char> body);
    ~CHttpResponse() = default;
    DEFAULT_COPYMOVE(CHttpResponse);

    [[nodiscard]]
    int StatusCode() const
    {
        return iStatusLine.GetStatusCode();
    }

    [[nodiscard]]
    const std::string &Reason() const
    {
        return iStatusLine.GetStatusText();
    }

    [[nodiscard]]
    const std::string &Version() const
    {
        return iStatusLine.GetVersion();
    }

    [[nodiscard]]
    const CHttpHeaders &Headers() const
    {
        return iHeaders;
    }

    /// @returns header's value, @p name is case-insensitive.
    [[nodiscard]]
    std::optional<std::string> Header(const std::string &name) const
    {
        return iHeaders.Find(name);
    }

    [[nodiscard]]
    const std::vector<char> &Body() const
    {
        return iBody;
    }

    /// @returns body as UTF-8 text.
    /// @throws CHttpError(EHttpError::InvalidUtf8) if body is not valid UTF-8.
    [[nodiscard]]
    std::string Text() const;

  private:
    CHttpResponseLine iStatusLine;
    CHttpHeaders iHeaders;
    std::vector<char> iBody;
};

namespace utility {
/// @returns true if @p text is well-formed UTF-8 (no overlongs, surrogates or code points above
/// U+10FFFF).
bool IsValidUtf8(const std::vector<char> &text);
} // namespace utility

} // namespace minihttp
