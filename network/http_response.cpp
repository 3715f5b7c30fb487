#include "http_response.hpp" // IWYU pragma: keep

#include "http_error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace minihttp {

namespace utility {
bool IsValidUtf8(const std::vector<char> &text)
{
    const auto size = text.size();
    std::size_t i = 0;
    while (i < size)
    {
        const auto lead = static_cast<std::uint8_t>(text[i]);
        if (lead < 0x80)
        {
            ++i;
            continue;
        }

        std::size_t tail = 0;
        // Allowed range of the 1st continuation byte, it rejects overlongs and surrogates.
        std::uint8_t low = 0x80;
        std::uint8_t high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF)
        {
            tail = 1;
        }
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            tail = 2;
            low = lead == 0xE0 ? 0xA0 : 0x80;
            high = lead == 0xED ? 0x9F : 0xBF;
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            tail = 3;
            low = lead == 0xF0 ? 0x90 : 0x80;
            high = lead == 0xF4 ? 0x8F : 0xBF;
        }
        else
        {
            return false;
        }

        // Truncated sequence at the end.
        if (i + tail >= size)
        {
            return false;
        }
        for (std::size_t k = 1; k <= tail; ++k)
        {
            const auto c = static_cast<std::uint8_t>(text[i + k]);
            const auto min = k == 1 ? low : std::uint8_t{0x80};
            const auto max = k == 1 ? high : std::uint8_t{0xBF};
            if (c < min || c > max)
            {
                return false;
            }
        }
        i += tail + 1;
    }
    return true;
}
} // namespace utility

CHttpResponse::CHttpResponse(CHttpResponseLine statusLine, CHttpHeaders headers,
                             std::vector<char> body) :
    iStatusLine(std::move(statusLine)),
    iHeaders(std::move(headers)),
    iBody(std::move(body))
{
}

std::string CHttpResponse::Text() const
{
    if (!utility::IsValidUtf8(iBody))
    {
        throw CHttpError(EHttpError::InvalidUtf8, "body is not valid UTF-8");
    }
    return {iBody.begin(), iBody.end()};
}

} // namespace minihttp
