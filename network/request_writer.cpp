#include "request_writer.hpp" // IWYU pragma: keep

#include "http_headers.hpp"
#include "request_spec.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>

namespace minihttp {

namespace {
constexpr std::string_view kLineEnd = "\r\n";
constexpr auto kHostHeader = "Host";
constexpr auto kConnectionHeader = "Connection";
constexpr auto kContentLengthHeader = "Content-Length";
} // namespace

bool methods::AllowsBody(std::string_view method)
{
    static constexpr std::string_view kNoBody[] = {kGet,     kHead,  kDelete,
                                                   kOptions, kTrace, kConnect};
    return std::none_of(std::begin(kNoBody), std::end(kNoBody), [&method](const auto &m) {
        return utility::EqualsNoCase(m, method);
    });
}

std::string CRequestWriter::Serialize(const TRequestSpec &spec)
{
    const auto &headers = spec.headers;
    std::ostringstream result;
    result << CHttpRequestLine(spec.method, spec.url.PathAndQuery()).ToString() << kLineEnd;

    // Host always goes right after request line, explicit user's value wins.
    const auto &userHeaders = headers.Map();
    const auto userHost = userHeaders.find(kHostHeader);
    if (userHost != userHeaders.end())
    {
        result << userHost->first << ": " << userHost->second << kLineEnd;
    }
    else
    {
        result << kHostHeader << ": " << spec.url.HostHeader() << kLineEnd;
    }
    for (const auto &[name, value] : userHeaders)
    {
        if (!utility::EqualsNoCase(name, kHostHeader))
        {
            result << name << ": " << value << kLineEnd;
        }
    }
    if (!headers.Contains(kConnectionHeader))
    {
        result << kConnectionHeader << ": close" << kLineEnd;
    }
    if (spec.body && !headers.Contains(kContentLengthHeader))
    {
        result << kContentLengthHeader << ": " << spec.body->size() << kLineEnd;
    }
    result << kLineEnd;
    if (spec.body)
    {
        result.write(spec.body->data(), static_cast<std::streamsize>(spec.body->size()));
    }
    return result.str();
}

void CRequestWriter::Write(const TRequestSpec &spec, ITransport &transport)
{
    transport.WriteOrThrow(Serialize(spec));
}

} // namespace minihttp
