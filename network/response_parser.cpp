#include "response_parser.hpp" // IWYU pragma: keep

#include "buffered_reader.hpp"
#include "http_error.hpp"
#include "http_headers.hpp"

#include <common/lambda_visitors.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace minihttp {

namespace {
constexpr std::string_view kChunkEnd = "\r\n";
// More hex digits would overflow std::size_t.
constexpr std::size_t kMaxChunkSizeDigits = sizeof(std::size_t) * 2;

bool IsChunked(const std::string &transferEncoding)
{
    auto lastCoding = transferEncoding.substr(transferEncoding.rfind(',') + 1);
    utility::HttpTrim(lastCoding);
    return utility::EqualsNoCase(lastCoding, "chunked");
}

std::size_t ParseContentLength(std::string value)
{
    utility::HttpTrim(value);
    const bool isDigits = std::all_of(value.begin(), value.end(), [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (value.empty() || !isDigits || value.size() > 18)
    {
        throw CHttpError(EHttpError::MalformedHeader, "bad Content-Length: " + value);
    }
    return static_cast<std::size_t>(std::stoull(value));
}

std::size_t ParseChunkSize(std::string line)
{
    // Chunk extensions are ignored.
    line = line.substr(0, line.find(';'));
    utility::HttpTrim(line);
    const bool isHex = std::all_of(line.begin(), line.end(), [](const char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
    // Leading zeros do not count against the size limit.
    const auto significant = line.find_first_not_of('0');
    const auto digits = significant == std::string::npos ? 0u : line.size() - significant;
    if (line.empty() || !isHex || digits > kMaxChunkSizeDigits)
    {
        throw CHttpError(EHttpError::MalformedChunk, "bad chunk size line: " + line);
    }
    return static_cast<std::size_t>(std::stoull(line, nullptr, 16));
}
bool IsInterim(const int statusCode)
{
    static constexpr int kSwitchingProtocols = 101;
    return statusCode >= 100 && statusCode <= 199 && statusCode != kSwitchingProtocols;
}
} // namespace

CResponseParser::TBodyFraming CResponseParser::DetectFraming(const int statusCode,
                                                             const CHttpHeaders &headers,
                                                             std::string_view requestMethod)
{
    static constexpr int kNoContent = 204;
    static constexpr int kNotModified = 304;

    const bool isInformational = statusCode >= 100 && statusCode <= 199;
    if (utility::EqualsNoCase(requestMethod, methods::kHead) || isInformational
        || statusCode == kNoContent || statusCode == kNotModified)
    {
        return TNoBody{};
    }
    if (const auto transferEncoding = headers.Find("Transfer-Encoding"))
    {
        if (IsChunked(*transferEncoding))
        {
            return TChunked{};
        }
        // Any other final coding is delimited by connection close.
        return TUntilEof{};
    }
    if (const auto contentLength = headers.Find("Content-Length"))
    {
        return TFixedLength{ParseContentLength(*contentLength)};
    }
    return TUntilEof{};
}

void CResponseParser::ReadChunkedBody(CBufferedReader &reader, std::vector<char> &body)
{
    std::vector<char> chunkEnd;
    while (true)
    {
        const auto chunkSize = ParseChunkSize(reader.ReadLine(EHttpError::MalformedChunk));
        if (chunkSize == 0)
        {
            break;
        }
        reader.ReadExact(chunkSize, body);

        chunkEnd.clear();
        reader.ReadExact(kChunkEnd.size(), chunkEnd);
        if (!std::equal(chunkEnd.begin(), chunkEnd.end(), kChunkEnd.begin(), kChunkEnd.end()))
        {
            throw CHttpError(EHttpError::MalformedChunk, "chunk data is not followed by CRLF");
        }
    }

    // Trailer section, ends by empty line. Trailers are not merged into headers.
    while (!reader.ReadLine(EHttpError::MalformedChunk).empty())
    {
    }
}

CHttpResponse CResponseParser::Parse(ITransport &transport,
                                     std::string_view requestMethod) const
{
    CBufferedReader reader(transport);

    CHttpResponseLine statusLine;
    CHttpHeaders headers;
    // Interim 1xx responses (100 Continue, 103 Early Hints) are skipped, 101 is final.
    while (true)
    {
        statusLine = CHttpResponseLine::Parse(reader.ReadLine(EHttpError::MalformedStatusLine));
        iConfig.ExecIfFittingVerbosity(EVerbosity::Debug, [&statusLine](auto &ostream) {
            ostream << "[DEBUG] Response status: " << statusLine.ToString() << std::endl;
        });

        headers = CHttpHeaders{};
        for (auto line = reader.ReadLine(); !line.empty(); line = reader.ReadLine())
        {
            headers.ParseAndAdd(line);
        }
        if (!IsInterim(statusLine.GetStatusCode()))
        {
            break;
        }
    }

    std::vector<char> body;
    const auto framing = DetectFraming(statusLine.GetStatusCode(), headers, requestMethod);
    const LambdaVisitor readBody{
      [](const TNoBody &) {
      },
      [&reader, &body](const TChunked &) {
          ReadChunkedBody(reader, body);
      },
      [&reader, &body](const TFixedLength &fixed) {
          reader.ReadExact(fixed.length, body);
      },
      [&reader, &body](const TUntilEof &) {
          reader.ReadToEof(body);
      },
    };
    std::visit(readBody, framing);

    iConfig.ExecIfFittingVerbosity(EVerbosity::Debug, [&body, &headers](auto &ostream) {
        ostream << "[DEBUG] Response headers: " << headers.Size() << ", body bytes: " << body.size()
                << std::endl;
    });
    return {std::move(statusLine), std::move(headers), std::move(body)};
}

} // namespace minihttp
