#pragma once

#include "buffered_reader.hpp" // IWYU pragma: keep
#include "client_config.hpp"   // IWYU pragma: keep
#include "http_headers.hpp"    // IWYU pragma: keep
#include "http_response.hpp"   // IWYU pragma: keep
#include "request_spec.hpp"    // IWYU pragma: keep
#include "transport.hpp"       // IWYU pragma: keep

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace minihttp {

/// @brief Reads HTTP/1.1 response from the transport: status line, headers and body framed by
/// chunked encoding, Content-Length or connection close.
class CResponseParser
{
  public:
    /// @brief Response has no body (HEAD request, 1xx, 204, 304).
    struct TNoBody
    {
    };
    /// @brief Transfer-Encoding ends with "chunked".
    struct TChunked
    {
    };
    struct TFixedLength
    {
        std::size_t length;
    };
    /// @brief Nothing tells the size, server closes connection after the body.
    struct TUntilEof
    {
    };
    using TBodyFraming = std::variant<TNoBody, TChunked, TFixedLength, TUntilEof>;

    explicit CResponseParser(const TClientConfig &config) :
        iConfig(config)
    {
    }

    /// @brief Reads complete response to the request made by @p requestMethod.
    /// @throws CHttpError with EHttpError::MalformedStatusLine, MalformedHeader, MalformedChunk,
    /// UnexpectedEof or TransportError. Nothing partially parsed is returned.
    [[nodiscard]]
    CHttpResponse Parse(ITransport &transport,
                        std::string_view requestMethod = methods::kGet) const;

    /// @brief Picks the way body is delimited, chunked encoding has priority over Content-Length.
    /// @throws CHttpError(EHttpError::MalformedHeader) if Content-Length is not a number.
    static TBodyFraming DetectFraming(int statusCode, const CHttpHeaders &headers,
                                      std::string_view requestMethod);

    /// @brief Decodes chunked body, trailer headers after the last chunk are discarded.
    /// @throws CHttpError(EHttpError::MalformedChunk) or CHttpError(EHttpError::UnexpectedEof).
    static void ReadChunkedBody(CBufferedReader &reader, std::vector<char> &body);

  private:
    const TClientConfig &iConfig;
};

} // namespace minihttp
