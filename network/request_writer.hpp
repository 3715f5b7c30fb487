#pragma once

#include "request_spec.hpp" // IWYU pragma: keep
#include "transport.hpp"    // IWYU pragma: keep

#include <string>

namespace minihttp {

/// @brief Turns TRequestSpec into bytes of HTTP/1.1 request.
class CRequestWriter
{
  public:
    /// @returns request line, headers, empty line and body. Synthesizes "Host", "Connection: close"
    /// and "Content-Length" unless @p spec already has them.
    static std::string Serialize(const TRequestSpec &spec);

    /// @brief Writes serialized @p spec into @p transport as 1 piece.
    /// @throws CHttpError(EHttpError::TransportError).
    static void Write(const TRequestSpec &spec, ITransport &transport);
};

} // namespace minihttp
