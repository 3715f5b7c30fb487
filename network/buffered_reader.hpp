#pragma once

#include "http_error.hpp"
#include "transport.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>

#include <cstddef>
#include <string>
#include <vector>

namespace minihttp {

/// @brief Reads lines and exact-size blocks over ITransport. Transport is read by pieces, so
/// bytes after requested line / block stay buffered for the next call.
class CBufferedReader
{
  public:
    inline static constexpr std::size_t kMaxLineLength = 64 * 1024;

    explicit CBufferedReader(ITransport &transport);
    ~CBufferedReader() = default;
    NO_COPYMOVE(CBufferedReader);

    /// @returns next line without line end. Line end is CRLF, single LF is accepted too.
    /// @throws CHttpError(EHttpError::UnexpectedEof) if stream ended before line end,
    /// CHttpError(@p tooLongError) if line is longer than kMaxLineLength.
    std::string ReadLine(EHttpError tooLongError = EHttpError::MalformedHeader);

    /// @brief Appends exactly @p size bytes to @p out.
    /// @throws CHttpError(EHttpError::UnexpectedEof) if stream ended earlier.
    void ReadExact(std::size_t size, std::vector<char> &out);

    /// @brief Appends everything until the end of stream to @p out.
    void ReadToEof(std::vector<char> &out);

  private:
    /// @brief Reads next piece from transport into buffer.
    /// @returns false on the end of stream.
    /// @throws CHttpError(EHttpError::TransportError) on read error or timeout.
    bool FillBuffer();

    [[nodiscard]]
    std::size_t Buffered() const
    {
        return iBuffer.size() - iPos;
    }

    void Consume(std::size_t size, std::vector<char> &out);

    ITransport &iTransport;
    std::vector<char> iBuffer;
    std::size_t iPos{0};
};

} // namespace minihttp
