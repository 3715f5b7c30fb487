#include "buffered_reader.hpp" // IWYU pragma: keep

#include "http_error.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace minihttp {

namespace {
constexpr std::size_t kReadPieceSize = 4096;
constexpr std::size_t kMaxReserve = 1024 * 1024;
} // namespace

CBufferedReader::CBufferedReader(ITransport &transport) :
    iTransport(transport)
{
    iBuffer.reserve(kReadPieceSize);
}

bool CBufferedReader::FillBuffer()
{
    // Dropping consumed part, so buffer does not grow for the long bodies.
    if (iPos > 0 && iPos == iBuffer.size())
    {
        iBuffer.clear();
        iPos = 0;
    }

    std::array<char, kReadPieceSize> tmp{};
    const auto [status, readSize] = iTransport.ReadSome(tmp.data(), tmp.size());
    switch (status)
    {
        case EIoStatus::Ok:
            iBuffer.insert(iBuffer.end(), tmp.begin(),
                           std::next(tmp.begin(), static_cast<std::ptrdiff_t>(readSize)));
            return true;
        case EIoStatus::OkReceivedZero:
            return false;
        case EIoStatus::Timeout:
            throw CHttpError(EHttpError::TransportError, "read timed out");
        case EIoStatus::Error:
            break;
    }
    throw CHttpError(EHttpError::TransportError, "read failed");
}

void CBufferedReader::Consume(const std::size_t size, std::vector<char> &out)
{
    const auto begin = std::next(iBuffer.begin(), static_cast<std::ptrdiff_t>(iPos));
    out.insert(out.end(), begin, std::next(begin, static_cast<std::ptrdiff_t>(size)));
    iPos += size;
}

std::string CBufferedReader::ReadLine(const EHttpError tooLongError)
{
    std::size_t searchFrom = iPos;
    while (true)
    {
        const auto begin = std::next(iBuffer.begin(), static_cast<std::ptrdiff_t>(searchFrom));
        const auto lf = std::find(begin, iBuffer.end(), '\n');
        if (lf != iBuffer.end())
        {
            const auto lineBegin = std::next(iBuffer.begin(), static_cast<std::ptrdiff_t>(iPos));
            if (static_cast<std::size_t>(std::distance(lineBegin, lf)) > kMaxLineLength)
            {
                throw CHttpError(tooLongError, "line is longer than "
                                                 + std::to_string(kMaxLineLength) + " bytes");
            }
            std::string line(lineBegin, lf);
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            iPos = static_cast<std::size_t>(std::distance(iBuffer.begin(), lf)) + 1u;
            return line;
        }
        if (Buffered() > kMaxLineLength)
        {
            throw CHttpError(tooLongError, "line is longer than "
                                             + std::to_string(kMaxLineLength) + " bytes");
        }

        // FillBuffer() may drop consumed bytes, so remembering relative position.
        const auto alreadySearched = iBuffer.size() - iPos;
        if (!FillBuffer())
        {
            throw CHttpError(EHttpError::UnexpectedEof, "stream ended inside of the line");
        }
        searchFrom = iPos + alreadySearched;
    }
}

void CBufferedReader::ReadExact(std::size_t size, std::vector<char> &out)
{
    // Size comes from the peer, so it is not trusted for the allocation.
    out.reserve(out.size() + std::min(size, kMaxReserve));
    while (size > 0)
    {
        if (Buffered() == 0 && !FillBuffer())
        {
            throw CHttpError(EHttpError::UnexpectedEof,
                             "stream ended, " + std::to_string(size) + " more bytes expected");
        }
        const auto piece = std::min(size, Buffered());
        Consume(piece, out);
        size -= piece;
    }
}

void CBufferedReader::ReadToEof(std::vector<char> &out)
{
    do
    {
        Consume(Buffered(), out);
    } while (FillBuffer());
}

} // namespace minihttp
