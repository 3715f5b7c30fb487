#include "transport.hpp" // IWYU pragma: keep

#include "http_error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace minihttp {

void ITransport::WriteOrThrow(std::string_view what)
{
    const auto [status, notWritten] = WriteAll(what.data(), what.size());
    if (status != EIoStatus::Ok || notWritten != 0)
    {
        throw CHttpError(EHttpError::TransportError,
                         status == EIoStatus::Timeout
                           ? std::string("write timed out")
                           : "write failed, " + std::to_string(notWritten) + " bytes left");
    }
}

CSocketTransport::CSocketTransport(CClientSocket socket) :
    iSocket(std::move(socket))
{
}

ITransport::Result CSocketTransport::ReadSome(void *buf, std::size_t size_buf)
{
    return iSocket.read_some(buf, size_buf);
}

ITransport::Result CSocketTransport::WriteAll(const void *buf, std::size_t size_buf)
{
    return iSocket.write_all(buf, size_buf);
}

void CSocketTransport::Close() noexcept
{
    iSocket.close();
}

CClientSocket CSocketTransport::ReleaseSocket() noexcept
{
    return std::move(iSocket);
}

} // namespace minihttp
