#pragma once

#include "socket.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>

#include <cstddef>
#include <string_view>

namespace minihttp {

/// @brief Duplex byte stream bound to 1 remote endpoint for 1 request. Request writer and response
/// parser work only through this interface, they never know if it is plain socket, TLS or tunnel.
class ITransport
{
  public:
    using Result = CClientSocket::Result;

    ITransport() = default;
    virtual ~ITransport() = default;
    NO_COPYMOVE(ITransport);

    /// @brief Blocks until at least 1 byte is read, other side closed connection or error.
    /// @returns EIoStatus::OkReceivedZero with 0 bytes on the end of stream.
    virtual Result ReadSome(void *buf, std::size_t size_buf) = 0;

    /// @brief Blocks until all bytes are sent or error.
    /// @returns remaining not written bytes as 2nd field.
    virtual Result WriteAll(const void *buf, std::size_t size_buf) = 0;

    /// @brief Disconnects. Transport is not usable after.
    virtual void Close() noexcept = 0;

    /// @brief Writes @p what completely.
    /// @throws CHttpError(EHttpError::TransportError) if it could not.
    void WriteOrThrow(std::string_view what);
};

/// @brief Plain TCP connection.
class CSocketTransport final : public ITransport
{
  public:
    explicit CSocketTransport(CClientSocket socket);
    ~CSocketTransport() override = default;
    NO_COPYMOVE(CSocketTransport);

    Result ReadSome(void *buf, std::size_t size_buf) override;
    Result WriteAll(const void *buf, std::size_t size_buf) override;
    void Close() noexcept override;

    /// @brief Gives socket away, for example to wrap it by TLS after proxy tunnel was established.
    [[nodiscard]]
    CClientSocket ReleaseSocket() noexcept;

  private:
    CClientSocket iSocket;
};

} // namespace minihttp
