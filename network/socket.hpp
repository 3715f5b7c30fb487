// Copyright [2016] [Pedro Vicente]
// Fixes     [2025] [Oleksiy Zakharov]
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <common/cm_ctors.h>
#include <common/runners.h> // IWYU pragma: keep

#include <memory.h> //NOLINT

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <string>
#include <tuple>
#include <type_traits>

#include <netinet/in.h>

namespace minihttp {

using socketfd_t = int;
static_assert(std::is_signed_v<socketfd_t>);
inline constexpr socketfd_t kNoSocket = -1;
inline bool is_valid_socket_fd(socketfd_t fd)
{
    return fd > -1;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// utils
/////////////////////////////////////////////////////////////////////////////////////////////////////

///@brief Analog of bits_cast from C++20.
template <typename taDest, typename taSrc>
taDest copy_cast(taSrc src)
{
    static_assert(sizeof(taSrc) == sizeof(taDest));
    taDest res;
    memcpy(&res, &src, sizeof(res));
    return res;
}

///@brief Thread-safe function to get error message from errno.
std::string parse_error(int errNo);

///@brief Takes ownership of the passed FD.
class CManagedFd
{
  public:
    constexpr CManagedFd() noexcept :
        fd(kNoSocket)
    {
    }
    explicit constexpr CManagedFd(socketfd_t value) noexcept :
        fd(value)
    {
    }
    CManagedFd(CManagedFd &&other) noexcept;
    CManagedFd(const CManagedFd &) = delete;
    ~CManagedFd();

    CManagedFd &operator=(const CManagedFd &) = delete;
    CManagedFd &operator=(CManagedFd &&other) noexcept;

    // NOLINTNEXTLINE
    operator socketfd_t() const noexcept;

    [[nodiscard]]
    socketfd_t get() const noexcept;

    explicit operator bool() const noexcept
    {
        return is_valid_socket_fd(get());
    }

  private:
    std::atomic<socketfd_t> fd;
};

///@brief Status of the IO operation.
enum class EIoStatus : std::uint8_t {
    Ok,
    OkReceivedZero, // other side closed connection, no more data
    Timeout,        // receive/send timeout set by set_timeouts() expired
    Error,
};

///@brief Defines what type of IP address you want to get by the resolving host name.
enum class EIpType : std::uint8_t {
    IPv4,
    IPv6,
    Both,
};

///@brief Result of the outgoing TCP connection attempt.
enum class EConnectStatus : std::uint8_t {
    Ok,
    ResolveFailed,
    Refused,
};

///@brief Client's socket which allows read-write operations.
class CClientSocket
{
  public:
    ///@brief 1st field is status of the operation, second - number of bytes written or read.
    using Result = std::tuple<EIoStatus, std::size_t>;

    CClientSocket() noexcept;
    CClientSocket(CManagedFd sockfd, sockaddr_in sock_addr) noexcept;
    ~CClientSocket() noexcept;
    MOVEONLY_ALLOWED(CClientSocket);

    /// @brief Closes socket which is disconnect.
    void close() noexcept;

    /// @brief writes buffer to the socket. Blocks caller thread until finished.
    /// @returns remaining to write bytes amout as 2nd field of the result (0 == all done). 1st
    /// field indicates if it was any error.
    Result write_all(const void *buf, std::size_t size_buf) const noexcept;

    /// @brief reads @p size_buf from the socket. It blocks caller thread until finished.
    /// @returns total_read as 2nd field of the result. 1st field indicates if it was any error.
    /// @note As it is blocking operation you would like to know exact size of the data before
    /// reading, or end-of-data could be signaled by disconnect from other side.
    Result read_all(void *buf, std::size_t size_buf) const noexcept;

    /// @brief Single receive call. Blocks until at least 1 byte is available, other side
    /// disconnected (EIoStatus::OkReceivedZero) or error.
    Result read_some(void *buf, std::size_t size_buf) const noexcept;

    /// @brief Writes a string excluding \0. It blocks caller thread until finished.
    /// @returns Same as @fn write_all(...).
    [[nodiscard]]
    Result write(const std::string &what) const;

    /// @brief Sets receive and send timeouts of the socket. Zero disables timeouts.
    /// @returns false if OS refused to set options.
    bool set_timeouts(std::chrono::seconds timeout) const noexcept;

    [[nodiscard]]
    socketfd_t native_handle() const noexcept
    {
        return m_sockfd.get();
    }

    /// @brief resolves host into IPs list as strings.
    /// @param host_name - domain / host to translate to IP. Can be null to receive server's address
    /// usable to bind.
    /// @param type - defines what type of address you want to get.
    static std::list<std::string> hostname_to_ip(const char *host_name,
                                                 const EIpType type) noexcept;

    explicit operator bool() const noexcept
    {
        return static_cast<bool>(m_sockfd);
    }

  private:
    CManagedFd m_sockfd;         // socket descriptor
    sockaddr_in m_sockaddr_in{}; // remote address
};
MINIHTTP_TEST_MOVE_NOEX(CClientSocket);

///@brief TCP server which listens on a specific port and accepts incoming connections.
class CTcpAcceptServer
{
  public:
    ///@brief Constructs listening socket on @p server_port. Port 0 lets OS to pick free port, use
    /// port() to know which one. To start accept connections, call accept*().
    explicit CTcpAcceptServer(const std::uint16_t server_port);
    MOVEONLY_ALLOWED(CTcpAcceptServer);
    ~CTcpAcceptServer() = default;

    /// @brief Blocks caller thread until new client connects.
    /// @returns client socket, it evaluates to false if couldn't connect.
    CClientSocket accept();

    /// @brief Same as accept() except it checks the state of @p is_interrupted_ptr and stops
    /// accepting if it evaluates to true.
    CClientSocket accept_autoclose(const utility::runnerint_t &is_interrupted_ptr);

    ///@returns port which server listens on.
    [[nodiscard]]
    std::uint16_t port() const noexcept
    {
        return m_port;
    }

  private:
    CManagedFd listenFd;
    std::uint16_t m_port{0};
};

///@brief TCP client which connects to a server.
class CTcpClientConnection
{
  public:
    CTcpClientConnection() = default;
    MOVEONLY_ALLOWED(CTcpClientConnection);
    ~CTcpClientConnection() = default;

    ///@brief Resolves @p host_name and connects to the 1st IP which accepts connection.
    EConnectStatus connect(const std::string &host_name, const std::uint16_t server_port);

    ///@brief Disconnects from the server by closing socket.
    /// It is safe to call it multiply times.
    void disconnect() noexcept;

    ///@returns const reference to the socket, which can be connected by prior call to connect(...)
    [[nodiscard]]
    const CClientSocket &socket() const noexcept
    {
        return m_client_socket;
    }

    ///@brief Moves connected socket out, this object becomes disconnected.
    [[nodiscard]]
    CClientSocket release_socket() noexcept;

  private:
    CClientSocket m_client_socket{};
};

} // namespace minihttp
