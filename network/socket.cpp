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

#include "socket.hpp" // IWYU pragma: keep

#include <common/runners.h> // IWYU pragma: keep
#include <memory.h>         // NOLINT
#include <poll.h>
#include <string.h> // NOLINT
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <list>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h> //hostent
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace minihttp {

using addr_len_t = socklen_t;

std::string parse_error(int errNo)
{
    std::array<char, 256> tmp{0};
    // GNU version may return pointer to static string instead of filling the buffer.
    const char *msg = strerror_r(errNo, tmp.data(), tmp.size());
    return {msg};
}

///@brief Some possible configurations here
namespace {
///@brief Maximum outstanding connection requests
constexpr int MAXPENDING = 15;

///@brief How often poll/accept timeouts so thread can be interrupted. Too fast raises chances to
/// miss clients' connections.
constexpr std::chrono::milliseconds kAcceptPollTimeout(100);

///@brief Broken pipe should be reported as error, not as signal.
constexpr int kSendFlags = MSG_NOSIGNAL;

bool IsTimeoutErrno(const int err)
{
    return err == EAGAIN || err == EWOULDBLOCK;
}
} // namespace

CManagedFd::CManagedFd(CManagedFd &&other) noexcept :
    fd(other.fd.exchange(kNoSocket))
{
}

CManagedFd::~CManagedFd()
{
    auto val = fd.exchange(kNoSocket);
    if (is_valid_socket_fd(val))
    {
        ::close(val);
    }
}

CManagedFd &CManagedFd::operator=(CManagedFd &&other) noexcept
{
    if (this != &other)
    {
        const auto old = fd.exchange(other.fd.exchange(kNoSocket));
        if (is_valid_socket_fd(old))
        {
            ::close(old);
        }
    }
    return *this;
}

CManagedFd::operator socketfd_t() const noexcept
{
    return get();
}

socketfd_t CManagedFd::get() const noexcept
{
    return fd.load();
}

CClientSocket::CClientSocket() noexcept
{
    close();
}

CClientSocket::CClientSocket(CManagedFd sockfd, sockaddr_in sock_addr) noexcept :
    m_sockfd(std::move(sockfd)),
    m_sockaddr_in(sock_addr)
{
}

CClientSocket::~CClientSocket() noexcept
{
    close();
}

void CClientSocket::close() noexcept
{
    m_sockfd = CManagedFd();
    memset(&m_sockaddr_in, 0, sizeof(m_sockaddr_in));
}

CClientSocket::Result CClientSocket::write(const std::string &what) const
{
    return write_all(what.c_str(), what.length());
}

CClientSocket::Result CClientSocket::write_all(const void *_buf,
                                               std::size_t size_buf) const noexcept
{
    // http://man7.org/linux/man-pages/man2/send.2.html
    const char *buf = static_cast<const char *>(_buf); // can't do pointer arithmetic on void*
    EIoStatus res = EIoStatus::Ok;
    std::size_t size_left = size_buf;
    while (size_left > 0)
    {
        auto sent_size = ::send(m_sockfd, buf, size_left, kSendFlags);
        static_assert(std::is_signed_v<decltype(sent_size)>);

        if (sent_size < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (IsTimeoutErrno(errno))
            {
                res = EIoStatus::Timeout;
                break;
            }
            std::cerr << "send error: " << parse_error(errno) << std::endl;
            res = EIoStatus::Error;
            break;
        }
        size_left -= static_cast<std::size_t>(sent_size);
        std::advance(buf, sent_size);
    }
    return {res, size_left};
}

CClientSocket::Result CClientSocket::read_some(void *_buf, std::size_t size_buf) const noexcept
{
    // NOTE: assumes blocking socket, so ::recv returns 0 only when other side closed connection.
    while (true)
    {
        auto recv_size = ::recv(m_sockfd, _buf, size_buf, 0);
        static_assert(std::is_signed_v<decltype(recv_size)>);

        if (recv_size > 0)
        {
            return {EIoStatus::Ok, static_cast<std::size_t>(recv_size)};
        }
        if (recv_size == 0)
        {
            return {EIoStatus::OkReceivedZero, 0u};
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (IsTimeoutErrno(errno))
        {
            return {EIoStatus::Timeout, 0u};
        }
        std::cerr << "recv error: " << parse_error(errno) << std::endl;
        return {EIoStatus::Error, 0u};
    }
}

CClientSocket::Result CClientSocket::read_all(void *_buf, std::size_t size_buf) const noexcept
{
    char *buf = static_cast<char *>(_buf); // can't do pointer arithmetic on void*
    std::size_t total_recv_size = 0;
    for (std::size_t size_left = size_buf; size_left > 0;)
    {
        const auto [status, recv_size] = read_some(buf, size_left);
        if (status != EIoStatus::Ok)
        {
            return {status, total_recv_size};
        }
        size_left -= recv_size;
        total_recv_size += recv_size;
        std::advance(buf, recv_size);
    }
    return {EIoStatus::Ok, total_recv_size};
}

bool CClientSocket::set_timeouts(const std::chrono::seconds timeout) const noexcept
{
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count());
    tv.tv_usec = 0;
    const bool ok = setsockopt(m_sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0
                    && setsockopt(m_sockfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    if (!ok)
    {
        std::cerr << "setsockopt error: " << parse_error(errno) << std::endl;
    }
    return ok;
}

std::list<std::string> CClientSocket::hostname_to_ip(const char *host_name,
                                                     const EIpType type) noexcept
{
    // The getaddrinfo function provides protocol-independent translation from an ANSI host name
    // to an address.

    std::list<std::string> result;

    struct addrinfo hints{}, *servinfo = nullptr;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    const int rc = getaddrinfo(host_name, nullptr, &hints, &servinfo);
    if (rc != 0)
    {
        std::cerr << "resolving error: " << gai_strerror(rc) << std::endl;
        return result;
    }

    const bool get_v4 = type == EIpType::IPv4 || type == EIpType::Both;
    const bool get_v6 = type == EIpType::IPv6 || type == EIpType::Both;

    std::array<char, INET6_ADDRSTRLEN + 1u> buffer{};
    for (auto p = servinfo; p != nullptr; p = p->ai_next)
    {
        buffer.fill(0);
        if (p->ai_family == AF_INET && get_v4)
        {
            if (inet_ntop(AF_INET, &(copy_cast<sockaddr_in *>(p->ai_addr))->sin_addr,
                          buffer.data(), buffer.size()))
            {
                result.emplace_back(buffer.data());
            }
            continue;
        }
        if (p->ai_family == AF_INET6 && get_v6)
        {
            if (inet_ntop(AF_INET6, &(copy_cast<sockaddr_in6 *>(p->ai_addr))->sin6_addr,
                          buffer.data(), buffer.size()))
            {
                result.emplace_back(buffer.data());
            }
            continue;
        }
    }

    freeaddrinfo(servinfo);
    result.unique();
    return result;
}

CTcpAcceptServer::CTcpAcceptServer(const uint16_t server_port) :
    listenFd{::socket(PF_INET, SOCK_STREAM, IPPROTO_TCP)}
{
    if (!listenFd)
    {
        throw std::runtime_error("Could not create server TCP socket.");
    }

    // allow socket descriptor to be reuseable
    int on = 1;
    if (setsockopt(listenFd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0)
    {
        throw std::runtime_error("Could not set options on server TCP socket.");
    }

    // construct local address structure
    sockaddr_in server_addr{};                       // local address
    memset(&server_addr, 0, sizeof(server_addr));    // zero out structure
    server_addr.sin_family = AF_INET;                // internet address family
    server_addr.sin_addr.s_addr = htonl(INADDR_ANY); // any incoming interface
    server_addr.sin_port = htons(server_port);       // local port

    // bind to the local address
    if (::bind(listenFd, copy_cast<const sockaddr *>(&server_addr), sizeof(server_addr)) < 0)
    {
        // bind error: Permission denied
        // probably trying to bind a port under 1024. These ports usually require root privileges to
        // be bound.
        throw std::runtime_error("Could not bind server TCP socket.");
    }

    // mark the socket so it will listen for incoming connections
    if (::listen(listenFd, MAXPENDING) < 0)
    {
        throw std::runtime_error("Could listen server TCP socket.");
    }

    addr_len_t len_addr = sizeof(server_addr);
    if (::getsockname(listenFd, copy_cast<sockaddr *>(&server_addr), &len_addr) < 0)
    {
        throw std::runtime_error("Could not get bound port of server TCP socket.");
    }
    m_port = ntohs(server_addr.sin_port);
}

CClientSocket CTcpAcceptServer::accept()
{
    sockaddr_in addr_client{}; // client address
    addr_len_t len_addr = sizeof(addr_client);

    // wait for a client to connect
    CManagedFd client_socket(::accept(listenFd, copy_cast<sockaddr *>(&addr_client), &len_addr));
    if (client_socket)
    {
        return {std::move(client_socket), addr_client};
    }
    std::cerr << "Accept Error: " << parse_error(errno) << std::endl;
    return {};
}

CClientSocket CTcpAcceptServer::accept_autoclose(const utility::runnerint_t &is_interrupted_ptr)
{
    sockaddr_in addr_client{}; // client address
    addr_len_t len_addr = sizeof(addr_client);

    // NOLINTNEXTLINE
    std::array<pollfd, 1u> fds = {
      pollfd{listenFd, POLLIN, 0}, // NOLINT
    };

    while (!(*is_interrupted_ptr))
    {
        // NOLINTNEXTLINE
        if (poll(fds.data(), fds.size(), kAcceptPollTimeout.count()) < 1
            || fds.front().revents != POLLIN)
        {
            continue;
        }
        fds.front().revents = 0;

        // wait for a client to connect
        CManagedFd client_socket(
          ::accept(listenFd, copy_cast<sockaddr *>(&addr_client), &len_addr));
        if (client_socket)
        {
            return {std::move(client_socket), addr_client};
        }
        std::cerr << "Accept Error: " << parse_error(errno) << std::endl;
    }
    return {};
}

EConnectStatus CTcpClientConnection::connect(const std::string &host_name,
                                             const uint16_t server_port)
{
    disconnect();

    // I'm not sure if existing design will work for IPv6, so let it be fixed V4.
    const auto server_ips = CClientSocket::hostname_to_ip(host_name.c_str(), EIpType::IPv4);
    if (server_ips.empty())
    {
        return EConnectStatus::ResolveFailed;
    }

    // construct the server address structure
    sockaddr_in server_addr{}; // server address
    for (const auto &ip : server_ips)
    {
        memset(&server_addr, 0, sizeof(server_addr)); // zero out structure
        server_addr.sin_family = AF_INET;             // internet address family
        if (inet_pton(AF_INET, ip.c_str(), &server_addr.sin_addr) <= 0)
        {
            continue;
        }
        server_addr.sin_port = htons(server_port); // server port

        // create a stream socket using TCP, failed connect() leaves socket unusable so new one per
        // each IP.
        CManagedFd fd(::socket(PF_INET, SOCK_STREAM, IPPROTO_TCP));
        if (!fd)
        {
            std::cerr << "Client Socket Error: " << parse_error(errno) << std::endl;
            return EConnectStatus::Refused;
        }

        // establish the connection to the server
        if (::connect(fd, copy_cast<sockaddr *>(&server_addr), sizeof(server_addr)) < 0)
        {
            std::cerr << "connect to " << ip << ":" << server_port
                      << " error: " << parse_error(errno) << std::endl;
            continue;
        }
        m_client_socket = {std::move(fd), server_addr};
        return EConnectStatus::Ok;
    }

    return EConnectStatus::Refused;
}

void CTcpClientConnection::disconnect() noexcept
{
    m_client_socket.close();
}

CClientSocket CTcpClientConnection::release_socket() noexcept
{
    return std::move(m_client_socket);
}

} // namespace minihttp
