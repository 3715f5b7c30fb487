#include "tls_transport.hpp" // IWYU pragma: keep

#include "http_error.hpp"
#include "url.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

namespace minihttp {

namespace {
/// @brief SSL_read/SSL_write accept int sizes.
constexpr std::size_t kMaxSslIo = INT_MAX;
} // namespace

CTlsTransport::CTlsTransport(CClientSocket socket, const std::string &host, const bool verify) :
    iSocket(std::move(socket))
{
    // OpenSSL 1.1+ initializes itself once in a thread-safe way.
    OPENSSL_init_ssl(0, nullptr);

    iContext.reset(SSL_CTX_new(TLS_client_method()));
    if (!iContext)
    {
        throw CHttpError(EHttpError::TlsHandshakeFailed, "SSL_CTX_new() failed " + LastSslErrors());
    }
    // Many servers close connection without close_notify after "Connection: close" response.
    SSL_CTX_set_options(iContext.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
    // Connection is never reused, so close_notify is not sent: server may be gone already and
    // write into closed socket raises SIGPIPE.
    SSL_CTX_set_quiet_shutdown(iContext.get(), 1);
    if (verify)
    {
        SSL_CTX_set_verify(iContext.get(), SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(iContext.get()) != 1)
        {
            throw CHttpError(EHttpError::TlsHandshakeFailed,
                             "SSL_CTX_set_default_verify_paths() failed " + LastSslErrors());
        }
    }
    else
    {
        SSL_CTX_set_verify(iContext.get(), SSL_VERIFY_NONE, nullptr);
    }

    iSsl.reset(SSL_new(iContext.get()));
    if (!iSsl)
    {
        throw CHttpError(EHttpError::TlsHandshakeFailed, "SSL_new() failed " + LastSslErrors());
    }
    // SNI is for names only, IP address is checked against certificate's IP entries.
    const bool isIp = utility::IsIpLiteral(host);
    if (!isIp)
    {
        SSL_set_tlsext_host_name(iSsl.get(), host.c_str());
    }
    if (verify)
    {
        const bool expected =
          isIp ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(iSsl.get()), host.c_str()) == 1
               : SSL_set1_host(iSsl.get(), host.c_str()) == 1;
        if (!expected)
        {
            throw CHttpError(EHttpError::TlsHandshakeFailed,
                             "could not set expected peer name " + host);
        }
    }
    if (SSL_set_fd(iSsl.get(), iSocket.native_handle()) != 1)
    {
        throw CHttpError(EHttpError::TlsHandshakeFailed, "SSL_set_fd() failed " + LastSslErrors());
    }

    if (SSL_connect(iSsl.get()) != 1)
    {
        std::string reason = LastSslErrors();
        if (verify && SSL_get_verify_result(iSsl.get()) != X509_V_OK)
        {
            reason += X509_verify_cert_error_string(SSL_get_verify_result(iSsl.get()));
        }
        throw CHttpError(EHttpError::TlsHandshakeFailed,
                         "handshake with " + host + " failed " + reason);
    }
}

CTlsTransport::~CTlsTransport()
{
    Close();
}

ITransport::Result CTlsTransport::ReadSome(void *buf, std::size_t size_buf)
{
    if (!iSsl)
    {
        return {EIoStatus::Error, 0u};
    }
    while (true)
    {
        const int rc =
          SSL_read(iSsl.get(), buf, static_cast<int>(std::min(size_buf, kMaxSslIo)));
        if (rc > 0)
        {
            return {EIoStatus::Ok, static_cast<std::size_t>(rc)};
        }
        const int sslError = SSL_get_error(iSsl.get(), rc);
        if (sslError == SSL_ERROR_ZERO_RETURN)
        {
            return {EIoStatus::OkReceivedZero, 0u};
        }
        if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE)
        {
            // Blocking socket gives it on timeout or renegotiation.
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return {EIoStatus::Timeout, 0u};
            }
            continue;
        }
        ERR_clear_error();
        return {EIoStatus::Error, 0u};
    }
}

ITransport::Result CTlsTransport::WriteAll(const void *_buf, std::size_t size_buf)
{
    if (!iSsl)
    {
        return {EIoStatus::Error, size_buf};
    }
    const char *buf = static_cast<const char *>(_buf);
    std::size_t sizeLeft = size_buf;
    while (sizeLeft > 0)
    {
        const int rc =
          SSL_write(iSsl.get(), buf, static_cast<int>(std::min(sizeLeft, kMaxSslIo)));
        if (rc > 0)
        {
            sizeLeft -= static_cast<std::size_t>(rc);
            std::advance(buf, rc);
            continue;
        }
        const int sslError = SSL_get_error(iSsl.get(), rc);
        if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return {EIoStatus::Timeout, sizeLeft};
            }
            continue;
        }
        ERR_clear_error();
        return {EIoStatus::Error, sizeLeft};
    }
    return {EIoStatus::Ok, 0u};
}

void CTlsTransport::Close() noexcept
{
    if (iSsl)
    {
        SSL_shutdown(iSsl.get());
        iSsl.reset();
    }
    iContext.reset();
    iSocket.close();
    ERR_clear_error();
}

std::string CTlsTransport::LastSslErrors()
{
    std::string result;
    std::array<char, 256> tmp{};
    for (auto code = ERR_get_error(); code != 0; code = ERR_get_error())
    {
        ERR_error_string_n(code, tmp.data(), tmp.size());
        result += "[";
        result += tmp.data();
        result += "]";
    }
    return result;
}

} // namespace minihttp
