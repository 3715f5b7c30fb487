#pragma once

#include "transport.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>

#include <cstddef>
#include <memory>
#include <string>

#include <openssl/ssl.h>

namespace minihttp {

/// @brief TLS client session over already connected socket (direct or proxy tunnel).
class CTlsTransport final : public ITransport
{
  public:
    /// @brief Does TLS handshake with SNI set to @p host.
    /// @param verify - checks server's certificate chain against default trust store and @p host
    /// against certificate's names.
    /// @throws CHttpError(EHttpError::TlsHandshakeFailed).
    CTlsTransport(CClientSocket socket, const std::string &host, bool verify);
    ~CTlsTransport() override;
    NO_COPYMOVE(CTlsTransport);

    Result ReadSome(void *buf, std::size_t size_buf) override;
    Result WriteAll(const void *buf, std::size_t size_buf) override;
    void Close() noexcept override;

  private:
    struct TSslCtxDeleter
    {
        void operator()(SSL_CTX *ctx) const noexcept
        {
            SSL_CTX_free(ctx);
        }
    };
    struct TSslDeleter
    {
        void operator()(SSL *ssl) const noexcept
        {
            SSL_free(ssl);
        }
    };

    /// @returns text of the last OpenSSL errors, clears error queue.
    static std::string LastSslErrors();

    CClientSocket iSocket;
    std::unique_ptr<SSL_CTX, TSslCtxDeleter> iContext;
    std::unique_ptr<SSL, TSslDeleter> iSsl;
};

} // namespace minihttp
