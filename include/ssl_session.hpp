// ===================== include/ssl_session.hpp =====================
#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <openssl/ssl.h>

#include "byte_stream.hpp"
#include "module_config.hpp"

namespace netprobe
{
    // Client SSL_CTX built once per attempt from a TlsConfig. Construction
    // fails with ProbeError("tls", ...) on unreadable CA, cert or key files.
    class TlsContext
    {
        SSL_CTX *ctx_;
        TlsConfig config_;

    public:
        explicit TlsContext(const TlsConfig &config);
        ~TlsContext();
        TlsContext(const TlsContext &) = delete;
        TlsContext &operator=(const TlsContext &) = delete;

        SSL_CTX *get() const { return ctx_; }
        const TlsConfig &config() const { return config_; }
    };

    class SslSession : public ByteStream
    {
        SSL *ssl_;
        int fd_;

    public:
        explicit SslSession(const TlsContext &tls);
        ~SslSession() override;
        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        // hostname is used for SNI and certificate verification unless the
        // TlsConfig names a server_name.
        void handshake(int sockfd, const std::string &hostname, Context &ctx);
        void writeAll(const std::string &data, Context &ctx) override;
        std::size_t readSome(char *buf, std::size_t len, Context &ctx) override;

        std::string version() const;
        // Earliest notAfter over the peer chain, unix seconds.
        std::optional<std::time_t> earliestCertExpiry() const;

    private:
        std::string serverName_;
        const TlsContext &tls_;

        void waitIo(int err, Context &ctx, const std::string &phase);
    };
} // namespace netprobe
