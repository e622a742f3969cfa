// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include "utils_net.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <poll.h>
#include <sys/socket.h>

namespace netprobe
{
    namespace
    {
        std::string openssl_error()
        {
            unsigned long code = 0, last = 0;
            while ((code = ERR_get_error()) != 0)
                last = code;
            if (last == 0)
                return "unknown error";
            char buf[256];
            ERR_error_string_n(last, buf, sizeof(buf));
            return buf;
        }

        // Socket BIO that sends with MSG_NOSIGNAL, so a peer that resets the
        // connection mid-write yields EPIPE instead of SIGPIPE.
        struct SocketBioState
        {
            int fd;
            bool eof = false;
        };

        SocketBioState *bio_state(BIO *b)
        {
            return static_cast<SocketBioState *>(BIO_get_data(b));
        }

        int bio_write(BIO *b, const char *data, int len)
        {
            BIO_clear_retry_flags(b);
            ssize_t n = ::send(bio_state(b)->fd, data, static_cast<size_t>(len), MSG_NOSIGNAL);
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
                BIO_set_retry_write(b);
            return static_cast<int>(n);
        }

        int bio_read(BIO *b, char *buf, int len)
        {
            BIO_clear_retry_flags(b);
            ssize_t n = ::recv(bio_state(b)->fd, buf, static_cast<size_t>(len), 0);
            if (n == 0)
                bio_state(b)->eof = true;
            else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
                BIO_set_retry_read(b);
            return static_cast<int>(n);
        }

        long bio_ctrl(BIO *b, int cmd, long, void *ptr)
        {
            switch (cmd)
            {
            case BIO_CTRL_FLUSH:
                return 1;
            case BIO_CTRL_EOF:
                return bio_state(b)->eof ? 1 : 0;
            case BIO_C_GET_FD:
                if (ptr)
                    *static_cast<int *>(ptr) = bio_state(b)->fd;
                return bio_state(b)->fd;
            default:
                return 0;
            }
        }

        int bio_destroy(BIO *b)
        {
            delete bio_state(b);
            BIO_set_data(b, nullptr);
            BIO_set_init(b, 0);
            return 1;
        }

        BIO_METHOD *socket_bio_method()
        {
            static BIO_METHOD *method = nullptr;
            static std::once_flag once;
            std::call_once(once, [] {
                method = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK | BIO_TYPE_DESCRIPTOR,
                                      "netprobe socket");
                if (!method)
                    return;
                if (BIO_meth_set_write(method, bio_write) != 1 || BIO_meth_set_read(method, bio_read) != 1 ||
                    BIO_meth_set_ctrl(method, bio_ctrl) != 1 || BIO_meth_set_destroy(method, bio_destroy) != 1)
                {
                    BIO_meth_free(method);
                    method = nullptr;
                }
            });
            return method;
        }

        BIO *new_socket_bio(int fd)
        {
            BIO_METHOD *method = socket_bio_method();
            BIO *b = method ? BIO_new(method) : nullptr;
            if (!b)
                return nullptr;
            BIO_set_data(b, new SocketBioState{fd});
            BIO_set_init(b, 1);
            return b;
        }

        std::string syscall_error(const char *what)
        {
            if (ERR_peek_error() != 0)
                return std::string(what) + " failed: " + openssl_error();
            if (errno != 0)
                return std::string(what) + " failed: " + std::strerror(errno);
            return std::string(what) + " failed: connection closed by peer";
        }
    } // namespace

    TlsContext::TlsContext(const TlsConfig &config) : ctx_(nullptr), config_(config)
    {
        OPENSSL_init_ssl(0, nullptr);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_)
            throw ProbeError("tls", "Failed to create SSL_CTX: " + openssl_error());

        auto fail = [this](const std::string &what) {
            std::string msg = what + ": " + openssl_error();
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
            throw ProbeError("tls", msg);
        };

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

        if (config_.insecure_skip_verify)
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        else
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);

        if (!config_.ca_file.empty())
        {
            if (SSL_CTX_load_verify_locations(ctx_, config_.ca_file.c_str(), nullptr) != 1)
                fail("unable to load CA file " + config_.ca_file);
        }
        else if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
        {
            fail("unable to load system trust store");
        }

        if (!config_.cert_file.empty())
        {
            const std::string &key = config_.key_file.empty() ? config_.cert_file : config_.key_file;
            if (SSL_CTX_use_certificate_chain_file(ctx_, config_.cert_file.c_str()) != 1)
                fail("unable to load client certificate " + config_.cert_file);
            if (SSL_CTX_use_PrivateKey_file(ctx_, key.c_str(), SSL_FILETYPE_PEM) != 1)
                fail("unable to load client key " + key);
            if (SSL_CTX_check_private_key(ctx_) != 1)
                fail("client key does not match certificate");
        }
    }

    TlsContext::~TlsContext()
    {
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    SslSession::SslSession(const TlsContext &tls) : ssl_(nullptr), fd_(-1), tls_(tls) {}

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            // torn down without close_notify
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
    }

    void SslSession::waitIo(int err, Context &ctx, const std::string &phase)
    {
        ctx.waitFor(fd_, err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, phase);
    }

    void SslSession::handshake(int sockfd, const std::string &hostname, Context &ctx)
    {
        ssl_ = SSL_new(tls_.get());
        if (!ssl_)
            throw ProbeError("tls", "SSL_new failed: " + openssl_error());
        fd_ = sockfd;
        BIO *bio = new_socket_bio(sockfd);
        if (!bio)
            throw ProbeError("tls", "cannot create socket BIO: " + openssl_error());
        SSL_set_bio(ssl_, bio, bio);

        const TlsConfig &cfg = tls_.config();
        serverName_ = cfg.server_name.empty() ? hostname : cfg.server_name;
        const bool literal = net::is_ip_literal(serverName_);
        if (!literal)
            SSL_set_tlsext_host_name(ssl_, serverName_.c_str());

        if (!cfg.insecure_skip_verify)
        {
            X509_VERIFY_PARAM *param = SSL_get0_param(ssl_);
            if (literal)
            {
                if (X509_VERIFY_PARAM_set1_ip_asc(param, serverName_.c_str()) != 1)
                    throw ProbeError("tls", "cannot verify against address " + serverName_);
            }
            else
            {
                X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
                if (SSL_set1_host(ssl_, serverName_.c_str()) != 1)
                    throw ProbeError("tls", "cannot verify against host " + serverName_);
            }
        }

        while (true)
        {
            ERR_clear_error();
            int rc = SSL_connect(ssl_);
            if (rc == 1)
                return;
            int err = SSL_get_error(ssl_, rc);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            {
                waitIo(err, ctx, "tls");
                continue;
            }
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK)
                throw ProbeError("tls", std::string("certificate verify failed: ") +
                                            X509_verify_cert_error_string(verify));
            throw ProbeError("tls", "handshake failed: " + openssl_error());
        }
    }

    void SslSession::writeAll(const std::string &data, Context &ctx)
    {
        if (!ssl_)
            throw ProbeError("write", "TLS session not established");

        size_t off = 0;
        while (off < data.size())
        {
            ERR_clear_error();
            errno = 0;
            int n = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            {
                waitIo(err, ctx, "write");
                continue;
            }
            if (err == SSL_ERROR_SYSCALL)
                throw ProbeError("write", syscall_error("SSL_write"));
            throw ProbeError("write", "SSL_write failed: " + openssl_error());
        }
    }

    std::size_t SslSession::readSome(char *buf, std::size_t len, Context &ctx)
    {
        if (!ssl_)
            throw ProbeError("read", "TLS session not established");

        while (true)
        {
            ERR_clear_error();
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0)
                return static_cast<size_t>(n);
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_ZERO_RETURN)
                return 0;
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            {
                waitIo(err, ctx, "read");
                continue;
            }
            // peer closed without close_notify
            if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)
                return 0;
            throw ProbeError("read", "SSL_read failed: " + openssl_error());
        }
    }

    std::string SslSession::version() const
    {
        return ssl_ ? SSL_get_version(ssl_) : std::string();
    }

    std::optional<std::time_t> SslSession::earliestCertExpiry() const
    {
        if (!ssl_)
            return std::nullopt;
        STACK_OF(X509) *chain = SSL_get_peer_cert_chain(ssl_);
        if (!chain)
            return std::nullopt;

        std::optional<std::time_t> earliest;
        for (int i = 0; i < sk_X509_num(chain); ++i)
        {
            const ASN1_TIME *not_after = X509_get0_notAfter(sk_X509_value(chain, i));
            std::tm tm{};
            if (!not_after || ASN1_TIME_to_tm(not_after, &tm) != 1)
                continue;
            std::time_t t = timegm(&tm);
            if (!earliest || t < *earliest)
                earliest = t;
        }
        return earliest;
    }
} // namespace netprobe
