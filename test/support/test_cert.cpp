// ===================== test/support/test_cert.cpp =====================
#include "test_cert.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <unistd.h>

namespace netprobe::test
{
    namespace
    {
        void add_ext(X509 *cert, int nid, const char *value)
        {
            X509V3_CTX v3;
            X509V3_set_ctx_nodb(&v3);
            X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
            X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value);
            if (!ext)
                throw std::runtime_error(std::string("bad extension ") + value);
            X509_add_ext(cert, ext, -1);
            X509_EXTENSION_free(ext);
        }
    } // namespace

    TestCert::TestCert()
    {
        EVP_PKEY_CTX *kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
        if (!kctx || EVP_PKEY_keygen_init(kctx) <= 0 ||
            EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx, NID_X9_62_prime256v1) <= 0 ||
            EVP_PKEY_keygen(kctx, &key_) <= 0)
        {
            EVP_PKEY_CTX_free(kctx);
            throw std::runtime_error("test key generation failed");
        }
        EVP_PKEY_CTX_free(kctx);

        cert_ = X509_new();
        X509_set_version(cert_, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert_), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert_), -3600);
        X509_gmtime_adj(X509_getm_notAfter(cert_), 30L * 86400);
        X509_set_pubkey(cert_, key_);

        X509_NAME *name = X509_get_subject_name(cert_);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char *>("localhost"),
                                   -1, -1, 0);
        X509_set_issuer_name(cert_, name);

        add_ext(cert_, NID_basic_constraints, "critical,CA:TRUE");
        add_ext(cert_, NID_key_usage, "critical,digitalSignature,keyCertSign");
        add_ext(cert_, NID_subject_alt_name, "DNS:localhost,IP:127.0.0.1,IP:::1");

        if (X509_sign(cert_, key_, EVP_sha256()) <= 0)
            throw std::runtime_error("test certificate signing failed");
    }

    TestCert::~TestCert()
    {
        if (!temp_path_.empty())
            ::unlink(temp_path_.c_str());
        X509_free(cert_);
        EVP_PKEY_free(key_);
    }

    std::string TestCert::pem() const
    {
        BIO *bio = BIO_new(BIO_s_mem());
        PEM_write_bio_X509(bio, cert_);
        char *data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        std::string out(data, static_cast<size_t>(len));
        BIO_free(bio);
        return out;
    }

    std::string TestCert::writeTempFile()
    {
        if (!temp_path_.empty())
            return temp_path_;
        char tmpl[] = "/tmp/netprobe-ca-XXXXXX";
        int fd = ::mkstemp(tmpl);
        if (fd == -1)
            throw std::runtime_error("mkstemp failed");
        const std::string data = pem();
        if (::write(fd, data.data(), data.size()) != static_cast<ssize_t>(data.size()))
        {
            ::close(fd);
            throw std::runtime_error("writing CA file failed");
        }
        ::close(fd);
        temp_path_ = tmpl;
        return temp_path_;
    }

    SSL_CTX *TestCert::newServerContext() const
    {
        SSL_CTX *ctx = SSL_CTX_new(TLS_server_method());
        if (!ctx || SSL_CTX_use_certificate(ctx, cert_) != 1 || SSL_CTX_use_PrivateKey(ctx, key_) != 1)
        {
            SSL_CTX_free(ctx);
            throw std::runtime_error("test server SSL_CTX setup failed");
        }
        return ctx;
    }
} // namespace netprobe::test
