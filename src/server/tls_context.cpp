/**
 * PORTWAY - API Gateway Request Kernel
 * TLS Context implementation - TLS versions, ciphers and certificate loading
 */

#include "server/tls_context.hpp"

#include <spdlog/spdlog.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace portway::server {

namespace {

/**
 * Get OpenSSL error string
 */
std::string get_ssl_error_string() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

bool file_readable(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return false;
    }
    std::ifstream file(path);
    return file.good();
}

std::string password_callback(std::size_t max_length,
                              ssl::context::password_purpose /*purpose*/,
                              const std::string& password) {
    if (password.length() > max_length) {
        return password.substr(0, max_length);
    }
    return password;
}

void configure_tls_versions(ssl::context& ctx) {
    ssl::context::options opts = ssl::context::default_workarounds |
                                 ssl::context::no_sslv2 |
                                 ssl::context::no_sslv3 |
                                 ssl::context::no_tlsv1 |
                                 ssl::context::no_tlsv1_1 |
                                 ssl::context::single_dh_use;

    // TLS 1.2 and TLS 1.3
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
    ctx.set_options(opts);
}

void configure_ciphers(ssl::context& ctx) {
    SSL_CTX* ssl_ctx = ctx.native_handle();

    const char* cipher_list = "ECDHE+AESGCM:DHE+AESGCM:ECDHE+CHACHA20:DHE+CHACHA20:"
                              "ECDHE+AES256:DHE+AES256:ECDHE+AES128:DHE+AES128:"
                              "!aNULL:!eNULL:!EXPORT:!DES:!RC4:!3DES:!MD5:!PSK";
    if (SSL_CTX_set_cipher_list(ssl_ctx, cipher_list) != 1) {
        spdlog::warn("TLS: Failed to set TLS 1.2 cipher list, using defaults");
    }

    const char* ciphersuites = "TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256:"
                               "TLS_AES_128_GCM_SHA256";
    if (SSL_CTX_set_ciphersuites(ssl_ctx, ciphersuites) != 1) {
        spdlog::warn("TLS: Failed to set TLS 1.3 ciphersuites, using defaults");
    }
}

void load_certificate(ssl::context& ctx, const config::CertificateConfig& config) {
    if (!config.key_password.empty()) {
        ctx.set_password_callback(
            [password = config.key_password](std::size_t max_length, ssl::context::password_purpose purpose) {
                return password_callback(max_length, purpose, password);
            }
        );
    }

    boost::system::error_code ec;

    if (!config.cert_pem.empty()) {
        ctx.use_certificate_chain(asio::buffer(config.cert_pem), ec);
        if (ec) {
            throw std::runtime_error("Failed to load inline certificate - " + ec.message() +
                                     " (" + get_ssl_error_string() + ")");
        }
    } else {
        if (config.cert_file.empty()) {
            throw std::runtime_error("Certificate file path is empty");
        }
        if (!file_readable(config.cert_file)) {
            throw std::runtime_error("Cannot read certificate file: " + config.cert_file);
        }
        ctx.use_certificate_chain_file(config.cert_file, ec);
        if (ec) {
            throw std::runtime_error("Failed to load certificate: " + config.cert_file +
                                     " - " + ec.message() + " (" + get_ssl_error_string() + ")");
        }
    }

    if (!config.key_pem.empty()) {
        ctx.use_private_key(asio::buffer(config.key_pem), ssl::context::pem, ec);
        if (ec) {
            throw std::runtime_error("Failed to load inline private key - " + ec.message() +
                                     " (" + get_ssl_error_string() + ")");
        }
    } else {
        if (config.key_file.empty()) {
            throw std::runtime_error("Private key file path is empty");
        }
        if (!file_readable(config.key_file)) {
            throw std::runtime_error("Cannot read private key file: " + config.key_file);
        }
        ctx.use_private_key_file(config.key_file, ssl::context::pem, ec);
        if (ec) {
            throw std::runtime_error("Failed to load private key: " + config.key_file +
                                     " - " + ec.message() + " (" + get_ssl_error_string() + ")");
        }
    }

    if (SSL_CTX_check_private_key(ctx.native_handle()) != 1) {
        throw std::runtime_error("Private key does not match certificate (" + get_ssl_error_string() + ")");
    }
}

} // anonymous namespace

std::shared_ptr<ssl::context> make_certificate_context(const config::CertificateConfig& config) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    configure_tls_versions(*ctx);
    load_certificate(*ctx, config);
    configure_ciphers(*ctx);
    ctx->set_verify_mode(ssl::verify_none);

    SSL_CTX_set_session_cache_mode(ctx->native_handle(), SSL_SESS_CACHE_SERVER);

    spdlog::info("TLS: Loaded certificate '{}' ({} host patterns)", config.name, config.hosts.size());
    return ctx;
}

std::shared_ptr<ssl::context> make_listener_context() {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    configure_tls_versions(*ctx);
    configure_ciphers(*ctx);
    ctx->set_verify_mode(ssl::verify_none);
    return ctx;
}

} // namespace portway::server
