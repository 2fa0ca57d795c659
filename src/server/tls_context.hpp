/**
 * PORTWAY - API Gateway Request Kernel
 * TLS Context - builds OpenSSL contexts for listeners and certificate entries
 */

#ifndef PORTWAY_SERVER_TLS_CONTEXT_HPP
#define PORTWAY_SERVER_TLS_CONTEXT_HPP

#include "config/config.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <memory>
#include <string>

namespace portway::server {

namespace asio = boost::asio;
namespace ssl = asio::ssl;

/**
 * Context holding one certificate entry's key and chain.
 * Material comes from cert_file/key_file or inline cert_pem/key_pem.
 * @throws std::runtime_error if certificate/key loading fails
 */
std::shared_ptr<ssl::context> make_certificate_context(const config::CertificateConfig& config);

/**
 * Context a TLS listener accepts with. It holds no certificate; the TLS
 * resolver switches every handshake to a certificate context.
 */
std::shared_ptr<ssl::context> make_listener_context();

} // namespace portway::server

#endif // PORTWAY_SERVER_TLS_CONTEXT_HPP
