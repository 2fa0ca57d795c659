/**
 * PORTWAY - API Gateway Request Kernel
 * TLS Resolver - per-handshake certificate selection from the live snapshot
 */

#ifndef PORTWAY_SERVER_TLS_RESOLVER_HPP
#define PORTWAY_SERVER_TLS_RESOLVER_HPP

#include "config/snapshot.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio/ssl.hpp>

#include <openssl/ssl.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portway::server {

namespace ssl = boost::asio::ssl;

/**
 * TLS Resolver
 *
 * Installed as the OpenSSL server-name callback of each TLS listener. For
 * every ClientHello it loads the current snapshot and switches the
 * connection to the best certificate:
 *   - exact host beats wildcard, longer wildcard suffix beats shorter,
 *     earlier declaration wins ties; a wildcard covers a single label
 *   - no server name, or no match: the listener's default certificate
 *   - nothing at all: fatal unrecognized_name alert for this handshake only
 *
 * Once switched, OpenSSL holds its own reference to the chosen context, so
 * publishing a new snapshot never disturbs a handshake already resolved.
 */
class TlsResolver {
public:
    explicit TlsResolver(const config::SnapshotStore& store);

    // Non-copyable
    TlsResolver(const TlsResolver&) = delete;
    TlsResolver& operator=(const TlsResolver&) = delete;

    /**
     * Pure lookup against one snapshot
     * @param server_name normalized server name, nullopt when the client sent none
     * @param default_certificate entry name, may be empty
     */
    static const config::CertificateEntry* select(const config::ConfigSnapshot& snapshot,
                                                  std::optional<std::string_view> server_name,
                                                  std::string_view default_certificate);

    /**
     * Lookup against the current snapshot
     */
    std::shared_ptr<ssl::context> resolve(std::optional<std::string_view> server_name,
                                          std::string_view default_certificate) const;

    /**
     * Install the server-name callback on a listener context.
     * The resolver must outlive the context.
     */
    void attach(ssl::context& listener_context, std::string listener_name,
                std::string default_certificate);

private:
    struct Binding {
        const TlsResolver* resolver;
        std::string listener;
        std::string default_certificate;
    };

    static int servername_callback(SSL* ssl, int* alert, void* arg);

    const config::SnapshotStore& store_;
    std::mutex bindings_mutex_;
    std::vector<std::unique_ptr<Binding>> bindings_;
};

} // namespace portway::server

#endif // PORTWAY_SERVER_TLS_RESOLVER_HPP
