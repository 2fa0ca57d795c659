/**
 * PORTWAY - API Gateway Request Kernel
 * TLS Resolver implementation
 */

#include "server/tls_resolver.hpp"

#include "routing/host_pattern.hpp"

#include <spdlog/spdlog.h>

namespace portway::server {

TlsResolver::TlsResolver(const config::SnapshotStore& store)
    : store_(store)
{
}

const config::CertificateEntry* TlsResolver::select(const config::ConfigSnapshot& snapshot,
                                                    std::optional<std::string_view> server_name,
                                                    std::string_view default_certificate) {
    if (server_name && !server_name->empty()) {
        const config::CertificateEntry* best = nullptr;
        std::uint64_t best_rank = 0;

        for (const auto& entry : snapshot.certificates) {
            for (const auto& pattern : entry.hosts) {
                if (pattern.kind() == routing::HostPattern::Kind::any || !pattern.matches_certificate_name(*server_name)) {
                    continue;
                }
                const auto rank = pattern.specificity();
                // Entries are in declaration order, so strict > keeps the earlier one on ties
                if (!best || rank > best_rank) {
                    best = &entry;
                    best_rank = rank;
                }
            }
        }
        if (best) {
            return best;
        }
    }

    if (!default_certificate.empty()) {
        return snapshot.find_certificate(default_certificate);
    }
    return nullptr;
}

std::shared_ptr<ssl::context> TlsResolver::resolve(std::optional<std::string_view> server_name,
                                                   std::string_view default_certificate) const {
    auto snapshot = store_.current();
    if (!snapshot) {
        return nullptr;
    }
    const auto* entry = select(*snapshot, server_name, default_certificate);
    return entry ? entry->context : nullptr;
}

void TlsResolver::attach(ssl::context& listener_context, std::string listener_name,
                         std::string default_certificate) {
    auto binding = std::make_unique<Binding>(Binding{
        .resolver = this,
        .listener = std::move(listener_name),
        .default_certificate = std::move(default_certificate)
    });

    SSL_CTX* ctx = listener_context.native_handle();
    SSL_CTX_set_tlsext_servername_arg(ctx, binding.get());
    SSL_CTX_set_tlsext_servername_callback(ctx, &TlsResolver::servername_callback);

    spdlog::debug("TlsResolver: Attached to listener '{}' (default certificate '{}')",
                  binding->listener, binding->default_certificate);

    std::lock_guard lock(bindings_mutex_);
    bindings_.push_back(std::move(binding));
}

int TlsResolver::servername_callback(SSL* ssl, int* alert, void* arg) {
    auto* binding = static_cast<Binding*>(arg);
    if (!binding) {
        return SSL_TLSEXT_ERR_NOACK;
    }

    std::optional<std::string> server_name;
    if (const char* name = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name)) {
        server_name = routing::normalize_host(name);
    }

    std::optional<std::string_view> lookup;
    if (server_name) {
        lookup = *server_name;
    }

    auto context = binding->resolver->resolve(lookup, binding->default_certificate);
    if (!context) {
        spdlog::warn("TlsResolver: No certificate for '{}' on listener '{}'",
                     server_name.value_or("(no SNI)"), binding->listener);
        *alert = SSL_AD_UNRECOGNIZED_NAME;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }

    if (SSL_set_SSL_CTX(ssl, context->native_handle()) == nullptr) {
        spdlog::error("TlsResolver: Failed to switch certificate on listener '{}'", binding->listener);
        *alert = SSL_AD_INTERNAL_ERROR;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }

    spdlog::debug("TlsResolver: '{}' served on listener '{}'",
                  server_name.value_or("(no SNI)"), binding->listener);
    return SSL_TLSEXT_ERR_OK;
}

} // namespace portway::server
