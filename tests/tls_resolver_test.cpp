/**
 * PORTWAY - API Gateway Request Kernel
 * TLS resolver tests
 */

#include "config/snapshot.hpp"
#include "server/tls_context.hpp"
#include "server/tls_resolver.hpp"

#include <gtest/gtest.h>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <initializer_list>
#include <memory>
#include <stdexcept>

using namespace portway;

namespace {

namespace ssl = boost::asio::ssl;

config::CertificateEntry make_entry(std::string name, std::initializer_list<const char*> hosts,
                                    std::size_t order) {
    config::CertificateEntry entry;
    entry.name = std::move(name);
    for (const char* host : hosts) {
        entry.hosts.push_back(routing::HostPattern::parse(host));
    }
    entry.context = std::make_shared<ssl::context>(ssl::context::tls_server);
    entry.order = order;
    return entry;
}

std::string selected(const config::ConfigSnapshot& snapshot,
                     std::optional<std::string_view> name,
                     std::string_view default_certificate = "") {
    const auto* entry = server::TlsResolver::select(snapshot, name, default_certificate);
    return entry ? entry->name : "<none>";
}

struct TestCertificate {
    std::string cert_pem;
    std::string key_pem;
};

std::string bio_contents(BIO* bio) {
    char* data = nullptr;
    long size = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<std::size_t>(size));
}

/**
 * Self-signed P-256 certificate whose subject CN is common_name
 */
TestCertificate self_signed(const std::string& common_name) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> keygen(
        EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
    EVP_PKEY* raw_key = nullptr;
    if (!keygen || EVP_PKEY_keygen_init(keygen.get()) != 1 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(keygen.get(), NID_X9_62_prime256v1) != 1 ||
        EVP_PKEY_keygen(keygen.get(), &raw_key) != 1) {
        throw std::runtime_error("key generation failed");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw_key, &EVP_PKEY_free);

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* subject = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(subject, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), subject);
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
        throw std::runtime_error("certificate signing failed");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), &BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), &BIO_free);
    PEM_write_bio_X509(cert_bio.get(), cert.get());
    PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr);
    return TestCertificate{.cert_pem = bio_contents(cert_bio.get()),
                           .key_pem = bio_contents(key_bio.get())};
}

config::CertificateEntry loaded_entry(std::string name, const char* host, std::size_t order) {
    auto material = self_signed(host);

    config::CertificateConfig cert_config;
    cert_config.name = name;
    cert_config.hosts = {host};
    cert_config.cert_pem = material.cert_pem;
    cert_config.key_pem = material.key_pem;

    config::CertificateEntry entry;
    entry.name = std::move(name);
    entry.hosts.push_back(routing::HostPattern::parse(host));
    entry.context = server::make_certificate_context(cert_config);
    entry.order = order;
    return entry;
}

struct HandshakeOutcome {
    bool established{false};
    std::string peer_name;  // CN of the certificate the server presented
    int alert{0};           // alert description the client received
};

void record_alert(const SSL* ssl, int where, int ret) {
    if ((where & SSL_CB_READ_ALERT) != 0) {
        *static_cast<int*>(SSL_get_app_data(ssl)) = ret & 0xff;
    }
}

/**
 * Run a full handshake between a client and listener_context over a BIO pair
 */
HandshakeOutcome handshake(ssl::context& listener_context, const char* server_name) {
    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> client_ctx(SSL_CTX_new(TLS_client_method()),
                                                                 &SSL_CTX_free);
    std::unique_ptr<SSL, decltype(&SSL_free)> client(SSL_new(client_ctx.get()), &SSL_free);
    std::unique_ptr<SSL, decltype(&SSL_free)> server(SSL_new(listener_context.native_handle()), &SSL_free);

    BIO* client_io = nullptr;
    BIO* server_io = nullptr;
    BIO_new_bio_pair(&client_io, 0, &server_io, 0);
    SSL_set_bio(client.get(), client_io, client_io);
    SSL_set_bio(server.get(), server_io, server_io);
    SSL_set_connect_state(client.get());
    SSL_set_accept_state(server.get());

    HandshakeOutcome outcome;
    SSL_set_app_data(client.get(), &outcome.alert);
    SSL_set_info_callback(client.get(), &record_alert);
    if (server_name) {
        SSL_set_tlsext_host_name(client.get(), server_name);
    }

    enum class State { running, done, failed };
    auto step = [](SSL* ssl, State& state) {
        if (state != State::running) {
            return;
        }
        const int rc = SSL_do_handshake(ssl);
        if (rc == 1) {
            state = State::done;
            return;
        }
        const int err = SSL_get_error(ssl, rc);
        if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
            state = State::failed;
        }
    };

    State client_state = State::running;
    State server_state = State::running;
    for (int round = 0; round < 16; ++round) {
        step(client.get(), client_state);
        step(server.get(), server_state);
        if (client_state != State::running && server_state != State::running) {
            break;
        }
        if (client_state == State::failed) {
            break;
        }
    }
    ERR_clear_error();

    outcome.established = client_state == State::done && server_state == State::done;
    if (X509* peer = SSL_get1_peer_certificate(client.get())) {
        char common_name[256] = {};
        X509_NAME_get_text_by_NID(X509_get_subject_name(peer), NID_commonName,
                                  common_name, sizeof(common_name));
        outcome.peer_name = common_name;
        X509_free(peer);
    }
    return outcome;
}

class TlsResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot.certificates.push_back(make_entry("wildcard", {"*.example.com"}, 0));
        snapshot.certificates.push_back(make_entry("fallback", {"fallback.local"}, 1));
    }

    config::ConfigSnapshot snapshot;
};

} // anonymous namespace

TEST_F(TlsResolverTest, WildcardServesSubdomain) {
    EXPECT_EQ(selected(snapshot, "foo.example.com", "fallback"), "wildcard");
}

TEST_F(TlsResolverTest, ExactBeatsWildcard) {
    snapshot.certificates.push_back(make_entry("api", {"api.example.com"}, 2));
    EXPECT_EQ(selected(snapshot, "api.example.com", "fallback"), "api");
    EXPECT_EQ(selected(snapshot, "www.example.com", "fallback"), "wildcard");
}

TEST_F(TlsResolverTest, LongerWildcardSuffixWins) {
    snapshot.certificates.push_back(make_entry("eu", {"*.eu.example.com"}, 2));
    EXPECT_EQ(selected(snapshot, "shop.eu.example.com"), "eu");
    EXPECT_EQ(selected(snapshot, "us.example.com"), "wildcard");
}

TEST_F(TlsResolverTest, WildcardCoversOneLabelOnly) {
    EXPECT_EQ(selected(snapshot, "a.b.example.com", "fallback"), "fallback");
    EXPECT_EQ(selected(snapshot, "a.b.example.com"), "<none>");
    EXPECT_EQ(selected(snapshot, "b.example.com"), "wildcard");
}

TEST_F(TlsResolverTest, TiesGoToDeclarationOrder) {
    snapshot.certificates.push_back(make_entry("second-wildcard", {"*.example.com"}, 2));
    EXPECT_EQ(selected(snapshot, "foo.example.com"), "wildcard");
}

TEST_F(TlsResolverTest, NoServerNameUsesListenerDefault) {
    EXPECT_EQ(selected(snapshot, std::nullopt, "fallback"), "fallback");
    EXPECT_EQ(selected(snapshot, std::nullopt, ""), "<none>");
    EXPECT_EQ(selected(snapshot, std::nullopt, "missing"), "<none>");
}

TEST_F(TlsResolverTest, UnknownNameFallsBackToDefaultOrFails) {
    EXPECT_EQ(selected(snapshot, "example.com", "fallback"), "fallback");
    EXPECT_EQ(selected(snapshot, "other.org"), "<none>");
}

TEST_F(TlsResolverTest, ResolveReadsThePublishedSnapshot) {
    config::SnapshotStore store;
    server::TlsResolver resolver(store);
    EXPECT_EQ(resolver.resolve("foo.example.com", ""), nullptr);

    auto first = std::make_shared<config::ConfigSnapshot>(snapshot);
    store.publish(first);
    EXPECT_EQ(resolver.resolve("foo.example.com", ""), first->certificates[0].context);

    // A new snapshot is seen by the next lookup
    auto second = std::make_shared<config::ConfigSnapshot>();
    second->certificates.push_back(make_entry("replacement", {"*.example.com"}, 0));
    store.publish(second);
    EXPECT_EQ(resolver.resolve("foo.example.com", ""), second->certificates[0].context);
}

class TlsHandshakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto snapshot = std::make_shared<config::ConfigSnapshot>();
        snapshot->certificates.push_back(loaded_entry("wildcard", "*.example.com", 0));
        snapshot->certificates.push_back(loaded_entry("api", "api.example.com", 1));
        store.publish(snapshot);
    }

    config::SnapshotStore store;
    server::TlsResolver resolver{store};
};

TEST_F(TlsHandshakeTest, ServerNameSelectsCertificate) {
    auto listener = server::make_listener_context();
    resolver.attach(*listener, "https", "");

    auto wildcard = handshake(*listener, "foo.example.com");
    EXPECT_TRUE(wildcard.established);
    EXPECT_EQ(wildcard.peer_name, "*.example.com");

    auto exact = handshake(*listener, "api.example.com");
    EXPECT_TRUE(exact.established);
    EXPECT_EQ(exact.peer_name, "api.example.com");
}

TEST_F(TlsHandshakeTest, UnknownNameWithoutDefaultFailsOnlyThatHandshake) {
    auto listener = server::make_listener_context();
    resolver.attach(*listener, "https", "");

    auto rejected = handshake(*listener, "unknown.org");
    EXPECT_FALSE(rejected.established);
    EXPECT_EQ(rejected.alert, SSL_AD_UNRECOGNIZED_NAME);
    EXPECT_TRUE(rejected.peer_name.empty());

    auto next = handshake(*listener, "foo.example.com");
    EXPECT_TRUE(next.established);
    EXPECT_EQ(next.peer_name, "*.example.com");
}

TEST_F(TlsHandshakeTest, MissingServerNameUsesListenerDefault) {
    auto with_default = server::make_listener_context();
    resolver.attach(*with_default, "https", "api");
    auto served = handshake(*with_default, nullptr);
    EXPECT_TRUE(served.established);
    EXPECT_EQ(served.peer_name, "api.example.com");

    auto without_default = server::make_listener_context();
    resolver.attach(*without_default, "https-strict", "");
    auto rejected = handshake(*without_default, nullptr);
    EXPECT_FALSE(rejected.established);
    EXPECT_EQ(rejected.alert, SSL_AD_UNRECOGNIZED_NAME);
}
