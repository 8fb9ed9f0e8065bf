#include "cloud/file_system.hpp"
#include "network/http_transport.hpp"
#include "network/tls_context.hpp"
#include "stream/metadata_probe.hpp"
#include "stream/retrying_connector.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
/// A server certificate for 127.0.0.1, self-signed with a fresh P-256 key
class SelfSignedContext {
    SSL_CTX* _ctx;

    public:
    SelfSignedContext() : _ctx(nullptr) {
        TLSContext::initOpenSSL();
        auto key = EVP_EC_gen("P-256");
        REQUIRE(key);
        auto certificate = X509_new();
        REQUIRE(certificate);
        X509_set_version(certificate, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(certificate), 1);
        X509_gmtime_adj(X509_getm_notBefore(certificate), 0);
        X509_gmtime_adj(X509_getm_notAfter(certificate), 3600);
        X509_set_pubkey(certificate, key);
        auto name = X509_get_subject_name(certificate);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("127.0.0.1"), -1, -1, 0);
        X509_set_issuer_name(certificate, name);
        REQUIRE(X509_sign(certificate, key, EVP_sha256()) > 0);

        _ctx = SSL_CTX_new(TLS_server_method());
        REQUIRE(_ctx);
        auto usable = SSL_CTX_use_certificate(_ctx, certificate) == 1 && SSL_CTX_use_PrivateKey(_ctx, key) == 1;
        X509_free(certificate);
        EVP_PKEY_free(key);
        REQUIRE(usable);
    }
    ~SelfSignedContext() { SSL_CTX_free(_ctx); }
    SelfSignedContext(const SelfSignedContext&) = delete;
    SelfSignedContext& operator=(const SelfSignedContext&) = delete;

    [[nodiscard]] SSL_CTX* get() const { return _ctx; }
};
//---------------------------------------------------------------------------
/// A single threaded HTTP/1.1 server on 127.0.0.1 that answers one request per connection, optionally over TLS
class LoopbackServer {
    public:
    using Handler = function<string(const HttpRequest&)>;

    private:
    int _fd;
    uint16_t _port;
    Handler _handler;
    SSL_CTX* _tls;
    atomic<bool> _stop;
    mutex _mutex;
    vector<HttpRequest> _requests;
    vector<bool> _resumed;
    thread _thread;

    void exchange(const function<int64_t(char*, size_t)>& receive, const function<int64_t(const char*, size_t)>& transmit) {
        string data;
        char buffer[4096];
        while (data.find("\r\n\r\n") == string::npos) {
            auto count = receive(buffer, sizeof(buffer));
            if (count <= 0)
                return;
            data.append(buffer, static_cast<size_t>(count));
        }
        auto request = HttpRequest::deserialize(data);
        {
            lock_guard<mutex> lock(_mutex);
            _requests.push_back(request);
        }
        auto response = _handler(request);
        size_t sent = 0;
        while (sent < response.size()) {
            auto count = transmit(response.data() + sent, response.size() - sent);
            if (count <= 0)
                return;
            sent += static_cast<size_t>(count);
        }
    }

    void serve(int client) {
        if (!_tls) {
            exchange([&](char* data, size_t length) { return static_cast<int64_t>(::recv(client, data, length, 0)); },
                     [&](const char* data, size_t length) { return static_cast<int64_t>(::send(client, data, length, MSG_NOSIGNAL)); });
            return;
        }
        auto ssl = SSL_new(_tls);
        if (!ssl)
            return;
        SSL_set_fd(ssl, client);
        if (SSL_accept(ssl) == 1) {
            {
                lock_guard<mutex> lock(_mutex);
                _resumed.push_back(SSL_session_reused(ssl) == 1);
            }
            exchange([&](char* data, size_t length) { return static_cast<int64_t>(SSL_read(ssl, data, static_cast<int>(length))); },
                     [&](const char* data, size_t length) { return static_cast<int64_t>(SSL_write(ssl, data, static_cast<int>(length))); });
            // A session is only resumable after a clean shutdown
            SSL_shutdown(ssl);
        }
        SSL_free(ssl);
    }

    void run() {
        while (!_stop) {
            auto client = ::accept(_fd, nullptr, nullptr);
            if (client < 0)
                return;
            try {
                serve(client);
            } catch (const utils::Error& e) {
                // Catch assertions are not thread-safe, the client side check fails instead
                cerr << "loopback server: " << e.what() << endl;
            }
            ::shutdown(client, SHUT_WR);
            ::close(client);
        }
    }

    public:
    explicit LoopbackServer(Handler handler, SSL_CTX* tls = nullptr) : _fd(-1), _port(0), _handler(move(handler)), _tls(tls), _stop(false) {
        _fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(_fd >= 0);
        int one = 1;
        ::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        REQUIRE(::bind(_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0);
        REQUIRE(::listen(_fd, 16) == 0);
        socklen_t length = sizeof(address);
        REQUIRE(::getsockname(_fd, reinterpret_cast<sockaddr*>(&address), &length) == 0);
        _port = ntohs(address.sin_port);
        _thread = thread([this] { run(); });
    }

    ~LoopbackServer() {
        _stop = true;
        // Wakes up the blocking accept
        ::shutdown(_fd, SHUT_RDWR);
        _thread.join();
        ::close(_fd);
    }

    [[nodiscard]] uint16_t port() const { return _port; }
    [[nodiscard]] string url(string_view path) const { return (_tls ? "https://127.0.0.1:" : "http://127.0.0.1:") + to_string(_port) + string(path); }
    [[nodiscard]] vector<HttpRequest> requests() {
        lock_guard<mutex> lock(_mutex);
        return _requests;
    }
    /// Per TLS handshake, was the session resumed
    [[nodiscard]] vector<bool> resumed() {
        lock_guard<mutex> lock(_mutex);
        return _resumed;
    }
};
//---------------------------------------------------------------------------
/// Serves content at /object with byte range support, a chunked copy at /chunked and redirects
static string objectHandler(const string& content, const HttpRequest& request)
{
    if (request.path == "/object") {
        if (request.method == HttpRequest::Method::HEAD)
            return "HTTP/1.1 200 OK\r\nContent-Length: " + to_string(content.size()) + "\r\nLast-Modified: Sun, 06 Nov 1994 08:49:37 GMT\r\n\r\n";
        auto range = request.headers.find("Range");
        if (range == request.headers.end())
            return "HTTP/1.1 200 OK\r\nContent-Length: " + to_string(content.size()) + "\r\n\r\n" + content;
        auto offset = *utils::parseUnsigned(string_view(range->second).substr(6, range->second.size() - 7));
        if (offset >= content.size())
            return "HTTP/1.1 416 Range Not Satisfiable\r\nContent-Range: bytes */" + to_string(content.size()) + "\r\nContent-Length: 0\r\n\r\n";
        return "HTTP/1.1 206 Partial Content\r\nContent-Range: bytes " + to_string(offset) + "-" + to_string(content.size() - 1) + "/" + to_string(content.size()) + "\r\nContent-Length: " + to_string(content.size() - offset) + "\r\n\r\n" + content.substr(offset);
    }
    if (request.path == "/chunked") {
        string body;
        for (size_t i = 0; i < content.size(); i += 1000) {
            auto piece = content.substr(i, 1000);
            char size[32];
            snprintf(size, sizeof(size), "%zx;piece=%zu", piece.size(), i / 1000);
            body += string(size) + "\r\n" + piece + "\r\n";
        }
        body += "0\r\n\r\n";
        return "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n" + body;
    }
    if (request.path == "/until-close")
        return "HTTP/1.0 200 OK\r\n\r\n" + content;
    if (request.path == "/moved")
        return "HTTP/1.1 302 Found\r\nLocation: /object\r\nContent-Length: 0\r\n\r\n";
    if (request.path == "/loop")
        return "HTTP/1.1 307 Temporary Redirect\r\nLocation: /loop\r\nContent-Length: 0\r\n\r\n";
    for (string_view scheme : {"http", "https"}) {
        // /to-<scheme>/<port> redirects to <scheme>://127.0.0.1:<port>/object
        auto prefix = "/to-" + string(scheme) + "/";
        if (request.path.starts_with(prefix))
            return "HTTP/1.1 302 Found\r\nLocation: " + string(scheme) + "://127.0.0.1:" + request.path.substr(prefix.size()) + "/object\r\nContent-Length: 0\r\n\r\n";
    }
    if (request.path == "/continue")
        return "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok";
    if (request.path == "/error")
        return "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\n\r\n";
    return "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n";
}
//---------------------------------------------------------------------------
static string readAll(Connection& connection)
{
    string result;
    uint8_t buffer[1500];
    while (auto count = connection.read(buffer, sizeof(buffer)))
        result.append(reinterpret_cast<const char*>(buffer), count);
    return result;
}
//---------------------------------------------------------------------------
static Config quietConfig()
{
    Config config;
    config.logRetries = false;
    return config;
}
//---------------------------------------------------------------------------
static string makeContent(size_t length)
{
    string result;
    for (size_t i = 0; i < length; i++)
        result.push_back(static_cast<char>('A' + (i * 13) % 26));
    return result;
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_get") {
    auto content = makeContent(100000);
    LoopbackServer server([&](const HttpRequest& request) { return objectHandler(content, request); });
    HttpTransport transport(quietConfig());

    SECTION("whole body") {
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/object")), HttpRequest::rangeRequest("/object", 0));
        REQUIRE(connection->getResponse().code == HttpResponse::Code::OK_200);
        REQUIRE(readAll(*connection) == content);

        auto requests = server.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].headers["Host"] == "127.0.0.1:" + to_string(server.port()));
        REQUIRE(requests[0].headers["Connection"] == "close");
        REQUIRE(requests[0].headers["User-Agent"] == "RangeBlob");
        REQUIRE(requests[0].headers.find("Range") == requests[0].headers.end());
    }
    SECTION("chunked body") {
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/chunked")), HttpRequest::rangeRequest("/chunked", 0));
        REQUIRE(readAll(*connection) == content);
    }
    SECTION("body until close") {
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/until-close")), HttpRequest::rangeRequest("/until-close", 0));
        REQUIRE(readAll(*connection) == content);
    }
    SECTION("interim response") {
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/continue")), HttpRequest::rangeRequest("/continue", 0));
        REQUIRE(connection->getResponse().status == 200);
        REQUIRE(readAll(*connection) == "ok");
    }
    SECTION("redirect") {
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/moved")), HttpRequest::rangeRequest("/moved", 0));
        REQUIRE(connection->getResponse().code == HttpResponse::Code::OK_200);
        REQUIRE(readAll(*connection) == content);
        REQUIRE(server.requests().size() == 2);
    }
    SECTION("redirect loop") {
        REQUIRE_THROWS_AS(transport.execute(cloud::RemoteObjectRef::parse(server.url("/loop")), HttpRequest::rangeRequest("/loop", 0)), utils::IOError);
        REQUIRE(server.requests().size() == Config::defaultMaxRedirects + 1);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_redirects_disabled") {
    LoopbackServer server([](const HttpRequest& request) { return objectHandler("irrelevant", request); });
    auto config = quietConfig();
    config.followRedirects = false;
    HttpTransport transport(config);
    auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/moved")), HttpRequest::rangeRequest("/moved", 0));
    REQUIRE(connection->getResponse().code == HttpResponse::Code::FOUND_302);
    auto location = connection->getResponse().getHeader("Location");
    REQUIRE(location);
    REQUIRE(*location == "/object");
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_small_chunks") {
    auto content = makeContent(10000);
    LoopbackServer server([&](const HttpRequest& request) { return objectHandler(content, request); });
    auto config = quietConfig();
    config.chunkSize = 0;
    HttpTransport transport(config);
    REQUIRE(transport.getConfig().chunkSize > 0);
    auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/object")), HttpRequest::rangeRequest("/object", 0));
    REQUIRE(connection->getResponse().code == HttpResponse::Code::OK_200);
    REQUIRE(readAll(*connection) == content);
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_redirect_scheme_change") {
    auto content = makeContent(1000);
    SelfSignedContext tls;
    LoopbackServer secure([&](const HttpRequest& request) { return objectHandler(content, request); }, tls.get());
    LoopbackServer plain([&](const HttpRequest& request) { return objectHandler(content, request); });
    auto config = quietConfig();
    config.verifyPeer = false;
    HttpTransport transport(config);

    SECTION("https to http") {
        auto path = "/to-http/" + to_string(plain.port());
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(secure.url(path)), HttpRequest::rangeRequest(path, 0));
        REQUIRE(connection->getResponse().code == HttpResponse::Code::FOUND_302);
        REQUIRE(secure.requests().size() == 1);
        REQUIRE(plain.requests().empty());
    }
    SECTION("http to https") {
        auto path = "/to-https/" + to_string(secure.port());
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(plain.url(path)), HttpRequest::rangeRequest(path, 0));
        REQUIRE(connection->getResponse().code == HttpResponse::Code::FOUND_302);
        REQUIRE(plain.requests().size() == 1);
        REQUIRE(secure.requests().empty());
    }
    SECTION("same scheme") {
        auto path = "/to-http/" + to_string(plain.port());
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(plain.url(path)), HttpRequest::rangeRequest(path, 0));
        REQUIRE(connection->getResponse().code == HttpResponse::Code::OK_200);
        REQUIRE(readAll(*connection) == content);
    }
    SECTION("stat and open") {
        auto path = "/to-http/" + to_string(plain.port());
        auto ref = cloud::RemoteObjectRef::parse(secure.url(path));
        stream::MetadataProbe probe(transport);
        REQUIRE_THROWS_AS(probe.stat(ref), utils::NotFoundError);
        stream::RetryingConnector connector(transport, config);
        REQUIRE_THROWS_AS(connector.open(ref, 0), utils::IOError);
        REQUIRE(plain.requests().empty());
    }
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_tls") {
    auto content = makeContent(30000);
    SelfSignedContext tls;
    LoopbackServer server([&](const HttpRequest& request) { return objectHandler(content, request); }, tls.get());
    auto config = quietConfig();
    config.verifyPeer = false;

    SECTION("ranged read") {
        HttpTransport transport(config);
        stream::RetryingConnector connector(transport, config);
        auto connection = connector.open(cloud::RemoteObjectRef::parse(server.url("/object")), 21000);
        REQUIRE(connection->getResponse().status == 206);
        REQUIRE(connection->getObjectLength() == 30000u);
        REQUIRE(readAll(*connection) == content.substr(21000));
        REQUIRE(server.requests().back().headers["Range"] == "bytes=21000-");
        REQUIRE(server.requests().back().headers["Host"] == "127.0.0.1:" + to_string(server.port()));
    }
    SECTION("body until close") {
        HttpTransport transport(config);
        auto connection = transport.execute(cloud::RemoteObjectRef::parse(server.url("/until-close")), HttpRequest::rangeRequest("/until-close", 0));
        REQUIRE(readAll(*connection) == content);
    }
    SECTION("seek resumes the session") {
        cloud::FileSystem fs(server.url("/"), config);
        REQUIRE(fs.getFileStatus("/object").length == content.size());
        auto stream = fs.open("/object");
        vector<uint8_t> buffer(500);
        for (uint64_t offset : {25000ull, 100ull}) {
            stream->seek(offset);
            string result;
            while (result.size() < buffer.size()) {
                auto count = stream->read(buffer.data(), buffer.size() - result.size());
                if (!count)
                    break;
                result.append(reinterpret_cast<const char*>(buffer.data()), count);
            }
            REQUIRE(result == content.substr(offset, buffer.size()));
        }
        stream->close();

        // The stat, the open and two seeks, only the first handshake is a full one
        auto resumed = server.resumed();
        REQUIRE(resumed.size() == 4);
        REQUIRE(!resumed[0]);
        REQUIRE(resumed[1]);
        REQUIRE(resumed[2]);
        REQUIRE(resumed[3]);
    }
    SECTION("untrusted certificate") {
        auto strict = quietConfig();
        HttpTransport transport(strict);
        REQUIRE_THROWS_AS(transport.execute(cloud::RemoteObjectRef::parse(server.url("/object")), HttpRequest::rangeRequest("/object", 0)), utils::IOError);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_connector") {
    auto content = makeContent(20000);
    LoopbackServer server([&](const HttpRequest& request) { return objectHandler(content, request); });
    HttpTransport transport(quietConfig());
    stream::RetryingConnector connector(transport, quietConfig());
    auto ref = cloud::RemoteObjectRef::parse(server.url("/object"));

    SECTION("ranged") {
        auto connection = connector.open(ref, 12345);
        REQUIRE(connection->getResponse().status == 206);
        REQUIRE(connection->getObjectLength() == 20000u);
        REQUIRE(readAll(*connection) == content.substr(12345));
        REQUIRE(server.requests().back().headers["Range"] == "bytes=12345-");
    }
    SECTION("past the end") {
        auto connection = connector.open(ref, 20000);
        REQUIRE(readAll(*connection).empty());
    }
    SECTION("missing") {
        REQUIRE_THROWS_AS(connector.open(cloud::RemoteObjectRef::parse(server.url("/absent")), 0), utils::NotFoundError);
        REQUIRE(server.requests().size() == 1);
    }
    SECTION("server error") {
        REQUIRE_THROWS_AS(connector.open(cloud::RemoteObjectRef::parse(server.url("/error")), 0), utils::IOError);
        REQUIRE(server.requests().size() == Config::defaultConnectAttempts);
    }
    SECTION("metadata") {
        stream::MetadataProbe probe(transport);
        auto metadata = probe.stat(ref);
        REQUIRE(metadata.length == 20000);
        REQUIRE(server.requests().back().method == HttpRequest::Method::HEAD);
        REQUIRE_THROWS_AS(probe.stat(cloud::RemoteObjectRef::parse(server.url("/absent"))), utils::NotFoundError);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_file_system") {
    auto content = makeContent(50000);
    LoopbackServer server([&](const HttpRequest& request) { return objectHandler(content, request); });
    cloud::FileSystem fs(server.url("/"), quietConfig());

    auto status = fs.getFileStatus("/object");
    REQUIRE(status.length == content.size());

    auto stream = fs.open("/object");
    vector<uint8_t> buffer(3000);
    for (uint64_t offset : {40000ull, 7ull, 49999ull}) {
        stream->seek(offset);
        string result;
        while (result.size() < 3000) {
            auto count = stream->read(buffer.data(), buffer.size() - result.size());
            if (!count)
                break;
            result.append(reinterpret_cast<const char*>(buffer.data()), count);
        }
        REQUIRE(result == content.substr(offset, 3000));
    }
    stream->close();
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_connection_refused") {
    uint16_t port;
    {
        // Reserve a port and release it again
        LoopbackServer server([](const HttpRequest& request) { return objectHandler("", request); });
        port = server.port();
    }
    HttpTransport transport(quietConfig());
    auto ref = cloud::RemoteObjectRef::parse("http://127.0.0.1:" + to_string(port) + "/object");
    REQUIRE_THROWS_AS(transport.execute(ref, HttpRequest::rangeRequest("/object", 0)), utils::IOError);
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network::test
