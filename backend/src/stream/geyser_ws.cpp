#include "geyser_ws.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/url.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <chrono>
#include <memory>

#include "stream/stream_errors.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace urls = boost::urls;
using tcp = boost::asio::ip::tcp;

using TlsWs   = websocket::stream<beast::ssl_stream<tcp::socket>>;
using PlainWs = websocket::stream<tcp::socket>;

struct GeyserWs::Impl
{
    std::string url;
    std::string x_token;
    std::string host;
    std::string port;
    std::string target = "/";
    bool tls = true;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::unique_ptr<TlsWs> tls_ws;
    std::unique_ptr<PlainWs> plain_ws;
    beast::flat_buffer buffer;
    std::atomic<bool> stop_flag{false};
    bool close_started = false;

    OnFrame on_frame;
    StreamResult result;

    Impl(std::string u, std::string token)
    : url(std::move(u)), x_token(std::move(token))
    {
        // Recommended client settings
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    bool connected() const { return tls_ws || plain_ws; }

    // Runs f on whichever stream flavour this endpoint uses.
    template <class F>
    void with_stream(F&& f)
    {
        if (tls_ws) f(*tls_ws);
        else if (plain_ws) f(*plain_ws);
    }

    void parse_url()
    {
        auto parsed = urls::parse_uri(url);
        if (!parsed) {
            throw ConnectError("invalid url '" + url + "': " + parsed.error().message());
        }
        urls::url_view u = *parsed;

        switch (u.scheme_id()) {
            case urls::scheme::wss:
            case urls::scheme::https:
                tls = true;
                break;
            case urls::scheme::ws:
            case urls::scheme::http:
                tls = false;
                break;
            default:
                throw ConnectError("unsupported scheme in url '" + url + "'");
        }

        host = u.host();
        if (host.empty()) throw ConnectError("missing host in url '" + url + "'");
        port = u.has_port() ? std::string(u.port()) : std::string(tls ? "443" : "80");

        target = std::string(u.encoded_path());
        if (target.empty()) target = "/";
        if (u.has_query()) target += "?" + std::string(u.encoded_query());
    }

    template <class Ws>
    void ws_handshake(Ws& ws)
    {
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = std::chrono::seconds(10); // also bounds the close handshake
        ws.set_option(timeouts);
        ws.set_option(websocket::stream_base::decorator([token = x_token](websocket::request_type& req) {
            req.set(http::field::user_agent, std::string("feed-race-connector/0.1"));
            if (!token.empty()) req.set("x-token", token);
        }));
        // Shredstream entry batches can be large
        ws.read_message_max(64 * 1024 * 1024);
        ws.handshake(host, target);
        ws.text(true);
    }

    void connect()
    {
        parse_url();
        try
        {
            tcp::resolver resolver{ioc};
            auto const results = resolver.resolve(host, port);

            if (tls) {
                tls_ws = std::make_unique<TlsWs>(ioc, ssl_ctx);

                // TCP connect
                net::connect(beast::get_lowest_layer(*tls_ws), results);

                // SNI (Server Name Indication) for TLS
                if (!SSL_set_tlsext_host_name(tls_ws->next_layer().native_handle(), host.c_str())) {
                    throw beast::system_error{
                        beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                        "SNI set failed"
                    };
                }

                // SSL handshake
                tls_ws->next_layer().handshake(net::ssl::stream_base::client);
                ws_handshake(*tls_ws);
            } else {
                plain_ws = std::make_unique<PlainWs>(ioc);
                net::connect(plain_ws->next_layer(), results);
                ws_handshake(*plain_ws);
            }
        }
        catch (const std::exception& e)
        {
            tls_ws.reset();
            plain_ws.reset();
            throw ConnectError(host + ":" + port + ": " + e.what());
        }
    }

    void subscribe(const std::string& request)
    {
        if (!connected()) throw SubscribeError("not connected");
        beast::error_code ec;
        with_stream([&](auto& ws) { ws.write(net::buffer(request), ec); });
        if (ec) throw SubscribeError("subscribe request failed: " + ec.message());
    }

    StreamResult run(OnFrame cb)
    {
        on_frame = std::move(cb);
        if (!connected()) return StreamResult{StreamEnd::Error, "not connected"};

        do_read();
        ioc.run(); // exceptions thrown by on_frame propagate to the caller
        return result;
    }

    void do_read()
    {
        if (stop_flag.load(std::memory_order_relaxed)) {
            finish(StreamEnd::Shutdown, "close requested");
            return;
        }
        buffer.consume(buffer.size());
        with_stream([this](auto& ws) {
            ws.async_read(buffer, [this](beast::error_code ec, std::size_t) { on_read(ec); });
        });
    }

    void on_read(beast::error_code ec)
    {
        if (stop_flag.load(std::memory_order_relaxed)) {
            finish(StreamEnd::Shutdown, "close requested");
            return;
        }
        if (ec) {
            // Orderly remote shutdown
            if (ec == websocket::error::closed || ec == net::error::eof) {
                finish(StreamEnd::Closed, ec.message());
            } else {
                finish(StreamEnd::Error, ec.message());
            }
            return;
        }

        std::string data = beast::buffers_to_string(buffer.cdata());
        buffer.consume(buffer.size());
        try {
            if (on_frame) on_frame(data);
        } catch (const StreamError& e) {
            finish(StreamEnd::Error, e.what());
            return;
        }
        do_read();
    }

    void finish(StreamEnd end, std::string reason)
    {
        result = StreamResult{end, std::move(reason)};
        if (end != StreamEnd::Closed) begin_close();
    }

    // Graceful close: WS close frame, then drop the socket.
    void begin_close()
    {
        if (close_started || !connected()) return;
        close_started = true;
        with_stream([](auto& ws) {
            if (!ws.is_open()) return;
            ws.async_close(websocket::close_code::normal, [&ws](beast::error_code) {
                beast::error_code ec;
                beast::get_lowest_layer(ws).shutdown(tcp::socket::shutdown_both, ec);
                beast::get_lowest_layer(ws).close(ec);
            });
        });
    }

    void send(const std::string& text)
    {
        if (!connected()) throw StreamError("send on a closed stream");
        beast::error_code ec;
        with_stream([&](auto& ws) { ws.write(net::buffer(text), ec); });
        if (ec) throw StreamError("send failed: " + ec.message());
    }

    void close() noexcept
    {
        stop_flag.store(true, std::memory_order_relaxed);
        // Post the close to the io_context the stream runs on for thread safety
        net::post(ioc, [this] { begin_close(); });
    }
};

GeyserWs::GeyserWs(std::string url, std::string x_token)
    : impl_(new Impl(std::move(url), std::move(x_token))) {}
GeyserWs::~GeyserWs() { delete impl_; }

// The outer class methods just forward to the implementation
void GeyserWs::connect() { impl_->connect(); }
void GeyserWs::subscribe(const std::string& request) { impl_->subscribe(request); }
StreamResult GeyserWs::run(OnFrame on_frame) { return impl_->run(std::move(on_frame)); }
void GeyserWs::send(const std::string& text) { impl_->send(text); }
void GeyserWs::close() noexcept { impl_->close(); }
