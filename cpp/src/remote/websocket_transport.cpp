/*******************************************************************************
 * @file websocket_transport.cpp
 * @brief Boost.Beast WebSocket transport.
 *
 * Connect phase: resolve -> TCP connect -> (TLS handshake with SNI) -> WebSocket
 * upgrade, driven on the caller's thread by `io_context::run_for()` with the connect
 * deadline. Once connected an I/O thread runs the context until `close()`.
 *
 * Ownership: every stream operation happens on the I/O thread. The inbound queue is
 * the only state shared with caller threads, guarded by its own mutex.
 ******************************************************************************/
#include "lgtv_service.hpp"
#include "remote/websocket_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <charconv>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace lgtv::remote
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace
{

constexpr auto kCloseGrace = std::chrono::milliseconds(1000);
constexpr const char *kUserAgentSuffix = " lgtv-remote";

template <bool Tls> struct StreamFor;

template <> struct StreamFor<false>
{
    using type = websocket::stream<beast::tcp_stream>;
    static type make(asio::io_context &ioc, ssl::context &) { return type(ioc); }
};

template <> struct StreamFor<true>
{
    using type = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    static type make(asio::io_context &ioc, ssl::context &ctx) { return type(ioc, ctx); }
};

ssl::context make_client_context()
{
    ssl::context ctx(ssl::context::tlsv12_client);
    // TVs present a self-signed certificate.
    ctx.set_verify_mode(ssl::verify_none);
    return ctx;
}

struct ParsedUrl
{
    bool encrypted{false};
    std::string host;
    uint16_t port{0};
    std::string path{"/"};
};

std::optional<ParsedUrl> parse_ws_url(std::string_view url)
{
    ParsedUrl out;
    if (url.starts_with("wss://"))
    {
        out.encrypted = true;
        url.remove_prefix(6);
    }
    else if (url.starts_with("ws://"))
    {
        url.remove_prefix(5);
    }
    else
    {
        return std::nullopt;
    }

    const auto slash = url.find('/');
    std::string_view authority = url.substr(0, slash);
    if (slash != std::string_view::npos)
    {
        out.path = std::string(url.substr(slash));
    }
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos)
    {
        const auto port_text = authority.substr(colon + 1);
        unsigned port = 0;
        const auto [ptr, ec] =
            std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 ||
            port > 65535)
        {
            return std::nullopt;
        }
        out.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty())
    {
        return std::nullopt;
    }
    out.host = std::string(authority);
    return out;
}

} // namespace

// ============================================================================
// Impl: the state shared by both stream flavours
// ============================================================================

class WebSocketTransport::Impl
{
  public:
    virtual ~Impl() = default;

    virtual RemoteStatus open(const ConnectOptions &options) = 0;
    virtual RemoteStatus send_for(std::string text, std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;

    RemoteResult<std::string> receive_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_inbound_mutex);
        m_inbound_cv.wait_for(lock, timeout,
                              [this] { return !m_inbound.empty() || m_inbound_closed; });
        if (!m_inbound.empty())
        {
            std::string text = std::move(m_inbound.front());
            m_inbound.pop_front();
            return RemoteResult<std::string>::ok(std::move(text));
        }
        if (m_inbound_closed)
        {
            return RemoteResult<std::string>::error(RemoteErrc::TransportClosed, 0,
                                                    "connection closed");
        }
        return RemoteResult<std::string>::error(RemoteErrc::Timeout);
    }

    bool is_open() const noexcept { return m_open.load(std::memory_order_acquire); }
    const std::string &peer() const noexcept { return m_peer; }

  protected:
    void push_inbound(std::string text)
    {
        {
            std::lock_guard<std::mutex> lock(m_inbound_mutex);
            if (m_inbound_closed)
            {
                return;
            }
            m_inbound.push_back(std::move(text));
        }
        m_inbound_cv.notify_one();
    }

    void close_inbound()
    {
        {
            std::lock_guard<std::mutex> lock(m_inbound_mutex);
            m_inbound_closed = true;
        }
        m_inbound_cv.notify_all();
    }

    asio::io_context m_ioc;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_work;
    std::thread m_io_thread;
    std::atomic<bool> m_open{false};
    std::string m_peer;

    // Guards m_shutting_down; send() posts to the context only while it is false.
    std::mutex m_state_mutex;
    bool m_shutting_down{false};

  private:
    std::mutex m_inbound_mutex;
    std::condition_variable m_inbound_cv;
    std::deque<std::string> m_inbound;
    bool m_inbound_closed{false};
};

// ============================================================================
// BasicImpl<Tls>
// ============================================================================

namespace
{

template <bool Tls> class BasicImpl final : public WebSocketTransport::Impl
{
  public:
    BasicImpl()
        : m_ssl_ctx(make_client_context()),
          m_ws(StreamFor<Tls>::make(m_ioc, m_ssl_ctx)),
          m_resolver(m_ioc),
          m_close_timer(m_ioc)
    {
    }

    ~BasicImpl() override { close(); }

    RemoteStatus open(const ConnectOptions &options) override
    {
        const uint16_t port = options.effective_port();
        m_peer = fmt::format("{}:{}", options.host, port);
        LOGGER_DEBUG("WebSocketTransport: connecting to {}{} (timeout {}ms)", Tls ? "wss://" : "ws://",
                     m_peer, options.timeout.count());

        std::optional<RemoteStatus> outcome;
        const auto finish = [&outcome](RemoteErrc err, const beast::error_code &ec)
        {
            if (!outcome)
            {
                outcome = RemoteStatus::error(err, ec.value(), ec.message());
            }
        };

        m_resolver.async_resolve(
            options.host, std::to_string(port),
            [&, port](const beast::error_code &ec, tcp::resolver::results_type results)
            {
                if (ec)
                {
                    finish(RemoteErrc::Unreachable, ec);
                    return;
                }
                auto &layer = beast::get_lowest_layer(m_ws);
                layer.expires_after(options.timeout);
                layer.async_connect(
                    results,
                    [&, port](const beast::error_code &ec2, const tcp::endpoint &)
                    {
                        if (ec2)
                        {
                            finish(ec2 == beast::error::timeout ? RemoteErrc::ConnectTimeout
                                                                : RemoteErrc::Unreachable,
                                   ec2);
                            return;
                        }
                        const auto upgrade = [&, port]()
                        {
                            beast::get_lowest_layer(m_ws).expires_never();
                            websocket::stream_base::timeout ws_timeout =
                                websocket::stream_base::timeout::suggested(beast::role_type::client);
                            ws_timeout.handshake_timeout = options.timeout;
                            ws_timeout.idle_timeout = websocket::stream_base::none();
                            m_ws.set_option(ws_timeout);
                            m_ws.set_option(websocket::stream_base::decorator(
                                [](websocket::request_type &req)
                                {
                                    req.set(http::field::user_agent,
                                            std::string(BOOST_BEAST_VERSION_STRING) +
                                                kUserAgentSuffix);
                                }));
                            m_ws.async_handshake(
                                fmt::format("{}:{}", options.host, port), options.path,
                                [&](const beast::error_code &ec3)
                                {
                                    if (ec3)
                                    {
                                        finish(ec3 == beast::error::timeout
                                                   ? RemoteErrc::ConnectTimeout
                                                   : RemoteErrc::Unreachable,
                                               ec3);
                                        return;
                                    }
                                    if (!outcome)
                                    {
                                        outcome = RemoteStatus::ok();
                                    }
                                });
                        };

                        if constexpr (Tls)
                        {
                            if (!SSL_set_tlsext_host_name(m_ws.next_layer().native_handle(),
                                                          options.host.c_str()))
                            {
                                finish(RemoteErrc::TlsFailure,
                                       beast::error_code(static_cast<int>(::ERR_get_error()),
                                                         asio::error::get_ssl_category()));
                                return;
                            }
                            m_ws.next_layer().async_handshake(
                                ssl::stream_base::client,
                                [&, upgrade](const beast::error_code &ec3)
                                {
                                    if (ec3)
                                    {
                                        finish(ec3 == beast::error::timeout
                                                   ? RemoteErrc::ConnectTimeout
                                                   : RemoteErrc::TlsFailure,
                                               ec3);
                                        return;
                                    }
                                    upgrade();
                                });
                        }
                        else
                        {
                            upgrade();
                        }
                    });
            });

        m_ioc.run_for(options.timeout);
        if (!outcome)
        {
            outcome = RemoteStatus::error(RemoteErrc::ConnectTimeout, 0,
                                          fmt::format("no connection to {} within {}ms", m_peer,
                                                      options.timeout.count()));
        }
        if (outcome->is_error())
        {
            // Abort whatever is still in flight and drain the handlers: they refer to this frame.
            m_resolver.cancel();
            beast::error_code ignored;
            beast::get_lowest_layer(m_ws).socket().close(ignored);
            m_ioc.restart();
            m_ioc.run();
            LOGGER_WARN("WebSocketTransport: connect to {} failed: {}", m_peer,
                        describe_error(*outcome));
            return std::move(*outcome);
        }

        m_ws.text(true);
        m_open.store(true, std::memory_order_release);
        m_ioc.restart();
        m_work.emplace(asio::make_work_guard(m_ioc));
        start_read();
        m_io_thread = std::thread([this] { m_ioc.run(); });
        LOGGER_INFO("WebSocketTransport: connected to {}{}", Tls ? "wss://" : "ws://", m_peer);
        return RemoteStatus::ok();
    }

    RemoteStatus send_for(std::string text, std::chrono::milliseconds timeout) override
    {
        auto done = std::make_shared<std::promise<RemoteStatus>>();
        auto future = done->get_future();
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            if (m_shutting_down || !is_open())
            {
                return RemoteStatus::error(RemoteErrc::TransportClosed, 0, "connection closed");
            }
            asio::post(m_ioc,
                       [this, text = std::move(text), done]() mutable
                       {
                           if (!is_open())
                           {
                               done->set_value(RemoteStatus::error(RemoteErrc::TransportClosed, 0,
                                                                   "connection closed"));
                               return;
                           }
                           m_write_queue.push_back(PendingWrite{std::move(text), std::move(done)});
                           if (!m_current_write)
                           {
                               write_next();
                           }
                       });
        }
        if (future.wait_for(timeout) == std::future_status::ready)
        {
            return future.get();
        }

        // The frame may be partly on the wire; the stream cannot carry another one.
        LOGGER_WARN("WebSocketTransport: write to {} not finished within {}ms; dropping the connection",
                    m_peer, timeout.count());
        m_open.store(false, std::memory_order_release);
        close_inbound();
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            if (!m_shutting_down)
            {
                asio::post(m_ioc, [this] { fail(beast::error::timeout); });
            }
        }
        return RemoteStatus::error(RemoteErrc::Timeout, 0,
                                   fmt::format("write to {} not finished within {}ms", m_peer,
                                               timeout.count()));
    }

    void close() override
    {
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            if (m_shutting_down)
            {
                return;
            }
            m_shutting_down = true;
        }
        close_inbound();
        if (!m_io_thread.joinable())
        {
            m_open.store(false, std::memory_order_release);
            return;
        }

        asio::post(m_ioc, [this] { begin_close(); });
        m_work.reset();
        if (m_io_thread.get_id() == std::this_thread::get_id())
        {
            m_io_thread.detach();
        }
        else
        {
            m_io_thread.join();
        }
        LOGGER_DEBUG("WebSocketTransport: {} closed", m_peer);
    }

  private:
    struct PendingWrite
    {
        std::string text;
        std::shared_ptr<std::promise<RemoteStatus>> done;
    };

    void start_read()
    {
        m_ws.async_read(m_read_buffer,
                        [this](const beast::error_code &ec, std::size_t)
                        {
                            if (ec)
                            {
                                fail(ec);
                                return;
                            }
                            push_inbound(beast::buffers_to_string(m_read_buffer.data()));
                            m_read_buffer.consume(m_read_buffer.size());
                            start_read();
                        });
    }

    void write_next()
    {
        if (m_write_queue.empty())
        {
            return;
        }
        m_current_write.emplace(std::move(m_write_queue.front()));
        m_write_queue.pop_front();
        m_ws.async_write(asio::buffer(m_current_write->text),
                         [this](const beast::error_code &ec, std::size_t)
                         {
                             auto done = std::move(m_current_write->done);
                             m_current_write.reset();
                             if (ec)
                             {
                                 done->set_value(RemoteStatus::error(RemoteErrc::TransportError,
                                                                     ec.value(), ec.message()));
                                 fail(ec);
                                 return;
                             }
                             done->set_value(RemoteStatus::ok());
                             write_next();
                         });
    }

    void fail_queued_writes(RemoteErrc err, const std::string &message)
    {
        for (auto &pending : m_write_queue)
        {
            pending.done->set_value(RemoteStatus::error(err, 0, message));
        }
        m_write_queue.clear();
    }

    /// Runs on the I/O thread after any read or write error.
    void fail(const beast::error_code &ec)
    {
        const bool was_open = m_open.exchange(false, std::memory_order_acq_rel);
        if (was_open && !m_closing)
        {
            if (ec == websocket::error::closed)
            {
                LOGGER_INFO("WebSocketTransport: {} closed the connection", m_peer);
            }
            else
            {
                LOGGER_WARN("WebSocketTransport: connection to {} lost: {}", m_peer, ec.message());
            }
        }
        close_inbound();
        fail_queued_writes(RemoteErrc::TransportClosed, "connection closed");
        m_close_timer.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(m_ws).socket().close(ignored);
    }

    /// Runs on the I/O thread; orderly close frame with a bounded wait.
    void begin_close()
    {
        m_closing = true;
        fail_queued_writes(RemoteErrc::TransportClosed, "connection closed");
        if (!m_open.exchange(false, std::memory_order_acq_rel))
        {
            beast::error_code ignored;
            beast::get_lowest_layer(m_ws).socket().close(ignored);
            return;
        }
        if (m_current_write)
        {
            // A close frame cannot be queued behind a pending write; drop the socket instead.
            beast::error_code ignored;
            beast::get_lowest_layer(m_ws).socket().close(ignored);
            return;
        }
        m_close_timer.expires_after(kCloseGrace);
        m_close_timer.async_wait(
            [this](const beast::error_code &ec)
            {
                if (!ec)
                {
                    beast::error_code ignored;
                    beast::get_lowest_layer(m_ws).socket().close(ignored);
                }
            });
        m_ws.async_close(websocket::close_code::normal,
                         [this](const beast::error_code &)
                         {
                             m_close_timer.cancel();
                             beast::error_code ignored;
                             beast::get_lowest_layer(m_ws).socket().close(ignored);
                         });
    }

    ssl::context m_ssl_ctx;
    typename StreamFor<Tls>::type m_ws;
    tcp::resolver m_resolver;
    asio::steady_timer m_close_timer;
    beast::flat_buffer m_read_buffer;
    std::deque<PendingWrite> m_write_queue;
    std::optional<PendingWrite> m_current_write;
    bool m_closing{false};
};

} // namespace

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(ConnectedTag, std::unique_ptr<Impl> impl)
    : pImpl(std::move(impl))
{
}

WebSocketTransport::~WebSocketTransport()
{
    if (pImpl)
    {
        pImpl->close();
    }
}

RemoteResult<TransportPtr> WebSocketTransport::connect(const ConnectOptions &options)
{
    std::unique_ptr<Impl> impl;
    if (options.encrypted)
    {
        impl = std::make_unique<BasicImpl<true>>();
    }
    else
    {
        impl = std::make_unique<BasicImpl<false>>();
    }
    auto status = impl->open(options);
    if (status.is_error())
    {
        return RemoteResult<TransportPtr>::propagate(status);
    }
    return RemoteResult<TransportPtr>::ok(
        std::make_shared<WebSocketTransport>(ConnectedTag{}, std::move(impl)));
}

RemoteResult<TransportPtr> WebSocketTransport::connect_url(std::string_view url,
                                                           std::chrono::milliseconds timeout)
{
    auto parsed = parse_ws_url(url);
    if (!parsed)
    {
        return RemoteResult<TransportPtr>::error(RemoteErrc::Unreachable, 0,
                                                 fmt::format("'{}' is not a ws:// or wss:// URL", url));
    }
    ConnectOptions options;
    options.host = std::move(parsed->host);
    options.port = parsed->port;
    options.encrypted = parsed->encrypted;
    options.timeout = timeout;
    options.path = std::move(parsed->path);
    return connect(options);
}

TransportFactory WebSocketTransport::factory()
{
    return [](const ConnectOptions &options) { return connect(options); };
}

RemoteStatus WebSocketTransport::send_for(std::string text, std::chrono::milliseconds timeout)
{
    return pImpl->send_for(std::move(text), timeout);
}

RemoteResult<std::string> WebSocketTransport::receive_for(std::chrono::milliseconds timeout)
{
    return pImpl->receive_for(timeout);
}

void WebSocketTransport::close()
{
    pImpl->close();
}

bool WebSocketTransport::is_open() const
{
    return pImpl->is_open();
}

std::string WebSocketTransport::peer() const
{
    return pImpl->peer();
}

} // namespace lgtv::remote
