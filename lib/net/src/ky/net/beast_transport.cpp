// C++ Standard Library
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// Project
#include <ky/net/beast_transport.hpp>
#include <ky/net/error.hpp>

namespace ky::net {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;
using asio::use_awaitable;

namespace {

    [[nodiscard]] http::verb to_verb(Method m) noexcept
    {
        switch (m) {
        case Method::get:     return http::verb::get;
        case Method::post:    return http::verb::post;
        case Method::put:     return http::verb::put;
        case Method::patch:   return http::verb::patch;
        case Method::delete_: return http::verb::delete_;
        case Method::head:    return http::verb::head;
        }
        return http::verb::get;
    }

    // Write the request and read one complete response.
    template <class Stream, class HttpRequest, class HttpResponse>
    asio::awaitable<void> exchange(Stream& stream, HttpRequest& req, HttpResponse& res, bool head_only)
    {
        co_await http::async_write(stream, req, use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        parser.skip(head_only); // HEAD responses carry Content-Length but no body
        co_await http::async_read(stream, buffer, parser, use_awaitable);
        res = parser.release();
    }

} // namespace

BeastTransport::BeastTransport(TransportOptions options)
    : options_{std::move(options)}
    , io_{1}
    , ssl_ctx_{asio::ssl::context::tls_client}
{
    // Use the platform store; TLS tuning is left to the defaults.
    ssl_ctx_.set_default_verify_paths();
}

BeastTransport::~BeastTransport() = default;

void BeastTransport::submit(Request request, Completion on_complete)
{
    ++in_flight_;
    asio::co_spawn(io_, perform(std::move(request)),
        [this, on_complete = std::move(on_complete)](std::exception_ptr ep, Response res) {
            --in_flight_;
            if (ep) {
                std::rethrow_exception(ep);
            }
            on_complete(std::move(res));
        });
}

void BeastTransport::poll(std::chrono::milliseconds max_wait)
{
    if (in_flight_ == 0) {
        return;
    }
    if (io_.stopped()) {
        io_.restart();
    }
    // run_for with a non-positive wait returns without running handlers.
    if (max_wait <= std::chrono::milliseconds::zero()) {
        io_.run_one();
        return;
    }
    io_.run_for(max_wait);
}

Response BeastTransport::execute(const Request& request)
{
    // The call may outlive this frame if another completion throws out of run_one().
    auto out = std::make_shared<std::optional<Response>>();
    submit(request, [out](Response res) { *out = std::move(res); });

    while (!*out) {
        if (io_.stopped()) {
            io_.restart();
        }
        io_.run_one();
    }
    return std::move(**out);
}

auto BeastTransport::make_request(const Url& url,
                                  Method method,
                                  const Headers& headers,
                                  const std::optional<std::string>& body) const -> http_request
{
    http_request req{to_verb(method), url.target(), k_http_version};
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, options_.user_agent);
    req.keep_alive(false);

    // Caller headers override the defaults above.
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }

    if (body) {
        req.body() = *body;
        req.prepare_payload();
    }
    return req;
}

auto BeastTransport::round_trip(const Url& url,
                                Method method,
                                const Headers& headers,
                                const std::optional<std::string>& body) -> asio::awaitable<http_response>
{
    auto req = make_request(url, method, headers, body);
    const bool head_only = method == Method::head;

    auto executor = co_await asio::this_coro::executor;
    tcp::resolver resolver{executor};
    const auto endpoints = co_await resolver.async_resolve(url.host, url.effective_port(), use_awaitable);

    http_response res;
    boost::system::error_code ignored;

    if (url.scheme == "https") {
        beast::ssl_stream<beast::tcp_stream> stream{executor, ssl_ctx_};

        // SNI requires a NUL-terminated host
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw boost::system::system_error{
                boost::system::error_code{static_cast<int>(::ERR_get_error()),
                                          asio::error::get_ssl_category()},
                "SNI failure"};
        }

        co_await beast::get_lowest_layer(stream).async_connect(endpoints, use_awaitable);
        beast::get_lowest_layer(stream).socket().set_option(tcp::no_delay{true});
        co_await stream.async_handshake(asio::ssl::stream_base::client, use_awaitable);

        co_await exchange(stream, req, res, head_only);

        // The response is complete; a failed close does not change it.
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
        co_return res;
    }

    beast::tcp_stream stream{executor};
    co_await stream.async_connect(endpoints, use_awaitable);
    stream.socket().set_option(tcp::no_delay{true});

    co_await exchange(stream, req, res, head_only);

    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    co_return res;
}

auto BeastTransport::perform(Request request) -> asio::awaitable<Response>
{
    Response out;
    out.url = request.url;

    try {
        Url current = parse_url(request.url);
        Method method = request.method;
        std::optional<std::string> body = std::move(request.body);

        for (std::size_t hop = 0;; ++hop) {
            auto res = co_await round_trip(current, method, request.headers, body);
            const int status = res.result_int();

            if (is_redirect_status(status) && options_.redirects.follows()) {
                if (hop >= options_.redirects.max_hops()) {
                    throw std::system_error(make_error_code(errc::too_many_redirects), out.url);
                }
                const auto loc = res.find(http::field::location);
                if (loc == res.end()) {
                    throw std::system_error(make_error_code(errc::redirect_without_location), out.url);
                }

                Url next = resolve_url(current, std::string_view{loc->value().data(), loc->value().size()});
                const Method next_method = RedirectPolicy::next_method(method, status);

                // A hop the policy refuses ends the call with the redirect itself.
                if (options_.redirects.allow_hop(current, next, next_method)) {
                    if (next_method != method) {
                        body.reset();
                    }
                    method  = next_method;
                    current = std::move(next);
                    out.url = current.to_string();
                    continue;
                }
            }

            out.status = status;
            out.body   = std::move(res.body());
            break;
        }
    } catch (const boost::system::system_error& e) {
        out.status = 0;
        out.error  = e.code();
    } catch (const std::system_error& e) {
        out.status = 0;
        out.error  = e.code();
    }

    co_return out;
}

} // namespace ky::net
