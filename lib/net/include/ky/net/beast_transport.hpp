/*
Module Name:
- beast_transport.hpp

Abstract:
- Transport over Boost.Beast HTTP/1.1 with OpenSSL for https.
- Owns a private io_context; every submitted call is a coroutine spawned on it,
  so one thread drives any number of concurrent calls. poll() runs the context
  for a bounded time (a non-positive wait blocks for one handler instead),
  execute() runs it until its own call completes.
- One connection per call, closed afterwards. Redirects follow RedirectPolicy.
- No I/O deadlines: a peer that never answers keeps its call in flight.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

// Boost.Beast
#include <boost/beast/http.hpp>

// Project
#include <ky/net/message.hpp>
#include <ky/net/redirect_policy.hpp>
#include <ky/net/transport.hpp>
#include <ky/net/url.hpp>

namespace ky::net
{

    inline constexpr int k_http_version = 11;
    inline constexpr std::string_view k_default_user_agent = "ky/1.0";

    struct TransportOptions
    {
        RedirectPolicy redirects{};
        std::string user_agent{ k_default_user_agent };
    };

    class BeastTransport final : public Transport
    {
    public:
        explicit BeastTransport(TransportOptions options = {});
        ~BeastTransport() override;

        [[nodiscard]] Response execute(const Request& request) override;
        void submit(Request request, Completion on_complete) override;
        [[nodiscard]] std::size_t in_flight() const noexcept override
        {
            return in_flight_;
        }
        void poll(std::chrono::milliseconds max_wait) override;

        [[nodiscard]] const TransportOptions& options() const noexcept
        {
            return options_;
        }

    private:
        using http_request = boost::beast::http::request<boost::beast::http::string_body>;
        using http_response = boost::beast::http::response<boost::beast::http::string_body>;

        boost::asio::awaitable<Response> perform(Request request);
        boost::asio::awaitable<http_response> round_trip(const Url& url,
                                                         Method method,
                                                         const Headers& headers,
                                                         const std::optional<std::string>& body);

        [[nodiscard]] http_request make_request(const Url& url,
                                                Method method,
                                                const Headers& headers,
                                                const std::optional<std::string>& body) const;

        TransportOptions options_;
        boost::asio::io_context io_;
        boost::asio::ssl::context ssl_ctx_;
        std::size_t in_flight_{ 0 };
    };

} // namespace ky::net
