/*
Module Name:
- request_spec.hpp

Abstract:
- RequestSpec: immutable description of one HTTP call handed to an executor.
- RequestBuilder: fluent construction of a RequestSpec.

Notes:
- The retry budget counts additional attempts; a spec is tried retry() + 1 times.
- query() replaces the whole query and percent-encodes keys and values
  (RFC 3986 unreserved set kept as-is).
- Copies of a spec share its hook objects.
*/
#pragma once

// C++ Standard Library
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Project
#include <ky/http/hooks.hpp>
#include <ky/http/json.hpp>
#include <ky/net/message.hpp>
#include <ky/net/method.hpp>

namespace ky::http
{

    using net::Headers;
    using net::Method;

    using QueryParam = std::pair<std::string, std::string>;

    class BatchQueue;

    class RequestSpec
    {
    public:
        [[nodiscard]] Method method() const noexcept
        {
            return method_;
        }
        [[nodiscard]] const std::string& url() const noexcept
        {
            return url_;
        }
        [[nodiscard]] const Headers& headers() const noexcept
        {
            return headers_;
        }
        // Encoded key=value pairs in insertion order.
        [[nodiscard]] const std::vector<QueryParam>& query() const noexcept
        {
            return query_;
        }
        [[nodiscard]] const std::optional<std::string>& body() const noexcept
        {
            return body_;
        }
        [[nodiscard]] unsigned retry() const noexcept
        {
            return retry_;
        }
        [[nodiscard]] std::size_t max_attempts() const noexcept
        {
            return static_cast<std::size_t>(retry_) + 1;
        }
        [[nodiscard]] const BeforeHookPtr& before_hook() const noexcept
        {
            return before_hook_;
        }
        [[nodiscard]] const AfterHookPtr& after_hook() const noexcept
        {
            return after_hook_;
        }

        // URL with the query string appended.
        [[nodiscard]] std::string target() const;

        // Wire request for a Transport.
        [[nodiscard]] net::Request to_request() const;

    private:
        friend class RequestBuilder;
        RequestSpec() = default;

        Method method_{ Method::get };
        std::string url_;
        Headers headers_;
        std::vector<QueryParam> query_;
        std::optional<std::string> body_;
        unsigned retry_{ 0 };
        BeforeHookPtr before_hook_;
        AfterHookPtr after_hook_;
    };

    // Percent-encode with the RFC 3986 unreserved set left untouched ("a b" -> "a%20b").
    [[nodiscard]] std::string url_encode(std::string_view s);

    class RequestBuilder
    {
    public:
        RequestBuilder() = default;

        RequestBuilder& get(std::string_view url)
        {
            return method(Method::get, url);
        }
        RequestBuilder& post(std::string_view url)
        {
            return method(Method::post, url);
        }
        RequestBuilder& put(std::string_view url)
        {
            return method(Method::put, url);
        }
        RequestBuilder& patch(std::string_view url)
        {
            return method(Method::patch, url);
        }
        RequestBuilder& del(std::string_view url)
        {
            return method(Method::delete_, url);
        }
        RequestBuilder& head(std::string_view url)
        {
            return method(Method::head, url);
        }
        RequestBuilder& method(Method m, std::string_view url);

        RequestBuilder& header(std::string_view name, std::string_view value);

        RequestBuilder& query(std::initializer_list<QueryParam> params);
        RequestBuilder& query(const std::vector<QueryParam>& params);

        // Raw body; content_type is set when non-empty.
        RequestBuilder& body(std::string data, std::string_view content_type = {});

        // Serialise value as the body and mark it application/json.
        template<class T>
        RequestBuilder& json(const T& value)
        {
            return body(encode_json(value), "application/json");
        }

        // Negative budgets clamp to zero.
        RequestBuilder& retry(int n) noexcept;

        RequestBuilder& before_request(BeforeHookPtr hook) noexcept;
        RequestBuilder& before_request(std::function<void(const RequestSpec&)> fn);
        RequestBuilder& after_response(AfterHookPtr hook) noexcept;
        RequestBuilder& after_response(std::function<void(const Response&)> fn);

        // Throws std::invalid_argument when no URL was set.
        [[nodiscard]] RequestSpec build() const;

        // build() and append the result to queue.
        RequestBuilder& add_to(BatchQueue& queue);

    private:
        RequestSpec spec_;
    };

} // namespace ky::http
