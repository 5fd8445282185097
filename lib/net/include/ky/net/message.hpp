/*
Module Name:
- message.hpp

Abstract:
- Wire-level request and response values exchanged with a Transport.
- Response::status is 0 when no HTTP response was received; error then says why.
- Headers keep insertion order; set_header replaces an existing name (exact match).
*/
#pragma once

// C++ Standard Library
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// Project
#include <ky/net/method.hpp>

namespace ky::net
{

    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

    // Last write wins per header name.
    inline void set_header(Headers& headers, std::string_view name, std::string_view value)
    {
        auto it = std::find_if(headers.begin(), headers.end(), [name](const Header& h) {
            return h.first == name;
        });
        if (it != headers.end())
        {
            it->second.assign(value);
            return;
        }
        headers.emplace_back(std::string{ name }, std::string{ value });
    }

    [[nodiscard]] inline const std::string* find_header(const Headers& headers, std::string_view name) noexcept
    {
        for (const auto& h : headers)
        {
            if (h.first == name)
            {
                return &h.second;
            }
        }
        return nullptr;
    }

    struct Request
    {
        Method method{ Method::get };
        std::string url;
        Headers headers;
        std::optional<std::string> body;
    };

    struct Response
    {
        int status{ 0 };
        std::string body;
        std::error_code error; // transport-level failure, empty when a response arrived
        std::string url; // effective URL after redirects

        [[nodiscard]] bool transport_failed() const noexcept
        {
            return static_cast<bool>(error);
        }
    };

} // namespace ky::net
