/*
Module Name:
- json.hpp

Abstract:
- JSON helpers shared by the builder and the JSON-returning executor variants.
- Encoding writes UTF-8 as-is and never escapes '/'.
- Decoding never throws: std::nullopt marks a body that is not JSON.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

// Glaze
#include <glaze/json.hpp>

// Project
#include <ky/net/message.hpp>

namespace ky::http
{

    inline constexpr glz::opts json_opts{
        .null_terminated = true,
        .error_on_unknown_keys = false,
    };

    using json = glz::json_t;

    class JsonError final : public std::runtime_error
    {
    public:
        explicit JsonError(const std::string& msg) :
            std::runtime_error{ msg }
        {
        }
    };

    template<class T>
    [[nodiscard]] std::string encode_json(const T& value)
    {
        std::string buffer;
        if (const glz::error_ctx ec = glz::write<json_opts>(value, buffer); ec)
        {
            throw JsonError("JSON encode failed (glaze error "
                            + std::to_string(static_cast<std::uint32_t>(ec.ec)) + ")");
        }
        return buffer;
    }

    [[nodiscard]] std::optional<json> decode_json(std::string_view body);

    // Response whose body went through decode_json.
    struct JsonResponse
    {
        int status{ 0 };
        std::optional<json> body;
        std::error_code error;
        std::string url;
    };

    [[nodiscard]] JsonResponse to_json_response(const net::Response& response);

} // namespace ky::http
