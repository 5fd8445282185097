/*
Module Name:
- method.hpp

Abstract:
- HTTP request methods supported by the builder and transports.
*/
#pragma once

// C++ Standard Library
#include <string_view>

namespace ky::net
{

    enum class Method
    {
        get,
        post,
        put,
        patch,
        delete_,
        head,
    };

    [[nodiscard]] constexpr std::string_view to_string(Method m) noexcept
    {
        switch (m)
        {
        case Method::get:
            return "GET";
        case Method::post:
            return "POST";
        case Method::put:
            return "PUT";
        case Method::patch:
            return "PATCH";
        case Method::delete_:
            return "DELETE";
        case Method::head:
            return "HEAD";
        }
        return "GET";
    }

} // namespace ky::net
