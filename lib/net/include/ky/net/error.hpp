/*
Module Name:
- error.hpp

Abstract:
- Defines ky::net transport error codes and a std::error_category so failures
  raised inside the transport travel in Response::error next to the asio,
  beast and ssl codes. Enables implicit conversion via is_error_code_enum.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

namespace ky::net
{

    enum class errc
    {
        invalid_url = 1,
        unsupported_scheme,
        too_many_redirects,
        redirect_without_location,
    };

    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "ky.net";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::invalid_url:
                return "invalid url";
            case errc::unsupported_scheme:
                return "unsupported url scheme";
            case errc::too_many_redirects:
                return "too many redirects";
            case errc::redirect_without_location:
                return "redirect response missing Location header";
            }
            return "unknown ky.net error";
        }
    };

    inline const std::error_category& error_category()
    {
        static error_category_impl cat;
        return cat;
    }

    inline std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), error_category() };
    }

} // namespace ky::net

namespace std
{
    template<>
    struct is_error_code_enum<ky::net::errc> : true_type
    {
    };
} // namespace std
