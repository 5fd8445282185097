/*
Module Name:
- redirect_policy.hpp

Abstract:
- Redirect handling policy for the transports.
- Encodes the hop limit and mode: follow_none, safe_only, same_origin, follow_all.
- next_method applies HTTP semantics: 307/308 keep method; 303 becomes GET
  (HEAD stays HEAD); legacy 301/302 convert POST to GET.
*/
#pragma once

// C++ Standard Library
#include <cstddef>

// Project
#include <ky/net/method.hpp>
#include <ky/net/url.hpp>

namespace ky::net
{

    inline constexpr std::size_t k_default_max_redirects = 3;

    [[nodiscard]] inline constexpr bool is_redirect_status(int s) noexcept
    {
        return s == 301 || s == 302 || s == 303 || s == 307 || s == 308;
    }

    enum class RedirectMode
    {
        follow_none,
        safe_only,
        same_origin,
        follow_all
    };

    class RedirectPolicy
    {
    public:
        explicit RedirectPolicy(std::size_t max_hops = k_default_max_redirects,
                                RedirectMode mode = RedirectMode::follow_all) noexcept
            :
            max_hops_(max_hops), mode_(mode)
        {
        }

        [[nodiscard]] std::size_t max_hops() const noexcept
        {
            return max_hops_;
        }
        void set_max_hops(std::size_t n) noexcept
        {
            max_hops_ = n;
        }

        [[nodiscard]] RedirectMode mode() const noexcept
        {
            return mode_;
        }
        void set_mode(RedirectMode m) noexcept
        {
            mode_ = m;
        }

        [[nodiscard]] bool follows() const noexcept
        {
            return mode_ != RedirectMode::follow_none;
        }

        [[nodiscard]] static Method next_method(Method cur, int status) noexcept
        {
            if (status == 307 || status == 308)
            {
                return cur;
            }
            if (status == 303)
            {
                return cur == Method::head ? Method::head : Method::get;
            }
            if (cur == Method::post)
            {
                return Method::get;
            }
            return cur;
        }

        // Whether a hop from 'from' to 'to' is allowed once the method is rewritten.
        [[nodiscard]] bool allow_hop(const Url& from, const Url& to, Method resulting) const
        {
            switch (mode_)
            {
            case RedirectMode::follow_none:
                return false;
            case RedirectMode::safe_only:
                return resulting == Method::get || resulting == Method::head;
            case RedirectMode::same_origin:
                return from.scheme == to.scheme && from.host == to.host
                    && from.effective_port() == to.effective_port();
            case RedirectMode::follow_all:
                return true;
            }
            return false;
        }

    private:
        std::size_t max_hops_;
        RedirectMode mode_;
    };

} // namespace ky::net
