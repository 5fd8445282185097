/*
Module Name:
- url.hpp

Abstract:
- Absolute URL parsing and Location resolution for the transports.
- Only http and https are accepted; anything else is errc::unsupported_scheme.
- Query is stored with a leading '?' so target() can concatenate cheaply.
- The fragment is dropped; it never goes on the wire.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

// Project
#include <ky/net/error.hpp>

namespace ky::net
{

    [[nodiscard]] inline std::string_view default_port_for_scheme(std::string_view scheme) noexcept
    {
        if (scheme == "https")
        {
            return "443";
        }
        if (scheme == "http")
        {
            return "80";
        }
        return {};
    }

    struct Url
    {
        std::string scheme;
        std::string host;
        std::string port; // empty when the URL relies on the scheme default
        std::string path;
        std::string query; // includes leading '?' when present

        [[nodiscard]] std::string effective_port() const
        {
            return port.empty() ? std::string{ default_port_for_scheme(scheme) } : port;
        }

        // Host header value: port only when it differs from the scheme default.
        [[nodiscard]] std::string host_header() const
        {
            // IPv6 literals keep their brackets.
            std::string out = host.find(':') == std::string::npos ? host : "[" + host + "]";
            if (!port.empty() && port != default_port_for_scheme(scheme))
            {
                out.push_back(':');
                out += port;
            }
            return out;
        }

        [[nodiscard]] std::string target() const
        {
            std::string out = path.empty() ? std::string{ "/" } : path;
            out += query;
            return out;
        }

        [[nodiscard]] std::string to_string() const
        {
            std::string out = scheme;
            out += "://";
            out += host_header();
            out += target();
            return out;
        }
    };

    namespace detail
    {
        inline void split_path_query(std::string_view s, Url& u)
        {
            if (const auto hash = s.find('#'); hash != std::string_view::npos)
            {
                s = s.substr(0, hash);
            }
            const auto q = s.find('?');
            if (q == std::string_view::npos)
            {
                u.path.assign(s);
                u.query.clear();
            }
            else
            {
                u.path.assign(s.substr(0, q));
                u.query.assign(s.substr(q));
            }
            if (u.path.empty() || u.path.front() != '/')
            {
                u.path.insert(u.path.begin(), '/');
            }
        }

        // Collapse "/./" and "/../" segments in an absolute path.
        inline void remove_dot_segments(std::string& path)
        {
            // A trailing "/." or "/.." names a directory.
            if (path.ends_with("/.") || path.ends_with("/.."))
            {
                path.push_back('/');
            }
            for (auto i = path.find("/./"); i != std::string::npos; i = path.find("/./"))
            {
                path.erase(i, 2);
            }
            for (auto i = path.find("/../"); i != std::string::npos; i = path.find("/../"))
            {
                if (i == 0)
                {
                    path.erase(0, 3);
                    continue;
                }
                const auto j = path.rfind('/', i - 1);
                path.erase(j, i + 3 - j);
            }
        }
    } // namespace detail

    // Parse an absolute http(s) URL. Throws std::system_error with errc::invalid_url
    // or errc::unsupported_scheme.
    [[nodiscard]] inline Url parse_url(std::string_view s)
    {
        Url u;

        const auto pos = s.find("://");
        if (pos == std::string_view::npos || pos == 0)
        {
            throw std::system_error(make_error_code(errc::invalid_url), std::string{ s });
        }
        u.scheme.assign(s.substr(0, pos));
        for (auto& c : u.scheme)
        {
            if (c >= 'A' && c <= 'Z')
            {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        if (default_port_for_scheme(u.scheme).empty())
        {
            throw std::system_error(make_error_code(errc::unsupported_scheme), u.scheme);
        }
        s.remove_prefix(pos + 3);

        const auto end_of_authority = s.find_first_of("/?#");
        std::string_view auth = s.substr(0, end_of_authority);
        s = end_of_authority == std::string_view::npos ? std::string_view{} : s.substr(end_of_authority);

        // Drop userinfo; credentials are passed as headers.
        if (const auto at = auth.rfind('@'); at != std::string_view::npos)
        {
            auth.remove_prefix(at + 1);
        }

        if (!auth.empty() && auth.front() == '[')
        {
            const auto close = auth.find(']');
            if (close == std::string_view::npos)
            {
                throw std::system_error(make_error_code(errc::invalid_url), std::string{ auth });
            }
            u.host.assign(auth.substr(1, close - 1));
            if (close + 1 < auth.size() && auth[close + 1] == ':')
            {
                u.port.assign(auth.substr(close + 2));
            }
        }
        else if (const auto colon = auth.rfind(':'); colon != std::string_view::npos)
        {
            u.host.assign(auth.substr(0, colon));
            u.port.assign(auth.substr(colon + 1));
        }
        else
        {
            u.host.assign(auth);
        }

        if (u.host.empty())
        {
            throw std::system_error(make_error_code(errc::invalid_url), "missing host");
        }

        detail::split_path_query(s, u);
        return u;
    }

    // Resolve a Location header value against the URL that produced it.
    [[nodiscard]] inline Url resolve_url(const Url& base, std::string_view location)
    {
        if (location.find("://") != std::string_view::npos)
        {
            return parse_url(location);
        }

        // scheme-relative: "//host/..."
        if (location.rfind("//", 0) == 0)
        {
            return parse_url(base.scheme + ":" + std::string{ location });
        }

        Url out = base;
        if (!location.empty() && location.front() == '/')
        {
            detail::split_path_query(location, out);
        }
        else if (!location.empty() && location.front() == '?')
        {
            detail::split_path_query(out.path + std::string{ location }, out);
        }
        else
        {
            std::string path = out.path;
            path.resize(path.rfind('/') + 1);
            path.append(location);
            detail::split_path_query(path, out);
        }
        detail::remove_dot_segments(out.path);
        return out;
    }

} // namespace ky::net
