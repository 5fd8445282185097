// C++ Standard Library
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <ky/http/config.hpp>

namespace ky::env
{

    namespace
    {
        // Integer in [min, max] at [client].key, or nullopt when absent.
        std::optional<std::int64_t> fetch_count(const toml::table& client,
                                                std::string_view key,
                                                std::string_view origin,
                                                std::int64_t min = 0,
                                                std::int64_t max = std::numeric_limits<int>::max())
        {
            const toml::node* node = client.get(key);
            if (!node)
                return std::nullopt;

            const auto v = node->is_integer() ? node->value<std::int64_t>() : std::nullopt;
            if (!v)
                throw ConfigError("client." + std::string{ key } + " must be an integer in " + std::string{ origin });
            if (*v < min || *v > max)
                throw ConfigError("client." + std::string{ key } + " out of range in " + std::string{ origin });
            return v;
        }

        void apply(const toml::table& root,
                   std::string_view origin,
                   int& retry,
                   http::ExecutorOptions& exec,
                   net::TransportOptions& transport)
        {
            const toml::node* client_node = root.get("client");
            if (!client_node)
                return;

            const auto* client = client_node->as_table();
            if (!client)
                throw ConfigError("[client] must be a table in " + std::string{ origin });

            if (auto v = fetch_count(*client, "retry", origin))
                retry = static_cast<int>(*v);
            if (auto v = fetch_count(*client, "poll_interval_ms", origin, 1))
                exec.poll_interval = std::chrono::milliseconds{ *v };
            if (auto v = fetch_count(*client, "max_redirects", origin))
                transport.redirects.set_max_hops(static_cast<std::size_t>(*v));

            if (const toml::node* ua = client->get("user_agent"))
            {
                auto s = ua->value<std::string>();
                if (!s || s->empty())
                    throw ConfigError("client.user_agent must be a non-empty string in " + std::string{ origin });
                transport.user_agent = std::move(*s);
            }

            if (const toml::node* verbose = client->get("verbose"))
            {
                const auto b = verbose->is_boolean() ? verbose->value<bool>() : std::nullopt;
                if (!b)
                    throw ConfigError("client.verbose must be a boolean in " + std::string{ origin });
                exec.verbose = *b;
            }
        }
    } // namespace

    ConfigError::ConfigError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

    Config Config::parse(std::string_view toml_text, std::string_view origin)
    {
        toml::table tbl;
        try
        {
            tbl = toml::parse(toml_text, origin);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + std::string{ origin } + "': " + std::string{ e.what() });
        }

        Config cfg;
        apply(tbl, origin, cfg.retry_, cfg.executor_, cfg.transport_);
        return cfg;
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.empty())
            throw ConfigError("Config file path must not be empty");

        const auto path_str = path.string();
        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ConfigError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        Config cfg;
        cfg.path_ = std::filesystem::absolute(path);
        apply(tbl, path_str, cfg.retry_, cfg.executor_, cfg.transport_);
        return cfg;
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "ky.toml";
        if (!std::filesystem::exists(default_path))
            return Config{};
        return load_file(default_path);
    }

} // namespace ky::env
