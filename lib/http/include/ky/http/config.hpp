/*
Module Name:
- config.hpp

Abstract:
- Client configuration loaded from a TOML file (default ./ky.toml).
- Every key is optional; missing keys keep the built-in defaults.
- Fails fast with ConfigError on unreadable files, bad types, negative values
  or a poll_interval_ms below 1.

File shape:
  [client]
  retry = 2
  poll_interval_ms = 100
  max_redirects = 3
  user_agent = "ky/1.0"
  verbose = false
*/
#pragma once

// C++ Standard Library
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

// Project
#include <ky/http/executor_options.hpp>
#include <ky/net/beast_transport.hpp>

namespace ky::env
{

    class ConfigError final : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) noexcept;
    };

    class Config
    {
    public:
        static Config load_file(const std::filesystem::path& path);

        // Load ./ky.toml, or defaults when it does not exist.
        static Config load();

        // Parse TOML text; origin names the source in error messages.
        static Config parse(std::string_view toml_text, std::string_view origin = "<string>");

        // Retry budget applied to requests built by ky_fetch.
        [[nodiscard]] int retry() const noexcept
        {
            return retry_;
        }
        [[nodiscard]] const http::ExecutorOptions& executor_options() const noexcept
        {
            return executor_;
        }
        [[nodiscard]] const net::TransportOptions& transport_options() const noexcept
        {
            return transport_;
        }
        // Empty when built from defaults or text.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

    private:
        Config() = default;

        std::filesystem::path path_;
        int retry_{ 0 };
        http::ExecutorOptions executor_{};
        net::TransportOptions transport_{};
    };

} // namespace ky::env
