/*
Module: main.cpp

Purpose:
- ky_fetch: fetch one or more URLs through the ky execution engine.

Notes:
- Options: --config FILE, --retry N, --json. Everything else is a URL.
- Config is read from --config or ./ky.toml (defaults when absent). Fails fast
  with ConfigError.
- One URL goes through SingleRequestExecutor and exits 1 once retries are
  exhausted. Several URLs run as one batch; exhausted requests are printed
  with their last status.
*/

// C++ Standard Library
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project
#include <ky/http/batch_executor.hpp>
#include <ky/http/batch_queue.hpp>
#include <ky/http/config.hpp>
#include <ky/http/error.hpp>
#include <ky/http/json.hpp>
#include <ky/http/request_spec.hpp>
#include <ky/http/single_request_executor.hpp>
#include <ky/net/beast_transport.hpp>

namespace
{

    struct Args
    {
        std::optional<std::string> config;
        std::optional<int> retry;
        bool json{ false };
        std::vector<std::string> urls;
    };

    void usage(std::string_view argv0)
    {
        std::cerr << "Usage: " << argv0 << " [--config FILE] [--retry N] [--json] URL...\n";
    }

    bool parse_args(int argc, char* argv[], Args& args)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view s{ argv[i] };
            if (s == "--json")
            {
                args.json = true;
            }
            else if (s == "--config" || s == "--retry")
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Missing value for " << s << '\n';
                    return false;
                }
                const std::string value{ argv[++i] };
                if (s == "--config")
                {
                    args.config = value;
                }
                else
                {
                    try
                    {
                        args.retry = std::stoi(value);
                    }
                    catch (const std::exception&)
                    {
                        std::cerr << "Invalid --retry value: " << value << '\n';
                        return false;
                    }
                }
            }
            else if (s.rfind("--", 0) == 0)
            {
                std::cerr << "Unknown argument: " << s << '\n';
                return false;
            }
            else
            {
                args.urls.emplace_back(s);
            }
        }
        return !args.urls.empty();
    }

    void print_response(std::optional<std::size_t> index, const ky::http::Response& res, bool as_json)
    {
        if (index)
        {
            std::cout << '[' << *index << "] ";
        }
        std::cout << res.status << ' ' << res.url;
        if (res.transport_failed())
        {
            std::cout << " error: " << res.error.message() << '\n';
            return;
        }
        if (!as_json)
        {
            std::cout << ' ' << res.body.size() << " bytes\n";
            return;
        }

        const auto body = ky::http::decode_json(res.body);
        std::cout << '\n';
        if (!body)
        {
            std::cout << "(not JSON)\n";
            return;
        }
        std::cout << ky::http::encode_json(*body) << '\n';
    }

} // namespace

int main(int argc, char* argv[])
{
    Args args;
    if (!parse_args(argc, argv, args))
    {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        // 1) Configuration: explicit file, ./ky.toml, or defaults.
        const auto cfg = args.config ? ky::env::Config::load_file(*args.config) : ky::env::Config::load();
        const int retry = args.retry.value_or(cfg.retry());

        // 2) One transport drives every request on this thread.
        ky::net::BeastTransport transport{ cfg.transport_options() };

        // 3) Single URL: retrying send, exhausted retries are fatal.
        if (args.urls.size() == 1)
        {
            ky::http::SingleRequestExecutor exec{ transport, cfg.executor_options() };
            const auto spec = ky::http::RequestBuilder{}.get(args.urls.front()).retry(retry).build();
            print_response(std::nullopt, exec.send(spec), args.json);
            return EXIT_SUCCESS;
        }

        // 4) Several URLs: one batch, results tagged with their position.
        ky::http::BatchQueue queue;
        for (const auto& url : args.urls)
        {
            ky::http::RequestBuilder{}.get(url).retry(retry).add_to(queue);
        }

        ky::http::BatchExecutor exec{ transport, cfg.executor_options() };
        for (const auto& r : exec.run_tagged(queue))
        {
            print_response(r.index, r.response, args.json);
        }
        if (cfg.executor_options().verbose)
        {
            std::cerr << "[ky_fetch] " << args.urls.size() << " requests in " << exec.rounds() << " rounds\n";
        }
    }
    catch (const ky::env::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const ky::http::RetriesExhausted& e)
    {
        std::cerr << "[ky_fetch] " << e.what() << " (last status " << e.last_response().status;
        if (e.last_response().transport_failed())
        {
            std::cerr << ", " << e.last_response().error.message();
        }
        std::cerr << ")\n";
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
