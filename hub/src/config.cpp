#include "capydeploy/hub/config.hpp"

#include <stdexcept>
#include <string>

namespace capydeploy::hub
{

    namespace
    {
        std::chrono::milliseconds parse_seconds(const std::string &flag, const std::string &value)
        {
            const auto seconds = std::stod(value);
            if (seconds <= 0)
            {
                throw std::runtime_error(flag + " must be positive");
            }
            return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
        }

        std::size_t parse_chunk_size(const std::string &value)
        {
            const auto digits = value.find_first_not_of("0123456789") == std::string::npos;
            if (value.empty() || !digits || value.size() > 10)
            {
                throw std::runtime_error("--chunk-size expects a byte count");
            }
            const auto size = std::stoull(value);
            if (size == 0 || size > kMaxChunkSize)
            {
                throw std::runtime_error("--chunk-size must be between 1 and " + std::to_string(kMaxChunkSize));
            }
            return static_cast<std::size_t>(size);
        }
    } // namespace

    Endpoint parse_endpoint(const std::string &text)
    {
        Endpoint endpoint;
        const auto colon = text.rfind(':');
        if (colon == std::string::npos)
        {
            endpoint.host = text;
        }
        else
        {
            endpoint.host = text.substr(0, colon);
            endpoint.port = static_cast<std::uint16_t>(std::stoi(text.substr(colon + 1)));
        }
        if (endpoint.host.empty())
        {
            throw std::runtime_error("Expected endpoint format host[:port]");
        }
        return endpoint;
    }

    std::string usage()
    {
        return "Usage: capydeploy-hub <command> [args] [options]\n"
               "Commands:\n"
               "  discover                          one discovery window (--timeout <s>)\n"
               "  watch                             continuous discovery (--interval <s>, --stale-timeout <s>)\n"
               "  scan                              probe the local /24 (--subnet <a.b.c>, --port <n>)\n"
               "  info <host[:port]>\n"
               "  upload <host[:port]> <dir>        (--name <game>, --install-path <p>, --exe <rel>,\n"
               "                                     --launch-options <o>, --tag <t>, --shortcut, --chunk-size <bytes>)\n"
               "  cancel <host[:port]> <uploadId>\n"
               "  shortcuts <host[:port]> <userId>\n"
               "  delete-shortcut <host[:port]> <userId> (--app-id <n> | --name <name>)\n"
               "  steam-status <host[:port]>\n"
               "  restart-steam <host[:port]>\n"
               "Common options: --log <file>, --request-timeout <s>\n";
    }

    HubConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage());
        }

        HubConfig config;
        config.command = argv[1];
        int index = 2;
        auto next_value = [&](const std::string &flag) -> std::string
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        };

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg.rfind("--", 0) != 0)
            {
                config.args.push_back(arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(arg));
            }
            else if (arg == "--timeout")
            {
                config.timeout = parse_seconds(arg, next_value(arg));
            }
            else if (arg == "--interval")
            {
                config.interval = parse_seconds(arg, next_value(arg));
            }
            else if (arg == "--stale-timeout")
            {
                config.stale_timeout = parse_seconds(arg, next_value(arg));
            }
            else if (arg == "--request-timeout")
            {
                config.request_timeout = parse_seconds(arg, next_value(arg));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_chunk_size(next_value(arg));
            }
            else if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(next_value(arg)));
            }
            else if (arg == "--subnet")
            {
                config.subnet = next_value(arg);
            }
            else if (arg == "--name")
            {
                const auto value = next_value(arg);
                config.upload.game_name = value;
                config.shortcut_name = value;
            }
            else if (arg == "--install-path")
            {
                config.upload.install_path = next_value(arg);
            }
            else if (arg == "--exe")
            {
                config.upload.executable = next_value(arg);
            }
            else if (arg == "--launch-options")
            {
                config.upload.launch_options = next_value(arg);
            }
            else if (arg == "--tag")
            {
                config.upload.tags.push_back(next_value(arg));
            }
            else if (arg == "--shortcut")
            {
                config.create_shortcut = true;
            }
            else if (arg == "--app-id")
            {
                config.app_id = static_cast<std::uint32_t>(std::stoul(next_value(arg)));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.interval >= config.stale_timeout && config.command == "watch")
        {
            throw std::runtime_error("--stale-timeout must exceed --interval");
        }
        return config;
    }

} // namespace capydeploy::hub
