#include "capydeploy/hub/cli.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "capydeploy/hub/agent_client.hpp"
#include "capydeploy/hub/discovery_registry.hpp"
#include "capydeploy/hub/multicast_source.hpp"
#include "capydeploy/hub/network_scanner.hpp"
#include "capydeploy/hub/upload_state_store.hpp"
#include "capydeploy/hub/uploader.hpp"

namespace capydeploy::hub
{

    namespace
    {

        std::atomic<bool> g_interrupted{false};

        void on_interrupt(int /*signal*/)
        {
            g_interrupted = true;
        }

        void print_agent(const DiscoveredAgent &agent)
        {
            std::cout << std::left << std::setw(18) << agent.id << ' ' << std::setw(20) << agent.display_name << ' '
                      << std::setw(10) << agent.platform << ' ' << agent.host << ':' << agent.port;
            for (const auto &address : agent.addresses)
            {
                std::cout << ' ' << address;
            }
            std::cout << '\n';
        }

        const std::string &require_arg(const HubConfig &config, std::size_t index, const char *what)
        {
            if (config.args.size() <= index)
            {
                throw std::runtime_error(std::string("missing ") + what + "\n" + usage());
            }
            return config.args[index];
        }

        AgentClient open_client(const HubConfig &config)
        {
            const auto endpoint = parse_endpoint(require_arg(config, 0, "agent endpoint"));
            return AgentClient(endpoint.host, endpoint.port, ClientOptions{.request_timeout = config.request_timeout});
        }

        int discover(const HubConfig &config, Logger &logger)
        {
            MulticastAnnouncementSource source;
            DiscoveryRegistry registry(source, RegistryOptions{.stale_timeout = config.stale_timeout});
            const auto agents = registry.discover(config.timeout);
            logger.log("discover", agents.size(), " agent(s) answered");
            if (agents.empty())
            {
                std::cout << "No agents found\n";
            }
            for (const auto &agent : agents)
            {
                print_agent(agent);
            }
            return EXIT_SUCCESS;
        }

        int watch(const HubConfig &config, Logger &logger)
        {
            MulticastAnnouncementSource source;
            DiscoveryRegistry registry(source, RegistryOptions{.stale_timeout = config.stale_timeout});
            registry.start_continuous_discovery(config.interval, std::min(config.timeout, config.interval));
            std::cout << "Watching for agents, Ctrl+C to stop\n";
            while (!g_interrupted)
            {
                auto event = registry.events().pop_for(std::chrono::milliseconds{200});
                if (!event)
                {
                    continue;
                }
                logger.log("watch", to_string(event->kind), " ", event->agent.id);
                std::cout << std::left << std::setw(11) << to_string(event->kind) << ' ';
                print_agent(event->agent);
                std::cout.flush();
            }
            registry.stop_continuous_discovery();
            return EXIT_SUCCESS;
        }

        int scan(const HubConfig &config, Logger &logger)
        {
            auto base = config.subnet;
            if (!base)
            {
                const auto local = local_ipv4();
                if (!local)
                {
                    throw std::runtime_error("no IPv4 interface found; pass --subnet");
                }
                base = subnet_base(*local);
            }
            NetworkScanner scanner;
            const auto results = scanner.scan(*base, config.port, NetworkScanner::kDefaultProbeTimeout, []
                                              { return g_interrupted.load(); });
            logger.log("scan", *base, ".0/24: ", results.size(), " open");
            for (const auto &result : results)
            {
                std::cout << result.address << ':' << result.port;
                if (result.hostname)
                {
                    std::cout << " (" << *result.hostname << ')';
                }
                std::cout << '\n';
            }
            if (results.empty())
            {
                std::cout << "No agents listening on port " << config.port << '\n';
            }
            return EXIT_SUCCESS;
        }

        int info(const HubConfig &config)
        {
            auto client = open_client(config);
            const auto agent = client.get_info();
            std::cout << "id:       " << agent.id << '\n'
                      << "name:     " << agent.name << '\n'
                      << "platform: " << agent.platform << '\n'
                      << "version:  " << agent.version << '\n'
                      << "accepts:  " << (agent.accept_connections ? "yes" : "no") << '\n';
            return EXIT_SUCCESS;
        }

        int upload(const HubConfig &config, Logger &logger)
        {
            auto client = open_client(config);
            const std::filesystem::path source = require_arg(config, 1, "game directory");

            auto upload_config = config.upload;
            if (upload_config.game_name.empty())
            {
                upload_config.game_name = std::filesystem::absolute(source).lexically_normal().filename().string();
            }

            const auto agent = client.get_info();
            UploadStateStore ledger;
            Uploader uploader(client, agent.id, &ledger);

            UploadOptions options{
                .chunk_size = config.chunk_size,
                .create_shortcut = config.create_shortcut,
                .cancelled = []
                { return g_interrupted.load(); },
                .on_progress = [](std::uint64_t sent, std::uint64_t total)
                {
                    const auto percent = total == 0 ? 100.0 : 100.0 * static_cast<double>(sent) / static_cast<double>(total);
                    std::cout << "\r" << sent << " / " << total << " bytes (" << std::fixed << std::setprecision(1)
                              << percent << "%)" << std::flush;
                },
            };

            logger.log("upload", source.string(), " -> ", agent.name, " as ", upload_config.game_name);
            const auto outcome = uploader.upload(source, upload_config, options);
            std::cout << '\n';
            if (outcome.cancelled)
            {
                logger.log("upload", "cancelled ", outcome.upload_id);
                std::cout << "Upload " << outcome.upload_id << " cancelled\n";
                return EXIT_FAILURE;
            }
            logger.log("upload", "completed ", outcome.upload_id);
            std::cout << "Upload " << outcome.upload_id << " completed (" << outcome.total_size << " bytes";
            if (outcome.resumed_from > 0)
            {
                std::cout << ", resumed at " << outcome.resumed_from;
            }
            std::cout << ")\n";
            if (outcome.app_id)
            {
                std::cout << "Shortcut app id: " << *outcome.app_id << '\n';
            }
            return EXIT_SUCCESS;
        }

        int cancel(const HubConfig &config)
        {
            auto client = open_client(config);
            client.cancel_upload(require_arg(config, 1, "upload id"));
            std::cout << "Cancelled\n";
            return EXIT_SUCCESS;
        }

        int shortcuts(const HubConfig &config)
        {
            auto client = open_client(config);
            const auto user = static_cast<std::uint32_t>(std::stoul(require_arg(config, 1, "user id")));
            const auto entries = client.list_shortcuts(user);
            for (const auto &entry : entries)
            {
                std::cout << std::setw(10) << entry.app_id << ' ' << entry.name << ' ' << entry.exe << '\n';
            }
            if (entries.empty())
            {
                std::cout << "No shortcuts\n";
            }
            return EXIT_SUCCESS;
        }

        int delete_shortcut(const HubConfig &config)
        {
            auto client = open_client(config);
            protocol::DeleteShortcutRequest request{
                .user_id = static_cast<std::uint32_t>(std::stoul(require_arg(config, 1, "user id"))),
                .app_id = config.app_id,
                .name = config.app_id ? std::nullopt : config.shortcut_name,
            };
            client.delete_shortcut(request);
            std::cout << "Deleted\n";
            return EXIT_SUCCESS;
        }

        int steam(const HubConfig &config, bool restart)
        {
            auto client = open_client(config);
            const auto status = restart ? client.restart_steam() : client.get_steam_status();
            std::cout << "running: " << (status.running ? "yes" : "no") << '\n';
            if (status.path)
            {
                std::cout << "path:    " << *status.path << '\n';
            }
            if (restart)
            {
                std::cout << "Restart requested\n";
            }
            return EXIT_SUCCESS;
        }

    } // namespace

    int run_command(const HubConfig &config, Logger &logger)
    {
        g_interrupted = false;
        std::signal(SIGINT, on_interrupt);
        std::signal(SIGTERM, on_interrupt);

        const auto &command = config.command;
        if (command == "discover")
        {
            return discover(config, logger);
        }
        if (command == "watch")
        {
            return watch(config, logger);
        }
        if (command == "scan")
        {
            return scan(config, logger);
        }
        if (command == "info")
        {
            return info(config);
        }
        if (command == "upload")
        {
            return upload(config, logger);
        }
        if (command == "cancel")
        {
            return cancel(config);
        }
        if (command == "shortcuts")
        {
            return shortcuts(config);
        }
        if (command == "delete-shortcut")
        {
            return delete_shortcut(config);
        }
        if (command == "steam-status" || command == "restart-steam")
        {
            return steam(config, command == "restart-steam");
        }
        if (command == "--help" || command == "-h" || command == "help")
        {
            std::cout << usage();
            return EXIT_SUCCESS;
        }
        throw std::runtime_error("Unknown command: " + command + "\n" + usage());
    }

} // namespace capydeploy::hub
