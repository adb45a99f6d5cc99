#include <algorithm>
#include <array>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include "capydeploy/agent/discovery_responder.hpp"
#include "capydeploy/agent/server.hpp"
#include "capydeploy/encoding/base64.hpp"
#include "capydeploy/framing.hpp"
#include "capydeploy/hub/agent_client.hpp"
#include "capydeploy/hub/config.hpp"
#include "capydeploy/hub/discovery_registry.hpp"
#include "capydeploy/hub/multicast_source.hpp"
#include "capydeploy/hub/network_scanner.hpp"
#include "capydeploy/hub/upload_state_store.hpp"
#include "capydeploy/hub/uploader.hpp"

using namespace capydeploy;
using namespace capydeploy::hub;
using namespace std::chrono_literals;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    void write_text(const std::filesystem::path &path, const std::string &text)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::string read_text(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    template <typename Fn>
    std::optional<ErrorCode> error_code_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ProtocolError &error)
        {
            return error.code();
        }
        return std::nullopt;
    }

    discovery::Announcement announcement(const std::string &id, const std::string &name, std::uint16_t port = 9999)
    {
        return {
            .instance_name = "instance-" + id,
            .host = id + ".local",
            .port = port,
            .addresses = {"10.0.0.5", "10.0.0.5", ""},
            .info_fields = {"id=" + id, "name=" + name, "platform=linux", "version=0.1.0"},
        };
    }

    class FakeSource : public AnnouncementSource
    {
    public:
        void query(std::chrono::milliseconds /*timeout*/, const AnnouncementHandler &on_announcement,
                   const CancelCheck &cancelled) override
        {
            ++queries;
            if (fail)
            {
                throw std::runtime_error("network unreachable");
            }
            for (const auto &reply : replies)
            {
                if (cancelled())
                {
                    return;
                }
                on_announcement(reply);
            }
        }

        std::vector<discovery::Announcement> replies;
        bool fail{false};
        std::atomic<int> queries{0};
    };

    void test_registry_lifecycle()
    {
        FakeSource source;
        DiscoveryRegistry registry(source, {.stale_timeout = 3s});
        const auto now = Clock::now();

        const auto added = registry.process_announcement(announcement("deck", "Living Room"), now - 5s);
        assert(added.id == "deck");
        assert(added.display_name == "Living Room");
        assert(added.addresses == std::vector<std::string>{"10.0.0.5"});
        auto event = registry.events().try_pop();
        assert(event && event->kind == AgentEventKind::Discovered);
        assert(to_string(event->kind) == "discovered");

        // A late, older announcement does not roll the entry back.
        (void)registry.process_announcement(announcement("deck", "Old Name"), now - 10s);
        assert(registry.get_agent("deck")->display_name == "Living Room");
        assert(!registry.events().try_pop());

        (void)registry.process_announcement(announcement("laptop", "Laptop", 9000), now);
        (void)registry.events().try_pop();

        const auto pruned = registry.prune_stale(now);
        assert(pruned.size() == 1);
        assert(pruned.front().id == "deck");
        event = registry.events().try_pop();
        assert(event && event->kind == AgentEventKind::Lost);
        assert(event->agent.id == "deck");
        assert(!registry.events().try_pop());
        assert(registry.prune_stale(now).empty());

        const auto agents = registry.get_agents();
        assert(agents.size() == 1);
        assert(agents.front().port == 9000);

        const auto updated = registry.process_announcement(announcement("laptop", "Laptop", 9001), now + 1s);
        assert(updated.port == 9001);
        assert(updated.discovered_at == now);
        event = registry.events().try_pop();
        assert(event && event->kind == AgentEventKind::Updated);

        assert(!registry.remove_agent("ghost"));
        assert(!registry.events().try_pop());
        assert(registry.remove_agent("laptop"));
        assert(registry.events().try_pop()->kind == AgentEventKind::Lost);
        assert(registry.get_agents().empty());
    }

    void test_registry_fallbacks_and_overflow()
    {
        FakeSource source;
        DiscoveryRegistry registry(source, {.stale_timeout = 30s, .event_capacity = 2});

        discovery::Announcement bare{.instance_name = "steamdeck", .host = "steamdeck.local", .port = 9999};
        const auto agent = registry.process_announcement(bare);
        assert(agent.id == "steamdeck");
        assert(agent.display_name == "steamdeck.local");

        (void)registry.process_announcement(announcement("a", "A"));
        (void)registry.process_announcement(announcement("b", "B"));
        assert(registry.events().size() == 2);
        assert(registry.events().dropped() == 1);
        assert(registry.get_agents().size() == 3);

        registry.clear();
        assert(registry.get_agents().empty());
        assert(registry.events().size() == 2);

        registry.set_stale_timeout(5s);
        assert(registry.stale_timeout() == 5s);
    }

    void test_registry_discover()
    {
        FakeSource source;
        source.replies = {announcement("deck", "Deck"), announcement("deck", "Deck"), announcement("pc", "PC")};
        DiscoveryRegistry registry(source);

        const auto seen = registry.discover(100ms);
        assert(seen.size() == 2);
        assert(registry.get_agents().size() == 2);

        // A failed window keeps what is already known.
        source.fail = true;
        assert(registry.discover(100ms).empty());
        assert(registry.get_agents().size() == 2);
        source.fail = false;

        assert(registry.start_continuous_discovery(20ms, 10ms));
        assert(!registry.start_continuous_discovery(20ms, 10ms));
        assert(registry.running());
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (source.queries.load() < 4 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(5ms);
        }
        registry.stop_continuous_discovery();
        assert(!registry.running());
        assert(source.queries.load() >= 4);
    }

    void test_registry_loop_prunes_silent_agents()
    {
        FakeSource source;
        DiscoveryRegistry registry(source, {.stale_timeout = 50ms});
        (void)registry.process_announcement(announcement("ghost", "Ghost"), Clock::now() - 10s);
        auto event = registry.events().try_pop();
        assert(event && event->kind == AgentEventKind::Discovered);

        // The source never answers, so the next cycle must age the agent out.
        assert(registry.start_continuous_discovery(20ms, 10ms));
        std::optional<AgentEvent> lost;
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!lost && std::chrono::steady_clock::now() < deadline)
        {
            lost = registry.events().pop_for(100ms);
        }
        registry.stop_continuous_discovery();

        assert(lost && lost->kind == AgentEventKind::Lost);
        assert(lost->agent.id == "ghost");
        assert(!registry.get_agent("ghost"));
        assert(!registry.events().try_pop());
    }

    void test_responder_answers_queries()
    {
        constexpr std::uint16_t kPort = 39998;
        asio::io_context io_context;
        agent::DiscoveryResponder responder(io_context, announcement("deck", "Deck", 4242), kPort);
        if (!responder.start())
        {
            std::cout << "Skipping discovery responder test: multicast unavailable\n";
            return;
        }
        std::thread loop([&]
                         { io_context.run(); });

        // Replies come back only because a query was sent.
        MulticastAnnouncementSource source("127.0.0.1", kPort);
        std::vector<discovery::Announcement> replies;
        source.query(
            500ms, [&](const discovery::Announcement &reply)
            { replies.push_back(reply); },
            [&]
            { return !replies.empty(); });

        responder.stop();
        io_context.stop();
        loop.join();

        assert(replies.size() == 1);
        assert(replies.front().port == 4242);
        assert(discovery::find_info_field(replies.front(), "id") == std::optional<std::string>("deck"));
        assert(std::find(replies.front().addresses.begin(), replies.front().addresses.end(), "127.0.0.1") !=
               replies.front().addresses.end());
    }

    void test_network_scanner()
    {
        std::atomic<int> probes{0};
        NetworkScanner scanner(
            4, [&](const std::string &address, std::uint16_t port, std::chrono::milliseconds)
            {
                ++probes;
                assert(port == 9999);
                std::this_thread::sleep_for(1ms);
                return address == "192.168.7.42" || address == "192.168.7.7"; },
            false);

        const auto results = scanner.scan("192.168.7", 9999);
        assert(probes.load() == 254);
        assert(results.size() == 2);
        assert(results[0].address == "192.168.7.7");
        assert(results[1].address == "192.168.7.42");
        assert(!results[0].hostname);
        assert(scanner.peak_concurrency() >= 1 && scanner.peak_concurrency() <= 4);

        probes = 0;
        assert(scanner.scan("192.168.7", 9999, 10ms, []
                            { return true; })
                   .empty());
        assert(probes.load() == 0);

        assert(subnet_base("192.168.1.23") == "192.168.1");
        assert(!subnet_base("not-an-ip"));
    }

    void test_upload_state_store()
    {
        const auto root = fresh_dir("capydeploy_hub_ledger");
        const auto state_path = root / "state" / "transfers.json";
        {
            UploadStateStore store(state_path);
            store.upsert({.agent_id = "deck", .local_path = root / "games" / ".." / "games" / "Celeste",
                          .destination = "Celeste", .upload_id = "u1", .total_size = 100});
            store.upsert({.agent_id = "pc", .local_path = root / "games" / "Hades", .destination = "Hades",
                          .upload_id = "u2", .total_size = 50});
            store.update_progress("deck", "u1", 40);
        }

        UploadStateStore reloaded(state_path);
        const auto entry = reloaded.find("deck", root / "games" / "Celeste", "Celeste");
        assert(entry);
        assert(entry->bytes_transferred == 40);
        assert(reloaded.pending_for_agent("deck").size() == 1);
        assert(!reloaded.find("pc", root / "games" / "Celeste", "Celeste"));

        reloaded.remove("deck", "u1");
        assert(UploadStateStore(state_path).pending_for_agent("deck").empty());
        assert(UploadStateStore(state_path).pending_for_agent("pc").size() == 1);

        write_text(state_path, "{ not json");
        assert(UploadStateStore(state_path).pending_for_agent("pc").empty());
        cleanup_path(root);
    }

    void test_plan_upload()
    {
        const auto root = fresh_dir("capydeploy_hub_plan");
        write_text(root / "b.bin", "bbbb");
        write_text(root / "a" / "z.txt", "zz");
        write_text(root / "empty", "");

        const auto plan = plan_upload(root);
        assert(plan.total_size == 6);
        assert(plan.files.size() == 3);
        assert(plan.files[0].relative_path == "a/z.txt");
        assert(plan.files[1].relative_path == "b.bin");
        assert(plan.files[2].relative_path == "empty");

        assert(error_code_of([&]
                             { (void)plan_upload(root / "b.bin"); }) == ErrorCode::InvalidRequest);
        cleanup_path(root);
    }

    HubConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "capydeploy-hub");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_configuration()
    {
        const auto endpoint = parse_endpoint("deck.local:9100");
        assert(endpoint.host == "deck.local");
        assert(endpoint.port == 9100);
        assert(parse_endpoint("10.0.0.5").port == protocol::kDefaultAgentPort);

        const auto config = parse({"upload", "deck:9999", "./build", "--name", "Celeste", "--exe", "run.sh", "--tag",
                                   "indie", "--shortcut", "--timeout", "1.5", "--chunk-size", "4096"});
        assert(config.command == "upload");
        assert(config.args.size() == 2);
        assert(config.upload.game_name == "Celeste");
        assert(config.upload.tags == std::vector<std::string>{"indie"});
        assert(config.create_shortcut);
        assert(config.timeout == 1500ms);
        assert(config.chunk_size == 4096);

        // Chunks must fit a frame once base64-encoded.
        for (const auto *size : {"0", "-1", "17000000", "4k"})
        {
            bool bad_chunk = false;
            try
            {
                (void)parse({"upload", "deck", "./build", "--chunk-size", size});
            }
            catch (const std::runtime_error &)
            {
                bad_chunk = true;
            }
            assert(bad_chunk);
        }
        assert(parse({"upload", "deck", "./build", "--chunk-size", "16777216"}).chunk_size == kMaxChunkSize);

        bool rejected = false;
        try
        {
            (void)parse({"watch", "--interval", "30", "--stale-timeout", "10"});
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        rejected = false;
        try
        {
            (void)parse({"discover", "--bogus"});
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    // One-shot agent double: the first connection answers with an oversized
    // frame header, later connections answer pings normally.
    void serve_oversized_then_pong(asio::ip::tcp::acceptor &acceptor, std::atomic<int> &connections)
    {
        const auto read_request = [](asio::ip::tcp::socket &socket)
        {
            std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
            asio::read(socket, asio::buffer(header));
            std::vector<std::uint8_t> body(protocol::decode_frame_length(header));
            asio::read(socket, asio::buffer(body));
            return nlohmann::json::parse(body.begin(), body.end()).get<protocol::Message>();
        };

        auto first = acceptor.accept();
        ++connections;
        (void)read_request(first);
        const std::array<std::uint8_t, 8> garbage{0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x02};
        asio::write(first, asio::buffer(garbage));

        auto second = acceptor.accept();
        ++connections;
        const auto ping = read_request(second);
        asio::write(second, asio::buffer(protocol::encode_frame(nlohmann::json(protocol::make_response(ping)))));
        std::error_code ec;
        first.close(ec);
    }

    void test_client_drops_connection_on_oversized_frame()
    {
        asio::io_context io_context;
        asio::ip::tcp::acceptor acceptor(io_context, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        const auto port = acceptor.local_endpoint().port();
        std::atomic<int> connections{0};
        std::thread agent([&]
                          { serve_oversized_then_pong(acceptor, connections); });

        AgentClient client("127.0.0.1", port, {.request_timeout = 5s});
        assert(error_code_of([&]
                             { client.ping(); }) == ErrorCode::InvalidRequest);
        assert(!client.connected());

        // The next request starts from a fresh connection instead of reading
        // the unread body as a header.
        client.ping();
        assert(connections.load() == 2);
        client.close();
        agent.join();
    }

    // Agent server on loopback driven through the Hub client and uploader.
    void test_loopback_deployment()
    {
        const auto root = fresh_dir("capydeploy_loopback");
        const auto steam_root = root / "steam";
        std::filesystem::create_directories(steam_root / "userdata" / "1234");

        agent::AgentConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = root / "games";
        config.steam_root = steam_root;
        config.worker_threads = 2;
        config.agent_id = "loopback-agent";
        config.agent_name = "Loopback";
        config.announce = false;
        std::filesystem::create_directories(config.root);

        agent::Server server(config);
        const auto port = server.local_port();
        std::thread runner([&server]
                           { server.run(); });

        {
            AgentClient client("127.0.0.1", port, {.request_timeout = 10s});
            client.connect();
            client.ping();
            const auto info = client.get_info();
            assert(info.id == "loopback-agent");
            assert(info.name == "Loopback");

            const auto source = root / "build";
            write_text(source / "a.bin", std::string(3000, 'a'));
            write_text(source / "bin" / "run.sh", "#!/bin/sh\n");
            write_text(source / "empty.txt", "");

            protocol::UploadConfig upload{.game_name = "Celeste", .install_path = "", .executable = "bin/run.sh"};

            // Interrupted earlier: the first file is already on the Agent.
            const auto plan = plan_upload(source);
            const auto started = client.init_upload({.config = upload, .total_size = plan.total_size,
                                                     .file_count = plan.files.size()});
            const std::string first(3000, 'a');
            (void)client.upload_chunk({.upload_id = started.upload_id, .offset = 0,
                                       .data_base64 = encoding::encode_base64(std::as_bytes(std::span(first.data(), first.size()))),
                                       .file_path = "a.bin"});

            UploadStateStore ledger(root / "ledger.json");
            Uploader uploader(client, info.id, &ledger);
            std::uint64_t last_reported = 0;
            const auto outcome = uploader.upload(source, upload,
                                                 {.chunk_size = 4, .create_shortcut = true,
                                                  .on_progress = [&](std::uint64_t sent, std::uint64_t)
                                                  { last_reported = sent; }});
            assert(outcome.upload_id == started.upload_id);
            assert(outcome.resumed_from == 3000);
            assert(outcome.app_id);
            assert(!outcome.cancelled);
            assert(last_reported == plan.total_size);
            assert(ledger.pending_for_agent(info.id).empty());
            assert(client.progress_events().try_pop());

            const auto installed = config.root / "Celeste";
            assert(read_text(installed / "a.bin") == first);
            assert(read_text(installed / "bin" / "run.sh") == "#!/bin/sh\n");
            assert(std::filesystem::exists(installed / "empty.txt"));

            const auto shortcuts = client.list_shortcuts(1234);
            assert(shortcuts.size() == 1);
            assert(shortcuts.front().app_id == *outcome.app_id);

            const auto status = client.get_steam_status();
            assert(status.success);
            assert(status.path == steam_root.string());

            client.delete_shortcut({.user_id = 1234, .app_id = *outcome.app_id});
            assert(client.list_shortcuts(1234).empty());
            assert(error_code_of([&]
                                 { client.delete_shortcut({.user_id = 1234, .app_id = *outcome.app_id}); }) ==
                   ErrorCode::ShortcutNotFound);
            assert(error_code_of([&]
                                 { client.cancel_upload("does-not-exist"); }) == ErrorCode::UploadNotFound);

            // The connection survives an error reply.
            client.ping();
            client.close();
            assert(!client.connected());
        }

        {
            AgentClient unreachable("127.0.0.1", 1, {.request_timeout = 500ms});
            const auto code = error_code_of([&]
                                            { unreachable.connect(); });
            assert(code == ErrorCode::AgentBusy || code == ErrorCode::Timeout);
        }

        server.stop();
        runner.join();
        cleanup_path(root);
    }

} // namespace

void run_hub_component_tests()
{
    test_registry_lifecycle();
    test_registry_fallbacks_and_overflow();
    test_registry_discover();
    test_registry_loop_prunes_silent_agents();
    test_responder_answers_queries();
    test_network_scanner();
    test_upload_state_store();
    test_plan_upload();
    test_configuration();
    test_client_drops_connection_on_oversized_frame();
    test_loopback_deployment();
    std::cout << "Hub component tests passed\n";
}
