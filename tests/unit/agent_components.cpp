#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "capydeploy/agent/artwork_manager.hpp"
#include "capydeploy/agent/filesystem.hpp"
#include "capydeploy/agent/progress_throttle.hpp"
#include "capydeploy/agent/shortcut_manager.hpp"
#include "capydeploy/agent/shortcut_store.hpp"
#include "capydeploy/agent/steam_controller.hpp"
#include "capydeploy/agent/upload_manager.hpp"
#include "capydeploy/app_id.hpp"

using namespace capydeploy;
using namespace capydeploy::agent;

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

    std::vector<std::byte> pattern(std::size_t size, std::uint8_t seed)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>((seed + i) & 0xFF);
        }
        return data;
    }

    std::span<const std::byte> slice(const std::vector<std::byte> &data, std::size_t offset, std::size_t length)
    {
        return std::span<const std::byte>(data).subspan(offset, length);
    }

    std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> data(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            data[i] = static_cast<std::byte>(raw[i]);
        }
        return data;
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

    protocol::UploadConfig game_config(const std::string &name)
    {
        return {.game_name = name, .install_path = "", .executable = "run.sh"};
    }

    // Steam install laid out under a temp home with a single user.
    struct SteamFixture
    {
        explicit SteamFixture(const std::string &name)
            : home(fresh_dir(name)),
              steam(SteamLocation{.home = home, .steam_root = std::nullopt},
                    [this](const std::vector<std::string> &argv)
                    { commands.push_back(argv); })
        {
            std::filesystem::create_directories(home / ".local" / "share" / "Steam" / "userdata" / "1234");
            std::filesystem::create_directories(home / ".local" / "share" / "Steam" / "userdata" / "0");
        }

        ~SteamFixture() { cleanup_path(home); }

        std::filesystem::path home;
        std::vector<std::vector<std::string>> commands;
        LocalSteamController steam;
    };

    void test_file_coverage()
    {
        FileCoverage coverage;
        coverage.insert(500, 1000);
        assert(coverage.contiguous() == 0);
        assert(coverage.covered() == 500);
        assert(coverage.uncovered(400, 600) == 100);
        coverage.insert(0, 500);
        assert(coverage.contiguous() == 1000);
        assert(coverage.ranges().size() == 1);
        coverage.insert(200, 300);
        assert(coverage.covered() == 1000);
        assert(coverage.uncovered(0, 1000) == 0);
    }

    void test_path_resolution()
    {
        const std::filesystem::path base = "/srv/games/Celeste.partial";
        assert(fs::resolve_within(base, "bin/./celeste") == base / "bin" / "celeste");
        assert(error_code_of([&]
                             { (void)fs::resolve_within(base, "../escape"); }) == ErrorCode::InvalidRequest);
        assert(error_code_of([&]
                             { (void)fs::resolve_within(base, "/etc/passwd"); }) == ErrorCode::InvalidRequest);
        assert(error_code_of([]
                             { fs::require_plain_name("a/b", "game name"); }) == ErrorCode::InvalidRequest);
    }

    void test_in_order_upload()
    {
        const auto root = fresh_dir("capydeploy_upload_in_order");
        UploadManager uploads({.storage_root = root});
        const auto data = pattern(1000, 1);

        const auto init = uploads.init_upload(game_config("Celeste"), 1000, 1);
        assert(init.resume_from == 0);
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Active);

        auto chunk = uploads.upload_chunk(init.upload_id, "game.bin", slice(data, 0, 500), 0);
        assert(chunk.bytes_accepted == 500);
        assert(chunk.total_written == 500);
        chunk = uploads.upload_chunk(init.upload_id, "game.bin", slice(data, 500, 500), 500);
        assert(chunk.total_written == 1000);

        const auto result = uploads.complete_upload(init.upload_id, false);
        assert(!result.app_id);
        assert(read_file(root / "Celeste" / "game.bin") == data);
        assert(!std::filesystem::exists(root / "Celeste.partial"));
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Completed);

        // Completion is idempotent and cancel on a finished upload changes nothing.
        (void)uploads.complete_upload(init.upload_id, false);
        uploads.cancel_upload(init.upload_id);
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Completed);
        assert(std::filesystem::exists(root / "Celeste" / "game.bin"));

        cleanup_path(root);
    }

    void test_out_of_order_and_duplicates()
    {
        const auto root = fresh_dir("capydeploy_upload_out_of_order");
        UploadManager uploads({.storage_root = root});
        const auto data = pattern(1000, 7);

        const auto init = uploads.init_upload(game_config("Hades"), 1000, 1);
        auto chunk = uploads.upload_chunk(init.upload_id, "game.bin", slice(data, 500, 500), 500);
        assert(chunk.total_written == 0);

        // Completing early fails and leaves the session writable.
        assert(error_code_of([&]
                             { (void)uploads.complete_upload(init.upload_id, false); }) == ErrorCode::UploadFailed);
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Active);

        chunk = uploads.upload_chunk(init.upload_id, "game.bin", slice(data, 500, 500), 500);
        assert(chunk.bytes_accepted == 500);
        assert(chunk.total_written == 0);

        chunk = uploads.upload_chunk(init.upload_id, "game.bin", slice(data, 0, 500), 0);
        assert(chunk.total_written == 1000);

        // Anything past the declared size is refused.
        assert(error_code_of([&]
                             { (void)uploads.upload_chunk(init.upload_id, "extra.bin", slice(data, 0, 10), 0); }) ==
               ErrorCode::InvalidRequest);

        (void)uploads.complete_upload(init.upload_id, false);
        assert(read_file(root / "Hades" / "game.bin") == data);

        assert(error_code_of([&]
                             { (void)uploads.get_upload_progress("missing"); }) == ErrorCode::UploadNotFound);
        assert(error_code_of([&]
                             { uploads.cancel_upload("missing"); }) == ErrorCode::UploadNotFound);
        assert(error_code_of([&]
                             { (void)uploads.upload_chunk(init.upload_id, "game.bin", slice(data, 0, 1), 0); }) ==
               ErrorCode::UploadFailed);

        cleanup_path(root);
    }

    void test_cancel_and_traversal()
    {
        const auto root = fresh_dir("capydeploy_upload_cancel");
        UploadManager uploads({.storage_root = root});
        const auto data = pattern(100, 3);

        const auto init = uploads.init_upload(game_config("Doom"), 100, 1);
        assert(error_code_of([&]
                             { (void)uploads.upload_chunk(init.upload_id, "../../evil", slice(data, 0, 10), 0); }) ==
               ErrorCode::InvalidRequest);
        (void)uploads.upload_chunk(init.upload_id, "doom.wad", slice(data, 0, 50), 0);

        uploads.cancel_upload(init.upload_id);
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Cancelled);
        assert(!std::filesystem::exists(root / "Doom.partial"));
        assert(!std::filesystem::exists(root / "Doom"));
        assert(error_code_of([&]
                             { (void)uploads.upload_chunk(init.upload_id, "doom.wad", slice(data, 50, 50), 50); }) ==
               ErrorCode::UploadFailed);

        assert(error_code_of([&]
                             { (void)uploads.init_upload(game_config("../Doom"), 100, 1); }) == ErrorCode::InvalidRequest);

        cleanup_path(root);
    }

    void test_resume_after_restart()
    {
        const auto root = fresh_dir("capydeploy_upload_resume");
        const auto data = pattern(1000, 11);
        std::string upload_id;
        {
            UploadManager uploads({.storage_root = root});
            const auto init = uploads.init_upload(game_config("Portal"), 1000, 2);
            upload_id = init.upload_id;
            (void)uploads.upload_chunk(upload_id, "a.bin", slice(data, 0, 400), 0);
            (void)uploads.upload_chunk(upload_id, "b.bin", slice(data, 400, 200), 0);

            // Same logical upload reattaches instead of starting over.
            const auto again = uploads.init_upload(game_config("Portal"), 1000, 2);
            assert(again.upload_id == upload_id);
            assert(again.resume_from == 600);
        }

        UploadManager restarted({.storage_root = root});
        const auto progress = restarted.get_upload_progress(upload_id);
        assert(progress.bytes_written == 600);
        assert(progress.state == protocol::UploadState::Active);

        const auto init = restarted.init_upload(game_config("Portal"), 1000, 2);
        assert(init.upload_id == upload_id);
        assert(init.resume_from == 600);

        (void)restarted.upload_chunk(upload_id, "b.bin", slice(data, 600, 400), 200);
        (void)restarted.complete_upload(upload_id, false);
        assert(std::filesystem::file_size(root / "Portal" / "a.bin") == 400);
        assert(std::filesystem::file_size(root / "Portal" / "b.bin") == 600);

        // A differently sized upload into the same place supersedes the old one.
        const auto first = restarted.init_upload(game_config("Portal 2"), 10, 1);
        const auto second = restarted.init_upload(game_config("Portal 2"), 20, 1);
        assert(first.upload_id != second.upload_id);
        assert(restarted.get_upload_progress(first.upload_id).state == protocol::UploadState::Cancelled);

        cleanup_path(root);
    }

    void test_expiry()
    {
        const auto root = fresh_dir("capydeploy_upload_expiry");
        UploadManager uploads({.storage_root = root});
        const auto init = uploads.init_upload(game_config("Braid"), 10, 1);
        uploads.cleanup_expired(std::chrono::hours{1});
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Active);

        uploads.cleanup_expired(std::chrono::seconds{-1});
        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Failed);
        assert(!std::filesystem::exists(root / "Braid.partial"));

        uploads.cleanup_expired(std::chrono::seconds{-1});
        assert(error_code_of([&]
                             { (void)uploads.get_upload_progress(init.upload_id); }) == ErrorCode::UploadNotFound);
        cleanup_path(root);
    }

    void test_steam_controller()
    {
        SteamFixture fixture("capydeploy_steam_controller");
        auto &steam = fixture.steam;
        assert(steam.get_steam_path() == fixture.home / ".local" / "share" / "Steam");
        assert(steam.list_users() == std::vector<std::uint32_t>{1234});

        assert(!steam.get_steam_status());
        assert(error_code_of([&]
                             { steam.restart_steam(); }) == ErrorCode::SteamNotRunning);

        std::filesystem::create_directories(fixture.home / ".steam");
        std::ofstream(fixture.home / ".steam" / "steam.pid") << ::getpid() << '\n';
        assert(steam.get_steam_status());
        steam.restart_steam();
        assert(fixture.commands.size() == 1);
        assert(fixture.commands.front().front() == "steam");

        const LocalSteamController missing(SteamLocation{.home = fixture.home, .steam_root = fixture.home / "nowhere"});
        assert(error_code_of([&]
                             { (void)missing.get_steam_path(); }) == ErrorCode::SteamNotFound);
    }

    void test_shortcut_manager()
    {
        SteamFixture fixture("capydeploy_shortcuts");
        JsonShortcutStore store(fixture.steam);
        FileArtworkManager artwork(fixture.steam);
        SteamShortcutManager shortcuts(store, &artwork);

        const auto cover = fixture.home / "cover.png";
        std::ofstream(cover) << "png";

        protocol::ShortcutConfig config{.name = "Celeste", .exe = "/games/Celeste/celeste.sh", .start_dir = "/games/Celeste"};
        config.artwork = protocol::ArtworkConfig{.grid_portrait = cover.string()};
        const auto app_id = shortcuts.create_shortcut(1234, config);
        assert(app_id == app_id_for(config));
        assert((app_id & 0x80000000u) != 0);

        // Repeating the create is an upsert, not a duplicate.
        assert(shortcuts.create_shortcut(1234, config) == app_id);
        auto listed = shortcuts.list_shortcuts(1234);
        assert(listed.size() == 1);
        assert(listed.front().exe == "\"/games/Celeste/celeste.sh\"");
        assert(listed.front().start_dir == "\"/games/Celeste\"");
        assert(std::filesystem::exists(store.path_for(1234)));
        assert(!artwork.get_artwork(1234, app_id).grid_portrait.empty());

        // Moving the executable changes the AppId and drops the old artwork.
        auto moved = config;
        moved.exe = "/games/Celeste/bin/celeste";
        moved.artwork.reset();
        const auto moved_id = shortcuts.update_shortcut(1234, app_id, moved);
        assert(moved_id != app_id);
        assert(shortcuts.list_shortcuts(1234).size() == 1);
        assert(artwork.get_artwork(1234, app_id).grid_portrait.empty());

        assert(error_code_of([&]
                             { (void)shortcuts.update_shortcut(1234, app_id, moved); }) == ErrorCode::ShortcutNotFound);
        assert(error_code_of([&]
                             { shortcuts.delete_shortcut(1234, std::nullopt, std::nullopt); }) == ErrorCode::InvalidRequest);
        assert(error_code_of([&]
                             { shortcuts.delete_shortcut(1234, 42u, std::nullopt); }) == ErrorCode::ShortcutNotFound);
        assert(error_code_of([&]
                             { (void)shortcuts.create_shortcut(1234, {.name = "", .exe = "/x"}); }) ==
               ErrorCode::InvalidRequest);

        shortcuts.delete_shortcut(1234, std::nullopt, std::string("Celeste"));
        assert(shortcuts.list_shortcuts(1234).empty());
        assert(shortcuts.list_shortcuts(5678).empty());
    }

    void test_complete_with_shortcut()
    {
        SteamFixture fixture("capydeploy_upload_shortcut");
        JsonShortcutStore store(fixture.steam);
        SteamShortcutManager shortcuts(store);
        const auto root = fixture.home / "Games";
        UploadManager uploads({.storage_root = root}, &shortcuts, &fixture.steam);

        const auto data = pattern(64, 5);
        const auto init = uploads.init_upload(game_config("Celeste"), data.size(), 1);
        (void)uploads.upload_chunk(init.upload_id, "run.sh", data, 0);
        const auto result = uploads.complete_upload(init.upload_id, true);
        assert(result.app_id);

        const auto listed = shortcuts.list_shortcuts(1234);
        assert(listed.size() == 1);
        assert(listed.front().app_id == *result.app_id);
        assert(listed.front().name == "Celeste");
        assert(listed.front().exe == quote_path((root / "Celeste" / "run.sh").generic_string()));

        // Without a shortcut manager the completion fails but stays retryable.
        const auto bare_root = fresh_dir("capydeploy_upload_no_shortcuts");
        UploadManager bare({.storage_root = bare_root});
        const auto bare_init = bare.init_upload(game_config("Celeste"), data.size(), 1);
        (void)bare.upload_chunk(bare_init.upload_id, "run.sh", data, 0);
        assert(error_code_of([&]
                             { (void)bare.complete_upload(bare_init.upload_id, true); }) == ErrorCode::Unknown);
        assert(bare.get_upload_progress(bare_init.upload_id).state == protocol::UploadState::Active);
        (void)bare.complete_upload(bare_init.upload_id, false);
        cleanup_path(bare_root);
    }

    void test_progress_throttle()
    {
        using namespace std::chrono_literals;
        ProgressThrottle throttle(250ms);
        const auto start = ProgressThrottle::Clock::now();

        assert(throttle.should_emit("u1", 10, 100, start));
        assert(!throttle.should_emit("u1", 20, 100, start + 100ms));
        assert(throttle.should_emit("u2", 20, 100, start + 100ms));
        assert(throttle.should_emit("u1", 30, 100, start + 300ms));

        // The final update always goes out, exactly once.
        assert(throttle.should_emit("u1", 100, 100, start + 310ms));
        assert(!throttle.should_emit("u1", 100, 100, start + 900ms));

        throttle.forget("u1");
        assert(throttle.should_emit("u1", 100, 100, start + 910ms));

        // Uploads that go quiet without completing are eventually dropped.
        assert(throttle.tracked() == 2);
        throttle.prune(1s, start + 1500ms);
        assert(throttle.tracked() == 1);
        throttle.prune(1s, start + 5s);
        assert(throttle.tracked() == 0);
    }

    void test_concurrent_chunks()
    {
        constexpr std::size_t kFiles = 4;
        constexpr std::size_t kFileSize = 1000;
        constexpr std::size_t kChunk = 100;
        constexpr std::size_t kChunksPerFile = kFileSize / kChunk;
        constexpr std::size_t kWriters = 4;

        const auto root = fresh_dir("capydeploy_upload_concurrent");
        UploadManager uploads({.storage_root = root});
        std::vector<std::vector<std::byte>> files;
        for (std::size_t f = 0; f < kFiles; ++f)
        {
            files.push_back(pattern(kFileSize, static_cast<std::uint8_t>(10 + f)));
        }

        const auto init = uploads.init_upload(game_config("Hades"), kFiles * kFileSize, kFiles);
        std::vector<std::thread> writers;
        for (std::size_t w = 0; w < kWriters; ++w)
        {
            writers.emplace_back([&, w]
                                 {
                // Each writer takes every fourth chunk, so every file is fed
                // by several threads in no particular order.
                for (std::size_t i = w; i < kFiles * kChunksPerFile; i += kWriters)
                {
                    const auto f = i % kFiles;
                    const auto offset = (i / kFiles) * kChunk;
                    (void)uploads.upload_chunk(init.upload_id, "data/file" + std::to_string(f) + ".bin",
                                               slice(files[f], offset, kChunk), offset);
                } });
        }
        for (auto &writer : writers)
        {
            writer.join();
        }

        const auto progress = uploads.get_upload_progress(init.upload_id);
        assert(progress.bytes_written == progress.total_size);
        (void)uploads.complete_upload(init.upload_id, false);
        for (std::size_t f = 0; f < kFiles; ++f)
        {
            assert(read_file(root / "Hades" / "data" / ("file" + std::to_string(f) + ".bin")) == files[f]);
        }

        cleanup_path(root);
    }

    void test_cancel_with_writers_in_flight()
    {
        constexpr std::size_t kFileSize = 100 * 1000;
        constexpr std::size_t kChunk = 100;
        constexpr std::size_t kWriters = 4;

        const auto root = fresh_dir("capydeploy_upload_cancel_in_flight");
        UploadManager uploads({.storage_root = root});
        const auto data = pattern(kFileSize, 21);
        const auto init = uploads.init_upload(game_config("Hollow"), kWriters * kFileSize, kWriters);

        std::atomic<std::size_t> accepted{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> writers;
        for (std::size_t w = 0; w < kWriters; ++w)
        {
            writers.emplace_back([&, w]
                                 {
                const auto name = "part" + std::to_string(w) + ".bin";
                for (std::size_t offset = 0; offset < kFileSize; offset += kChunk)
                {
                    try
                    {
                        (void)uploads.upload_chunk(init.upload_id, name, slice(data, offset, kChunk), offset);
                        ++accepted;
                    }
                    catch (const ProtocolError &error)
                    {
                        assert(error.code() == ErrorCode::UploadFailed);
                        ++rejected;
                        return;
                    }
                } });
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (accepted.load() < 20 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::yield();
        }
        uploads.cancel_upload(init.upload_id);
        for (auto &writer : writers)
        {
            writer.join();
        }

        assert(uploads.get_upload_progress(init.upload_id).state == protocol::UploadState::Cancelled);
        assert(!std::filesystem::exists(root / "Hollow.partial"));
        assert(!std::filesystem::exists(root / "Hollow"));

        cleanup_path(root);
    }

    // Shortcut manager that cancels the upload from inside completion.
    class CancellingShortcuts : public ShortcutManager
    {
    public:
        CancellingShortcuts(UploadManager *&uploads, std::string &upload_id)
            : uploads_(uploads), upload_id_(upload_id)
        {
        }

        std::uint32_t create_shortcut(std::uint32_t /*user_id*/, const protocol::ShortcutConfig &config) override
        {
            uploads_->cancel_upload(upload_id_);
            return compute_app_id(config.exe, config.name);
        }

        void delete_shortcut(std::uint32_t, std::optional<std::uint32_t>, const std::optional<std::string> &) override {}

        std::vector<protocol::ShortcutInfo> list_shortcuts(std::uint32_t) const override { return {}; }

        std::uint32_t update_shortcut(std::uint32_t, std::uint32_t app_id, const protocol::ShortcutConfig &) override
        {
            return app_id;
        }

    private:
        UploadManager *&uploads_;
        std::string &upload_id_;
    };

    void test_cancel_during_completion_keeps_previous_install()
    {
        const auto root = fresh_dir("capydeploy_upload_cancel_completing");
        UploadManager *target = nullptr;
        std::string upload_id;
        CancellingShortcuts shortcuts(target, upload_id);
        UploadManager uploads({.storage_root = root, .shortcut_user = 1234}, &shortcuts);
        target = &uploads;

        std::filesystem::create_directories(root / "Celeste");
        {
            std::ofstream(root / "Celeste" / "run.sh") << "old build";
        }

        const auto data = pattern(64, 9);
        upload_id = uploads.init_upload(game_config("Celeste"), data.size(), 1).upload_id;
        (void)uploads.upload_chunk(upload_id, "run.sh", data, 0);

        assert(error_code_of([&]
                             { (void)uploads.complete_upload(upload_id, true); }) == ErrorCode::UploadFailed);
        assert(uploads.get_upload_progress(upload_id).state == protocol::UploadState::Cancelled);
        assert(!std::filesystem::exists(root / "Celeste.partial"));
        assert(std::filesystem::exists(root / "Celeste" / "run.sh"));
        assert(read_file(root / "Celeste" / "run.sh").size() == std::string("old build").size());

        cleanup_path(root);
    }

} // namespace

void run_agent_component_tests()
{
    test_file_coverage();
    test_path_resolution();
    test_in_order_upload();
    test_out_of_order_and_duplicates();
    test_cancel_and_traversal();
    test_resume_after_restart();
    test_expiry();
    test_steam_controller();
    test_shortcut_manager();
    test_complete_with_shortcut();
    test_progress_throttle();
    test_concurrent_chunks();
    test_cancel_with_writers_in_flight();
    test_cancel_during_completion_keeps_previous_install();
    std::cout << "Agent component tests passed\n";
}
