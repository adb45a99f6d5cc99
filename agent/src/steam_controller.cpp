#include "capydeploy/agent/steam_controller.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <thread>

#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

extern char **environ;

namespace capydeploy::agent
{

    namespace
    {

        template <typename Int>
        std::optional<Int> parse_number(std::string_view text)
        {
            Int value{};
            const auto *end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    void run_detached(const std::vector<std::string> &argv)
    {
        if (argv.empty())
        {
            return;
        }
        std::thread([argv]
                    {
            std::vector<char *> args;
            args.reserve(argv.size() + 1);
            for (const auto &arg : argv)
            {
                args.push_back(const_cast<char *>(arg.c_str()));
            }
            args.push_back(nullptr);

            pid_t pid = 0;
            const int rc = posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
            if (rc != 0)
            {
                spdlog::warn("Failed to launch {}: {}", argv.front(), std::generic_category().message(rc));
                return;
            }
            int status = 0;
            waitpid(pid, &status, 0);
            spdlog::debug("{} exited with status {}", argv.front(), status); })
            .detach();
    }

    LocalSteamController::LocalSteamController(SteamLocation location, CommandRunner runner)
        : location_(std::move(location)), runner_(std::move(runner))
    {
    }

    void LocalSteamController::restart_steam()
    {
        const auto path = get_steam_path();
        if (!get_steam_status())
        {
            throw ProtocolError::from_code(ErrorCode::SteamNotRunning);
        }
        spdlog::info("Requesting Steam restart ({})", path.string());
        // Steam relaunches itself through its session manager after shutdown.
        runner_({"steam", "-shutdown"});
    }

    bool LocalSteamController::get_steam_status() const
    {
        std::ifstream in(location_.home / ".steam" / "steam.pid");
        std::string text;
        if (!in || !std::getline(in, text))
        {
            return false;
        }
        const auto pid = parse_number<pid_t>(text);
        if (!pid || *pid <= 0)
        {
            return false;
        }
        return ::kill(*pid, 0) == 0 || errno == EPERM;
    }

    std::vector<std::filesystem::path> LocalSteamController::candidate_paths() const
    {
        if (location_.steam_root)
        {
            return {*location_.steam_root};
        }
        return {
            location_.home / ".steam" / "steam",
            location_.home / ".local" / "share" / "Steam",
            location_.home / ".var" / "app" / "com.valvesoftware.Steam" / ".local" / "share" / "Steam",
        };
    }

    std::filesystem::path LocalSteamController::get_steam_path() const
    {
        for (const auto &candidate : candidate_paths())
        {
            std::error_code ec;
            if (std::filesystem::is_directory(candidate, ec))
            {
                return candidate;
            }
        }
        throw ProtocolError::from_code(ErrorCode::SteamNotFound);
    }

    std::vector<std::uint32_t> LocalSteamController::list_users() const
    {
        const auto userdata = get_steam_path() / "userdata";
        std::vector<std::uint32_t> users;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(userdata, ec))
        {
            if (!entry.is_directory())
            {
                continue;
            }
            const auto id = parse_number<std::uint32_t>(entry.path().filename().string());
            if (id && *id != 0)
            {
                users.push_back(*id);
            }
        }
        std::sort(users.begin(), users.end());
        return users;
    }

} // namespace capydeploy::agent
