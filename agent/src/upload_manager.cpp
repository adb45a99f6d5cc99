#include "capydeploy/agent/upload_manager.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "capydeploy/agent/filesystem.hpp"
#include "capydeploy/crypto.hpp"

namespace capydeploy::agent
{

    namespace
    {
        constexpr auto kMetadataDir = ".capydeploy/uploads";
        constexpr auto kStagingSuffix = ".partial";
        constexpr std::size_t kUploadIdBytes = 8;
        constexpr std::uint64_t kTombstone = std::numeric_limits<std::uint64_t>::max();

        std::uint64_t covered_total(const UploadSession &session)
        {
            std::uint64_t total = 0;
            for (const auto &[path, coverage] : session.files)
            {
                total += coverage.covered();
            }
            return total;
        }

        std::uint64_t contiguous_total(const UploadSession &session)
        {
            std::uint64_t total = 0;
            for (const auto &[path, coverage] : session.files)
            {
                total += coverage.contiguous();
            }
            return total;
        }

        nlohmann::json session_to_json(const UploadSession &session)
        {
            nlohmann::json files = nlohmann::json::object();
            for (const auto &[path, coverage] : session.files)
            {
                nlohmann::json ranges = nlohmann::json::array();
                for (const auto &[begin, end] : coverage.ranges())
                {
                    ranges.push_back({begin, end});
                }
                files[path] = std::move(ranges);
            }
            return {
                {"uploadId", session.upload_id},
                {"config", session.config},
                {"destination", session.destination.generic_string()},
                {"staging", session.staging.generic_string()},
                {"totalSize", session.total_size},
                {"fileCount", session.file_count},
                {"files", std::move(files)},
                {"lastUpdate", std::chrono::duration_cast<std::chrono::seconds>(session.last_update.time_since_epoch()).count()},
            };
        }

        UploadSession session_from_json(const nlohmann::json &json)
        {
            UploadSession session{};
            session.upload_id = json.at("uploadId").get<std::string>();
            session.config = json.at("config").get<protocol::UploadConfig>();
            session.destination = json.at("destination").get<std::string>();
            session.staging = json.at("staging").get<std::string>();
            session.total_size = json.at("totalSize").get<std::uint64_t>();
            session.file_count = json.value("fileCount", 0ULL);
            for (const auto &[path, ranges] : json.value("files", nlohmann::json::object()).items())
            {
                auto &coverage = session.files[path];
                for (const auto &range : ranges)
                {
                    coverage.insert(range.at(0).get<std::uint64_t>(), range.at(1).get<std::uint64_t>());
                }
            }
            session.bytes_written = contiguous_total(session);
            session.state = protocol::UploadState::Active;
            const auto seconds = json.value("lastUpdate", 0LL);
            session.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
            return session;
        }

        ProtocolError not_writable(const UploadSession &session)
        {
            if (session.state == protocol::UploadState::Initializing || session.state == protocol::UploadState::Completing)
            {
                return ProtocolError(ErrorCode::AgentBusy,
                                     "upload " + session.upload_id + " is " + std::string(protocol::to_string(session.state)));
            }
            return ProtocolError(ErrorCode::UploadFailed,
                                 "upload " + session.upload_id + " is " + std::string(protocol::to_string(session.state)));
        }

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!fs::remove_tree(path, ec))
            {
                spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
            }
        }

    } // namespace

    void FileCoverage::insert(std::uint64_t begin, std::uint64_t end)
    {
        if (begin >= end)
        {
            return;
        }
        auto it = ranges_.upper_bound(begin);
        if (it != ranges_.begin())
        {
            auto previous = std::prev(it);
            if (previous->second >= begin)
            {
                begin = previous->first;
                end = std::max(end, previous->second);
                it = ranges_.erase(previous);
            }
        }
        while (it != ranges_.end() && it->first <= end)
        {
            end = std::max(end, it->second);
            it = ranges_.erase(it);
        }
        ranges_.emplace(begin, end);
    }

    std::uint64_t FileCoverage::uncovered(std::uint64_t begin, std::uint64_t end) const
    {
        if (begin >= end)
        {
            return 0;
        }
        std::uint64_t overlap = 0;
        auto it = ranges_.upper_bound(begin);
        if (it != ranges_.begin())
        {
            --it;
        }
        for (; it != ranges_.end() && it->first < end; ++it)
        {
            const auto lo = std::max(begin, it->first);
            const auto hi = std::min(end, it->second);
            if (hi > lo)
            {
                overlap += hi - lo;
            }
        }
        return (end - begin) - overlap;
    }

    std::uint64_t FileCoverage::contiguous() const
    {
        if (ranges_.empty() || ranges_.begin()->first != 0)
        {
            return 0;
        }
        return ranges_.begin()->second;
    }

    std::uint64_t FileCoverage::covered() const
    {
        std::uint64_t total = 0;
        for (const auto &[begin, end] : ranges_)
        {
            total += end - begin;
        }
        return total;
    }

    UploadManager::UploadManager(UploadManagerOptions options, ShortcutManager *shortcuts, SteamController *steam)
        : options_(std::move(options)),
          metadata_dir_(options_.storage_root / kMetadataDir),
          shortcuts_(shortcuts),
          steam_(steam)
    {
        std::filesystem::create_directories(metadata_dir_);
        load_existing();
    }

    std::filesystem::path UploadManager::destination_for(const protocol::UploadConfig &config) const
    {
        std::filesystem::path base = config.install_path;
        if (base.empty())
        {
            base = options_.storage_root;
        }
        else if (base.is_relative())
        {
            base = options_.storage_root / base;
        }
        return (base / config.game_name).lexically_normal();
    }

    InitUploadResult UploadManager::init_upload(const protocol::UploadConfig &config, std::uint64_t total_size,
                                                std::uint64_t file_count)
    {
        fs::require_plain_name(config.game_name, "game name");
        const auto destination = destination_for(config);

        UploadSession snapshot;
        std::vector<UploadSession> superseded;
        {
            std::lock_guard lock(mutex_);
            for (auto &[id, session] : sessions_)
            {
                if (protocol::is_terminal(session.state) || session.destination != destination)
                {
                    continue;
                }
                if (session.state != protocol::UploadState::Active)
                {
                    throw not_writable(session);
                }
                if (session.total_size == total_size && session.file_count == file_count)
                {
                    session.config = config;
                    session.last_update = std::chrono::system_clock::now();
                    ++session.revision;
                    spdlog::info("Resuming upload {} into {} at {} / {} bytes", session.upload_id,
                                 destination.string(), session.bytes_written, session.total_size);
                    return {.upload_id = session.upload_id, .resume_from = session.bytes_written};
                }
                if (session.writes_in_flight > 0)
                {
                    throw ProtocolError(ErrorCode::AgentBusy, "another upload into " + destination.string() + " is writing");
                }
            }

            // A different logical upload into the same destination replaces
            // any unfinished one; they would share a staging directory.
            for (auto &[id, session] : sessions_)
            {
                if (!protocol::is_terminal(session.state) && session.destination == destination)
                {
                    session.state = protocol::UploadState::Cancelled;
                    session.last_update = std::chrono::system_clock::now();
                    superseded.push_back(session);
                }
            }

            UploadSession session{};
            session.upload_id = generate_upload_id_locked();
            session.config = config;
            session.destination = destination;
            session.staging = destination;
            session.staging += kStagingSuffix;
            session.total_size = total_size;
            session.file_count = file_count;
            session.state = protocol::UploadState::Initializing;
            session.last_update = std::chrono::system_clock::now();
            sessions_[session.upload_id] = session;
            snapshot = session;
        }

        for (const auto &old : superseded)
        {
            spdlog::info("Upload {} superseded by {}", old.upload_id, snapshot.upload_id);
            remove_metadata(old.upload_id);
            remove_quietly(old.staging);
        }

        try
        {
            std::filesystem::create_directories(snapshot.staging);
            persist(snapshot);
        }
        catch (const std::exception &ex)
        {
            auto error = to_protocol_error(std::current_exception(), ErrorCode::UploadFailed);
            {
                std::lock_guard lock(mutex_);
                if (auto it = sessions_.find(snapshot.upload_id); it != sessions_.end())
                {
                    it->second.state = protocol::UploadState::Failed;
                }
            }
            spdlog::error("Upload {} failed to initialize: {}", snapshot.upload_id, ex.what());
            throw error;
        }

        {
            std::lock_guard lock(mutex_);
            auto &session = find_locked(snapshot.upload_id);
            if (session.state == protocol::UploadState::Initializing)
            {
                session.state = protocol::UploadState::Active;
            }
        }

        spdlog::info("Upload {} started: {} files, {} bytes into {}", snapshot.upload_id, file_count, total_size,
                     destination.string());
        return {.upload_id = snapshot.upload_id, .resume_from = 0};
    }

    ChunkResult UploadManager::upload_chunk(const std::string &upload_id, const std::string &file_path,
                                            std::span<const std::byte> data, std::uint64_t offset)
    {
        const std::uint64_t length = data.size();
        if (offset > std::numeric_limits<std::uint64_t>::max() - length)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "chunk offset overflows");
        }
        const auto end = offset + length;

        std::filesystem::path target;
        std::string key;
        {
            std::lock_guard lock(mutex_);
            auto &session = find_locked(upload_id);
            if (session.state != protocol::UploadState::Active)
            {
                throw not_writable(session);
            }
            target = fs::resolve_within(session.staging, file_path);
            key = target.lexically_relative(session.staging).generic_string();

            const auto coverage = session.files.find(key);
            if (coverage == session.files.end() && session.file_count > 0 && session.files.size() >= session.file_count)
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "upload declared only " +
                                                                   std::to_string(session.file_count) + " files");
            }
            const auto fresh = coverage == session.files.end() ? length : coverage->second.uncovered(offset, end);
            if (covered_total(session) + fresh > session.total_size)
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "chunk exceeds declared upload size");
            }
            if (fresh == 0 && length > 0)
            {
                // Already durable: acknowledge without rewriting.
                session.last_update = std::chrono::system_clock::now();
                return {.bytes_accepted = length, .total_written = session.bytes_written};
            }
            ++session.writes_in_flight;
        }

        std::optional<ProtocolError> write_error;
        try
        {
            fs::write_at(target, offset, data);
        }
        catch (const std::exception &)
        {
            write_error = to_protocol_error(std::current_exception(), ErrorCode::UploadFailed);
        }

        UploadSession snapshot;
        std::optional<std::filesystem::path> orphaned_staging;
        std::optional<ProtocolError> commit_error;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(upload_id);
            if (it == sessions_.end())
            {
                throw ProtocolError::from_code(ErrorCode::UploadNotFound);
            }
            auto &session = it->second;
            --session.writes_in_flight;
            if (session.state != protocol::UploadState::Active)
            {
                if (session.state == protocol::UploadState::Cancelled && session.writes_in_flight == 0)
                {
                    orphaned_staging = session.staging;
                }
                commit_error = not_writable(session);
            }
            else if (!write_error)
            {
                auto &coverage = session.files[key];
                if (covered_total(session) + coverage.uncovered(offset, end) > session.total_size)
                {
                    commit_error = ProtocolError(ErrorCode::InvalidRequest, "chunk exceeds declared upload size");
                }
                else
                {
                    coverage.insert(offset, end);
                    session.bytes_written = contiguous_total(session);
                    session.last_update = std::chrono::system_clock::now();
                    ++session.revision;
                    snapshot = session;
                }
            }
        }

        if (orphaned_staging)
        {
            remove_quietly(*orphaned_staging);
        }
        if (write_error)
        {
            spdlog::warn("Chunk write for upload {} ({} @ {}) failed: {}", upload_id, key, offset, write_error->what());
            throw *write_error;
        }
        if (commit_error)
        {
            throw *commit_error;
        }

        persist(snapshot);
        return {.bytes_accepted = length, .total_written = snapshot.bytes_written};
    }

    CompleteUploadResult UploadManager::complete_upload(const std::string &upload_id, bool create_shortcut)
    {
        UploadSession snapshot;
        {
            std::lock_guard lock(mutex_);
            auto &session = find_locked(upload_id);
            if (session.state == protocol::UploadState::Completed)
            {
                return {.app_id = session.app_id};
            }
            if (session.state != protocol::UploadState::Active)
            {
                throw not_writable(session);
            }
            if (session.bytes_written != session.total_size)
            {
                throw ProtocolError(ErrorCode::UploadFailed, "upload incomplete: " + std::to_string(session.bytes_written) +
                                                                 " of " + std::to_string(session.total_size) + " bytes");
            }
            if (session.file_count > 0 && session.files.size() != session.file_count)
            {
                throw ProtocolError(ErrorCode::UploadFailed, "upload incomplete: " + std::to_string(session.files.size()) +
                                                                 " of " + std::to_string(session.file_count) + " files");
            }
            if (session.writes_in_flight > 0)
            {
                throw ProtocolError(ErrorCode::AgentBusy, "chunk writes still in flight");
            }
            session.state = protocol::UploadState::Completing;
            snapshot = session;
        }

        std::optional<std::uint32_t> app_id;
        try
        {
            if (create_shortcut)
            {
                app_id = publish_shortcut(snapshot);
            }
            {
                std::lock_guard lock(mutex_);
                auto &session = find_locked(upload_id);
                if (session.state != protocol::UploadState::Completing)
                {
                    throw ProtocolError(ErrorCode::UploadFailed, "upload was cancelled while completing");
                }
                session.installing = true;
            }
            fs::replace_tree(snapshot.staging, snapshot.destination);
        }
        catch (const std::exception &ex)
        {
            auto error = to_protocol_error(std::current_exception(), ErrorCode::UploadFailed);
            bool cancelled = false;
            {
                std::lock_guard lock(mutex_);
                if (auto it = sessions_.find(upload_id); it != sessions_.end())
                {
                    if (it->second.state == protocol::UploadState::Completing)
                    {
                        it->second.state = protocol::UploadState::Active;
                    }
                    it->second.installing = false;
                    cancelled = it->second.state == protocol::UploadState::Cancelled;
                }
            }
            if (cancelled)
            {
                remove_quietly(snapshot.staging);
            }
            spdlog::warn("Upload {} could not complete: {}", upload_id, ex.what());
            throw error;
        }

        {
            std::lock_guard lock(mutex_);
            auto &session = find_locked(upload_id);
            session.state = protocol::UploadState::Completed;
            session.installing = false;
            session.app_id = app_id;
            session.last_update = std::chrono::system_clock::now();
        }

        remove_metadata(upload_id);
        spdlog::info("Upload {} completed into {}", upload_id, snapshot.destination.string());
        return {.app_id = app_id};
    }

    void UploadManager::cancel_upload(const std::string &upload_id)
    {
        std::optional<std::filesystem::path> staging;
        {
            std::lock_guard lock(mutex_);
            auto &session = find_locked(upload_id);
            if (protocol::is_terminal(session.state))
            {
                return;
            }
            if (session.installing)
            {
                spdlog::info("Upload {} is already being installed; cancel ignored", upload_id);
                return;
            }
            const auto previous = session.state;
            session.state = protocol::UploadState::Cancelled;
            session.last_update = std::chrono::system_clock::now();
            // In-flight writers and a running completion clean up after themselves.
            if (session.writes_in_flight == 0 && previous != protocol::UploadState::Completing)
            {
                staging = session.staging;
            }
        }

        remove_metadata(upload_id);
        if (staging)
        {
            remove_quietly(*staging);
        }
        spdlog::info("Upload {} cancelled", upload_id);
    }

    protocol::UploadProgress UploadManager::get_upload_progress(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        const auto &session = find_locked(upload_id);
        return {
            .upload_id = session.upload_id,
            .bytes_written = session.bytes_written,
            .total_size = session.total_size,
            .state = session.state,
        };
    }

    void UploadManager::cleanup_expired(std::chrono::seconds max_age)
    {
        std::vector<UploadSession> expired;
        std::vector<std::string> forgotten;
        {
            std::lock_guard lock(mutex_);
            const auto now = std::chrono::system_clock::now();
            for (auto it = sessions_.begin(); it != sessions_.end();)
            {
                auto &session = it->second;
                if (now - session.last_update <= max_age)
                {
                    ++it;
                    continue;
                }
                if (protocol::is_terminal(session.state))
                {
                    forgotten.push_back(it->first);
                    it = sessions_.erase(it);
                    continue;
                }
                if (session.state == protocol::UploadState::Active && session.writes_in_flight == 0)
                {
                    session.state = protocol::UploadState::Failed;
                    session.last_update = now;
                    expired.push_back(session);
                }
                ++it;
            }
        }

        for (const auto &session : expired)
        {
            spdlog::info("Upload {} expired after inactivity", session.upload_id);
            remove_metadata(session.upload_id);
            remove_quietly(session.staging);
        }

        std::lock_guard lock(persist_mutex_);
        for (const auto &id : forgotten)
        {
            persisted_revisions_.erase(id);
        }
    }

    std::filesystem::path UploadManager::metadata_path(const std::string &upload_id) const
    {
        return metadata_dir_ / (upload_id + ".json");
    }

    void UploadManager::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(metadata_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            try
            {
                std::ifstream in(entry.path());
                nlohmann::json json;
                in >> json;
                auto session = session_from_json(json);
                if (!std::filesystem::exists(session.staging))
                {
                    spdlog::warn("Dropping upload {}: staging directory is gone", session.upload_id);
                    std::filesystem::remove(entry.path());
                    continue;
                }
                spdlog::info("Recovered upload {} at {} / {} bytes", session.upload_id, session.bytes_written,
                             session.total_size);
                sessions_[session.upload_id] = std::move(session);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Ignoring unreadable upload metadata {}: {}", entry.path().string(), ex.what());
            }
        }
    }

    void UploadManager::persist(const UploadSession &snapshot)
    {
        std::lock_guard lock(persist_mutex_);
        auto &persisted = persisted_revisions_[snapshot.upload_id];
        if (persisted == kTombstone || (persisted > snapshot.revision))
        {
            return;
        }
        try
        {
            const auto path = metadata_path(snapshot.upload_id);
            auto temp = path;
            temp += ".tmp";
            {
                std::ofstream out(temp, std::ios::trunc);
                out << session_to_json(snapshot).dump(2);
                if (!out)
                {
                    throw std::runtime_error("cannot write " + temp.string());
                }
            }
            std::filesystem::rename(temp, path);
            persisted = snapshot.revision;
        }
        catch (const std::exception &ex)
        {
            // The in-memory table stays authoritative while the process lives.
            spdlog::warn("Failed to persist upload {}: {}", snapshot.upload_id, ex.what());
        }
    }

    void UploadManager::remove_metadata(const std::string &upload_id)
    {
        std::lock_guard lock(persist_mutex_);
        persisted_revisions_[upload_id] = kTombstone;
        std::error_code ec;
        std::filesystem::remove(metadata_path(upload_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove metadata for upload {}: {}", upload_id, ec.message());
        }
    }

    std::string UploadManager::generate_upload_id_locked() const
    {
        auto id = crypto::random_hex(kUploadIdBytes);
        while (sessions_.contains(id))
        {
            id = crypto::random_hex(kUploadIdBytes);
        }
        return id;
    }

    UploadSession &UploadManager::find_locked(const std::string &upload_id)
    {
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end())
        {
            throw ProtocolError(ErrorCode::UploadNotFound, "upload not found: " + upload_id);
        }
        return it->second;
    }

    const UploadSession &UploadManager::find_locked(const std::string &upload_id) const
    {
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end())
        {
            throw ProtocolError(ErrorCode::UploadNotFound, "upload not found: " + upload_id);
        }
        return it->second;
    }

    std::optional<std::uint32_t> UploadManager::publish_shortcut(const UploadSession &snapshot)
    {
        if (shortcuts_ == nullptr)
        {
            throw ProtocolError(ErrorCode::Unknown, "shortcut manager unavailable");
        }
        if (snapshot.config.executable.empty())
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "upload has no executable for its shortcut");
        }

        const auto exe = fs::resolve_within(snapshot.destination, snapshot.config.executable);
        const protocol::ShortcutConfig shortcut{
            .name = snapshot.config.game_name,
            .exe = exe.generic_string(),
            .start_dir = snapshot.destination.generic_string(),
            .launch_options = snapshot.config.launch_options,
            .tags = snapshot.config.tags,
        };

        std::vector<std::uint32_t> users;
        if (options_.shortcut_user)
        {
            users.push_back(*options_.shortcut_user);
        }
        else if (steam_ != nullptr)
        {
            users = steam_->list_users();
        }
        if (users.empty())
        {
            throw ProtocolError(ErrorCode::SteamNotFound, "no Steam users found");
        }

        std::optional<std::uint32_t> app_id;
        for (const auto user : users)
        {
            app_id = shortcuts_->create_shortcut(user, shortcut);
        }
        return app_id;
    }

} // namespace capydeploy::agent
