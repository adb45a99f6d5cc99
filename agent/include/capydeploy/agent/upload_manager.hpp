#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "capydeploy/agent/capabilities.hpp"
#include "capydeploy/protocol.hpp"

namespace capydeploy::agent
{

    // Disjoint byte ranges [begin, end) written for one file.
    class FileCoverage
    {
    public:
        void insert(std::uint64_t begin, std::uint64_t end);

        // Bytes in [begin, end) not yet covered.
        std::uint64_t uncovered(std::uint64_t begin, std::uint64_t end) const;

        // Highest offset reachable from 0 without a gap.
        std::uint64_t contiguous() const;

        std::uint64_t covered() const;

        const std::map<std::uint64_t, std::uint64_t> &ranges() const noexcept { return ranges_; }

    private:
        std::map<std::uint64_t, std::uint64_t> ranges_;
    };

    struct UploadSession
    {
        std::string upload_id;
        protocol::UploadConfig config;
        std::filesystem::path destination;
        std::filesystem::path staging;
        std::uint64_t total_size{};
        std::uint64_t file_count{};
        std::uint64_t bytes_written{};
        protocol::UploadState state{protocol::UploadState::Initializing};
        std::map<std::string, FileCoverage> files;
        std::chrono::system_clock::time_point last_update{};
        std::optional<std::uint32_t> app_id;
        std::uint32_t writes_in_flight{};
        // Set once completion starts moving staging into place; cancel is
        // ignored from then on.
        bool installing{false};
        std::uint64_t revision{};
    };

    struct UploadManagerOptions
    {
        std::filesystem::path storage_root;
        std::optional<std::uint32_t> shortcut_user;
    };

    // Transfer session manager: a write-at-offset state machine keyed by
    // upload id. The session table lock is never held across disk I/O.
    class UploadManager : public FileReceiver
    {
    public:
        UploadManager(UploadManagerOptions options, ShortcutManager *shortcuts = nullptr,
                      SteamController *steam = nullptr);

        InitUploadResult init_upload(const protocol::UploadConfig &config, std::uint64_t total_size,
                                     std::uint64_t file_count) override;

        ChunkResult upload_chunk(const std::string &upload_id, const std::string &file_path,
                                 std::span<const std::byte> data, std::uint64_t offset) override;

        CompleteUploadResult complete_upload(const std::string &upload_id, bool create_shortcut) override;

        void cancel_upload(const std::string &upload_id) override;

        protocol::UploadProgress get_upload_progress(const std::string &upload_id) const override;

        // Fails idle unfinished sessions and forgets finished ones older than
        // `max_age`.
        void cleanup_expired(std::chrono::seconds max_age);

        std::filesystem::path destination_for(const protocol::UploadConfig &config) const;

    private:
        std::filesystem::path metadata_path(const std::string &upload_id) const;

        void load_existing();
        void persist(const UploadSession &snapshot);
        void remove_metadata(const std::string &upload_id);
        std::string generate_upload_id_locked() const;
        UploadSession &find_locked(const std::string &upload_id);
        const UploadSession &find_locked(const std::string &upload_id) const;

        std::optional<std::uint32_t> publish_shortcut(const UploadSession &snapshot);

        UploadManagerOptions options_;
        std::filesystem::path metadata_dir_;
        ShortcutManager *shortcuts_;
        SteamController *steam_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadSession> sessions_;

        std::mutex persist_mutex_;
        std::unordered_map<std::string, std::uint64_t> persisted_revisions_;
    };

} // namespace capydeploy::agent
