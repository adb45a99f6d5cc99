#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace capydeploy::agent
{

    // Rate limiter for upload_progress events: at most one per interval per
    // upload, plus exactly one when the upload reaches its total size.
    class ProgressThrottle
    {
    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::chrono::milliseconds kDefaultInterval{250};

        explicit ProgressThrottle(std::chrono::milliseconds interval = kDefaultInterval);

        bool should_emit(const std::string &upload_id, std::uint64_t bytes_written, std::uint64_t total_size,
                         Clock::time_point now = Clock::now());

        void forget(const std::string &upload_id);

        // Drops uploads that have not emitted for longer than `max_idle`.
        void prune(Clock::duration max_idle, Clock::time_point now = Clock::now());

        std::size_t tracked() const;

    private:
        struct Entry
        {
            Clock::time_point last_emit{};
            bool final_sent{false};
        };

        std::chrono::milliseconds interval_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace capydeploy::agent
