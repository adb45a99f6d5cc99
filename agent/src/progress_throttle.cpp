#include "capydeploy/agent/progress_throttle.hpp"

namespace capydeploy::agent
{

    ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval) : interval_(interval) {}

    bool ProgressThrottle::should_emit(const std::string &upload_id, std::uint64_t bytes_written,
                                       std::uint64_t total_size, Clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = entries_.try_emplace(upload_id);
        auto &entry = it->second;
        if (bytes_written >= total_size)
        {
            if (entry.final_sent)
            {
                return false;
            }
            entry.final_sent = true;
            entry.last_emit = now;
            return true;
        }
        if (!inserted && now - entry.last_emit < interval_)
        {
            return false;
        }
        entry.last_emit = now;
        return true;
    }

    void ProgressThrottle::forget(const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        entries_.erase(upload_id);
    }

    void ProgressThrottle::prune(Clock::duration max_idle, Clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        std::erase_if(entries_, [&](const auto &item)
                      { return now - item.second.last_emit > max_idle; });
    }

    std::size_t ProgressThrottle::tracked() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

} // namespace capydeploy::agent
