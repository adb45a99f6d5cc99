#include "capydeploy/hub/discovery_registry.hpp"

#include <algorithm>
#include <array>
#include <set>

#include <spdlog/spdlog.h>

namespace capydeploy::hub
{

    namespace
    {
        constexpr std::array<std::string_view, 3> kEventLabels{"discovered", "updated", "lost"};

        std::vector<std::string> unique_addresses(const std::vector<std::string> &addresses)
        {
            std::set<std::string> unique(addresses.begin(), addresses.end());
            unique.erase(std::string{});
            return {unique.begin(), unique.end()};
        }

        std::string field_or(const discovery::Announcement &announcement, std::string_view key, const std::string &fallback)
        {
            auto value = discovery::find_info_field(announcement, key);
            return value && !value->empty() ? *value : fallback;
        }
    } // namespace

    std::string_view to_string(AgentEventKind kind) noexcept
    {
        return kEventLabels[static_cast<std::size_t>(kind)];
    }

    DiscoveryRegistry::DiscoveryRegistry(AnnouncementSource &source, RegistryOptions options)
        : source_(source), stale_timeout_(options.stale_timeout), events_(options.event_capacity)
    {
    }

    DiscoveryRegistry::~DiscoveryRegistry()
    {
        stop_continuous_discovery();
        events_.close();
    }

    std::vector<DiscoveredAgent> DiscoveryRegistry::discover(std::chrono::milliseconds timeout)
    {
        const auto generation = cancel_generation_.load();
        std::vector<std::string> seen;
        try
        {
            source_.query(
                timeout,
                [&](const discovery::Announcement &announcement)
                {
                    const auto agent = process_announcement(announcement);
                    if (std::find(seen.begin(), seen.end(), agent.id) == seen.end())
                    {
                        seen.push_back(agent.id);
                    }
                },
                [&]
                { return stopping_.load() || cancel_generation_.load() != generation; });
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Discovery query failed: {}", ex.what());
        }

        std::vector<DiscoveredAgent> observed;
        std::lock_guard lock(mutex_);
        for (const auto &id : seen)
        {
            if (auto it = agents_.find(id); it != agents_.end())
            {
                observed.push_back(it->second);
            }
        }
        return observed;
    }

    void DiscoveryRegistry::cancel_discovery()
    {
        ++cancel_generation_;
    }

    bool DiscoveryRegistry::start_continuous_discovery(std::chrono::milliseconds interval,
                                                       std::chrono::milliseconds query_window)
    {
        std::lock_guard lock(loop_mutex_);
        if (loop_.joinable())
        {
            return false;
        }
        stopping_ = false;
        loop_ = std::thread([this, interval, query_window]
                            {
            auto next_cycle = Clock::now();
            while (!stopping_.load())
            {
                next_cycle += interval;
                discover(query_window);
                prune_stale();

                std::unique_lock wait_lock(loop_mutex_);
                if (loop_cv_.wait_until(wait_lock, next_cycle, [this]
                                        { return stopping_.load(); }))
                {
                    break;
                }
            } });
        spdlog::info("Continuous discovery started (interval {} ms)", interval.count());
        return true;
    }

    void DiscoveryRegistry::stop_continuous_discovery()
    {
        std::thread loop;
        {
            std::lock_guard lock(loop_mutex_);
            if (!loop_.joinable())
            {
                return;
            }
            stopping_ = true;
            loop = std::move(loop_);
        }
        loop_cv_.notify_all();
        loop.join();
        spdlog::info("Continuous discovery stopped");
    }

    bool DiscoveryRegistry::running() const
    {
        std::lock_guard lock(loop_mutex_);
        return loop_.joinable();
    }

    DiscoveredAgent DiscoveryRegistry::process_announcement(const discovery::Announcement &announcement,
                                                            Clock::time_point seen_at)
    {
        const auto id = field_or(announcement, "id", announcement.instance_name);
        const auto display_name = field_or(announcement, "name", announcement.host);

        DiscoveredAgent snapshot;
        std::optional<AgentEventKind> event;
        {
            std::lock_guard lock(mutex_);
            auto it = agents_.find(id);
            if (it == agents_.end())
            {
                DiscoveredAgent agent{
                    .id = id,
                    .display_name = display_name,
                    .platform = field_or(announcement, "platform", {}),
                    .version = field_or(announcement, "version", {}),
                    .host = announcement.host,
                    .port = announcement.port,
                    .addresses = unique_addresses(announcement.addresses),
                    .discovered_at = seen_at,
                    .last_seen = seen_at,
                };
                it = agents_.emplace(id, std::move(agent)).first;
                event = AgentEventKind::Discovered;
            }
            else if (seen_at >= it->second.last_seen)
            {
                auto &agent = it->second;
                agent.display_name = display_name;
                agent.platform = field_or(announcement, "platform", agent.platform);
                agent.version = field_or(announcement, "version", agent.version);
                agent.host = announcement.host;
                agent.port = announcement.port;
                agent.addresses = unique_addresses(announcement.addresses);
                agent.last_seen = seen_at;
                event = AgentEventKind::Updated;
            }
            // Older announcements lose to the newer state already recorded.
            snapshot = it->second;
        }

        if (event)
        {
            publish(*event, snapshot);
        }
        return snapshot;
    }

    std::vector<DiscoveredAgent> DiscoveryRegistry::prune_stale(Clock::time_point now)
    {
        std::vector<DiscoveredAgent> pruned;
        {
            std::lock_guard lock(mutex_);
            for (auto it = agents_.begin(); it != agents_.end();)
            {
                if (now - it->second.last_seen > stale_timeout_)
                {
                    pruned.push_back(std::move(it->second));
                    it = agents_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (const auto &agent : pruned)
        {
            spdlog::info("Agent {} ({}) went stale", agent.display_name, agent.id);
            publish(AgentEventKind::Lost, agent);
        }
        return pruned;
    }

    std::vector<DiscoveredAgent> DiscoveryRegistry::get_agents() const
    {
        std::vector<DiscoveredAgent> agents;
        {
            std::lock_guard lock(mutex_);
            agents.reserve(agents_.size());
            for (const auto &[id, agent] : agents_)
            {
                agents.push_back(agent);
            }
        }
        std::sort(agents.begin(), agents.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.id < rhs.id; });
        return agents;
    }

    std::optional<DiscoveredAgent> DiscoveryRegistry::get_agent(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        if (auto it = agents_.find(id); it != agents_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    bool DiscoveryRegistry::remove_agent(const std::string &id)
    {
        std::optional<DiscoveredAgent> removed;
        {
            std::lock_guard lock(mutex_);
            if (auto it = agents_.find(id); it != agents_.end())
            {
                removed = std::move(it->second);
                agents_.erase(it);
            }
        }
        if (!removed)
        {
            return false;
        }
        publish(AgentEventKind::Lost, std::move(*removed));
        return true;
    }

    void DiscoveryRegistry::clear()
    {
        std::lock_guard lock(mutex_);
        agents_.clear();
    }

    void DiscoveryRegistry::set_stale_timeout(std::chrono::milliseconds timeout)
    {
        std::lock_guard lock(mutex_);
        stale_timeout_ = timeout;
    }

    std::chrono::milliseconds DiscoveryRegistry::stale_timeout() const
    {
        std::lock_guard lock(mutex_);
        return stale_timeout_;
    }

    void DiscoveryRegistry::publish(AgentEventKind kind, DiscoveredAgent agent)
    {
        if (!events_.try_push(AgentEvent{.kind = kind, .agent = std::move(agent)}))
        {
            spdlog::debug("Discovery event dropped: subscriber is behind");
        }
    }

} // namespace capydeploy::hub
