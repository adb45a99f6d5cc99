#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "capydeploy/discovery.hpp"
#include "capydeploy/event_queue.hpp"

namespace capydeploy::hub
{

    using Clock = std::chrono::steady_clock;

    struct DiscoveredAgent
    {
        std::string id;
        std::string display_name;
        std::string platform;
        std::string version;
        std::string host;
        std::uint16_t port{};
        std::vector<std::string> addresses;
        Clock::time_point discovered_at{};
        Clock::time_point last_seen{};
    };

    enum class AgentEventKind : std::uint8_t
    {
        Discovered,
        Updated,
        Lost
    };

    std::string_view to_string(AgentEventKind kind) noexcept;

    struct AgentEvent
    {
        AgentEventKind kind{AgentEventKind::Discovered};
        DiscoveredAgent agent;
    };

    // One discovery query window.
    class AnnouncementSource
    {
    public:
        using AnnouncementHandler = std::function<void(const discovery::Announcement &)>;
        using CancelCheck = std::function<bool()>;

        virtual ~AnnouncementSource() = default;

        // Sends a query and reports every reply until `timeout` elapses or
        // `cancelled` returns true. Must not block past `timeout`.
        virtual void query(std::chrono::milliseconds timeout, const AnnouncementHandler &on_announcement,
                           const CancelCheck &cancelled) = 0;
    };

    struct RegistryOptions
    {
        std::chrono::milliseconds stale_timeout{std::chrono::seconds{30}};
        std::size_t event_capacity{64};
    };

    // Live set of Agents keyed by id, fed by announcements and aged out by
    // `lastSeen`. Lifecycle changes are published on a bounded queue that
    // drops new events when the consumer falls behind.
    class DiscoveryRegistry
    {
    public:
        static constexpr std::chrono::milliseconds kDefaultQueryWindow{std::chrono::seconds{3}};

        explicit DiscoveryRegistry(AnnouncementSource &source, RegistryOptions options = {});
        ~DiscoveryRegistry();

        DiscoveryRegistry(const DiscoveryRegistry &) = delete;
        DiscoveryRegistry &operator=(const DiscoveryRegistry &) = delete;

        // Agents observed during this window. A failed query is logged and
        // yields whatever was collected; existing entries are never cleared.
        std::vector<DiscoveredAgent> discover(std::chrono::milliseconds timeout);

        // Aborts the discover() windows currently in progress.
        void cancel_discovery();

        // Returns false when a loop is already running.
        bool start_continuous_discovery(std::chrono::milliseconds interval,
                                        std::chrono::milliseconds query_window = kDefaultQueryWindow);
        void stop_continuous_discovery();
        bool running() const;

        DiscoveredAgent process_announcement(const discovery::Announcement &announcement,
                                             Clock::time_point seen_at = Clock::now());

        // Removes agents whose lastSeen is older than the stale timeout and
        // emits one `lost` event per removal.
        std::vector<DiscoveredAgent> prune_stale(Clock::time_point now = Clock::now());

        BoundedEventQueue<AgentEvent> &events() noexcept { return events_; }

        std::vector<DiscoveredAgent> get_agents() const;
        std::optional<DiscoveredAgent> get_agent(const std::string &id) const;

        // Emits `lost` only when the id was known.
        bool remove_agent(const std::string &id);

        // Drops every entry without emitting events.
        void clear();

        void set_stale_timeout(std::chrono::milliseconds timeout);
        std::chrono::milliseconds stale_timeout() const;

    private:
        void publish(AgentEventKind kind, DiscoveredAgent agent);

        AnnouncementSource &source_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, DiscoveredAgent> agents_;
        std::chrono::milliseconds stale_timeout_;

        BoundedEventQueue<AgentEvent> events_;

        std::atomic<std::uint64_t> cancel_generation_{0};
        std::atomic<bool> stopping_{false};
        mutable std::mutex loop_mutex_;
        std::condition_variable loop_cv_;
        std::thread loop_;
    };

} // namespace capydeploy::hub
