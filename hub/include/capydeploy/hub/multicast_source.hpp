#pragma once

#include <cstdint>
#include <string>

#include "capydeploy/hub/discovery_registry.hpp"

namespace capydeploy::hub
{

    // Multicasts a discovery query and collects the unicast replies.
    class MulticastAnnouncementSource : public AnnouncementSource
    {
    public:
        explicit MulticastAnnouncementSource(std::string group = std::string(discovery::kMulticastGroup),
                                             std::uint16_t port = discovery::kDiscoveryPort);

        void query(std::chrono::milliseconds timeout, const AnnouncementHandler &on_announcement,
                   const CancelCheck &cancelled) override;

    private:
        std::string group_;
        std::uint16_t port_;
    };

} // namespace capydeploy::hub
