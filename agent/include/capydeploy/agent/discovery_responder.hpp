#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>
#include <array>
#include <string>

#include "capydeploy/discovery.hpp"

namespace capydeploy::agent
{

    // Answers Hub discovery queries on the multicast group. Failure to join
    // the group only disables discovery; the request channel keeps working.
    class DiscoveryResponder
    {
    public:
        DiscoveryResponder(asio::io_context &io_context, discovery::Announcement announcement,
                           std::uint16_t discovery_port = discovery::kDiscoveryPort);

        bool start();

        void stop();

    private:
        void receive_next();

        asio::ip::udp::socket socket_;
        std::uint16_t discovery_port_;
        std::string encoded_;
        std::array<char, discovery::kMaxDatagramSize> buffer_{};
        asio::ip::udp::endpoint sender_;
    };

} // namespace capydeploy::agent
