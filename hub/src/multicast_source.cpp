#include "capydeploy/hub/multicast_source.hpp"

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/multicast.hpp>
#include <asio/ip/udp.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace capydeploy::hub
{

    namespace
    {
        // Granularity at which a waiting query notices cancellation.
        constexpr std::chrono::milliseconds kPollSlice{100};
    } // namespace

    MulticastAnnouncementSource::MulticastAnnouncementSource(std::string group, std::uint16_t port)
        : group_(std::move(group)), port_(port)
    {
    }

    void MulticastAnnouncementSource::query(std::chrono::milliseconds timeout, const AnnouncementHandler &on_announcement,
                                            const CancelCheck &cancelled)
    {
        const auto deadline = Clock::now() + timeout;

        asio::io_context io_context;
        asio::ip::udp::socket socket(io_context);
        socket.open(asio::ip::udp::v4());
        socket.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), 0));
        socket.set_option(asio::ip::multicast::hops(1));

        const auto query = discovery::encode_query();
        const asio::ip::udp::endpoint group(asio::ip::make_address(group_), port_);
        socket.send_to(asio::buffer(query), group);

        std::array<char, discovery::kMaxDatagramSize> buffer{};
        asio::ip::udp::endpoint sender;
        while (!(cancelled && cancelled()))
        {
            const auto now = Clock::now();
            if (now >= deadline)
            {
                break;
            }
            const auto slice = std::min<Clock::duration>(kPollSlice, deadline - now);

            std::optional<std::size_t> received;
            std::error_code receive_ec;
            socket.async_receive_from(asio::buffer(buffer), sender,
                                      [&](const std::error_code &ec, std::size_t size)
                                      {
                                          receive_ec = ec;
                                          received = size;
                                      });
            io_context.restart();
            io_context.run_for(slice);
            if (!received)
            {
                socket.cancel();
                io_context.restart();
                io_context.run();
            }
            if (receive_ec)
            {
                if (receive_ec == asio::error::operation_aborted)
                {
                    continue;
                }
                throw std::system_error(receive_ec, "discovery receive");
            }

            auto announcement = discovery::decode_announcement(std::string_view(buffer.data(), *received));
            if (!announcement)
            {
                spdlog::debug("Ignoring malformed datagram from {}", sender.address().to_string());
                continue;
            }
            const auto address = sender.address().to_string();
            if (std::find(announcement->addresses.begin(), announcement->addresses.end(), address) ==
                announcement->addresses.end())
            {
                announcement->addresses.push_back(address);
            }
            on_announcement(*announcement);
        }
    }

} // namespace capydeploy::hub
