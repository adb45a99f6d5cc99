#include "capydeploy/agent/discovery_responder.hpp"

#include <asio/buffer.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/multicast.hpp>

#include <string_view>

#include <spdlog/spdlog.h>

namespace capydeploy::agent
{

    DiscoveryResponder::DiscoveryResponder(asio::io_context &io_context, discovery::Announcement announcement,
                                           std::uint16_t discovery_port)
        : socket_(io_context),
          discovery_port_(discovery_port),
          encoded_(discovery::encode_announcement(announcement))
    {
    }

    bool DiscoveryResponder::start()
    {
        const auto group = asio::ip::make_address(std::string(discovery::kMulticastGroup));
        try
        {
            socket_.open(asio::ip::udp::v4());
            socket_.set_option(asio::ip::udp::socket::reuse_address(true));
            socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), discovery_port_));
            socket_.set_option(asio::ip::multicast::join_group(group));
        }
        catch (const std::system_error &ex)
        {
            spdlog::warn("Discovery disabled: {}", ex.what());
            std::error_code ec;
            socket_.close(ec);
            return false;
        }

        spdlog::info("Answering discovery queries on {}:{}", discovery::kMulticastGroup, discovery_port_);
        receive_next();
        return true;
    }

    void DiscoveryResponder::stop()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    void DiscoveryResponder::receive_next()
    {
        socket_.async_receive_from(
            asio::buffer(buffer_), sender_,
            [this](const std::error_code &ec, std::size_t size)
            {
                if (ec == asio::error::operation_aborted || !socket_.is_open())
                {
                    return;
                }
                if (!ec && discovery::is_query(std::string_view(buffer_.data(), size)))
                {
                    std::error_code send_ec;
                    socket_.send_to(asio::buffer(encoded_), sender_, 0, send_ec);
                    if (send_ec)
                    {
                        spdlog::debug("Announcement to {} failed: {}", sender_.address().to_string(), send_ec.message());
                    }
                }
                receive_next();
            });
    }

} // namespace capydeploy::agent
