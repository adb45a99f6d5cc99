#include "capydeploy/hub/network_scanner.hpp"

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <mutex>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

#include <spdlog/spdlog.h>

namespace capydeploy::hub
{

    bool tcp_probe(const std::string &address, std::uint16_t port, std::chrono::milliseconds timeout)
    {
        std::error_code ec;
        const auto ip = asio::ip::make_address(address, ec);
        if (ec)
        {
            return false;
        }

        asio::io_context io_context;
        asio::ip::tcp::socket socket(io_context);
        std::optional<std::error_code> result;
        socket.async_connect(asio::ip::tcp::endpoint(ip, port), [&](const std::error_code &connect_ec)
                             { result = connect_ec; });
        io_context.run_for(timeout);
        if (!result)
        {
            socket.close(ec);
            io_context.restart();
            io_context.run();
            return false;
        }
        return !*result;
    }

    std::optional<std::string> reverse_lookup(const std::string &address)
    {
        std::error_code ec;
        const auto ip = asio::ip::make_address(address, ec);
        if (ec)
        {
            return std::nullopt;
        }
        asio::io_context io_context;
        asio::ip::tcp::resolver resolver(io_context);
        const auto results = resolver.resolve(asio::ip::tcp::endpoint(ip, 0), ec);
        if (ec || results.empty())
        {
            return std::nullopt;
        }
        auto name = results.begin()->host_name();
        if (name.empty() || name == address)
        {
            return std::nullopt;
        }
        return name;
    }

    std::optional<std::string> local_ipv4()
    {
        ifaddrs *interfaces = nullptr;
        if (::getifaddrs(&interfaces) != 0)
        {
            return std::nullopt;
        }
        std::optional<std::string> found;
        for (auto *item = interfaces; item != nullptr && !found; item = item->ifa_next)
        {
            if (item->ifa_addr == nullptr || item->ifa_addr->sa_family != AF_INET)
            {
                continue;
            }
            const auto *in = reinterpret_cast<const sockaddr_in *>(item->ifa_addr);
            const auto ip = asio::ip::address_v4(ntohl(in->sin_addr.s_addr));
            if (!ip.is_loopback())
            {
                found = ip.to_string();
            }
        }
        ::freeifaddrs(interfaces);
        return found;
    }

    std::optional<std::string> subnet_base(std::string_view ipv4)
    {
        std::error_code ec;
        const auto ip = asio::ip::make_address_v4(std::string(ipv4), ec);
        if (ec)
        {
            return std::nullopt;
        }
        const auto text = ip.to_string();
        return text.substr(0, text.rfind('.'));
    }

    NetworkScanner::NetworkScanner(std::size_t max_concurrent, Prober prober, bool resolve_names)
        : max_concurrent_(max_concurrent == 0 ? 1 : max_concurrent),
          prober_(std::move(prober)),
          resolve_names_(resolve_names)
    {
    }

    std::vector<ScanResult> NetworkScanner::scan(std::string_view base, std::uint16_t port,
                                                 std::chrono::milliseconds probe_timeout,
                                                 const std::function<bool()> &cancelled)
    {
        std::mutex results_mutex;
        std::vector<std::pair<int, ScanResult>> hits;
        std::atomic<std::size_t> in_flight{0};
        std::atomic<std::size_t> peak{0};

        // The pool size is the admission gate; excess probes wait in its queue.
        asio::thread_pool gate(max_concurrent_);
        for (int host = 1; host <= 254; ++host)
        {
            asio::post(gate, [&, host]
                       {
                if (cancelled && cancelled())
                {
                    return;
                }
                const auto current = ++in_flight;
                auto observed = peak.load();
                while (current > observed && !peak.compare_exchange_weak(observed, current))
                {
                }

                const auto address = std::string(base) + "." + std::to_string(host);
                const bool open = prober_(address, port, probe_timeout);
                --in_flight;
                if (!open)
                {
                    return;
                }
                ScanResult result{.address = address, .port = port};
                if (resolve_names_)
                {
                    result.hostname = reverse_lookup(address);
                }
                std::lock_guard lock(results_mutex);
                hits.emplace_back(host, std::move(result)); });
        }
        gate.join();

        peak_ = peak.load();
        std::sort(hits.begin(), hits.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.first < rhs.first; });
        std::vector<ScanResult> results;
        results.reserve(hits.size());
        for (auto &[host, result] : hits)
        {
            results.push_back(std::move(result));
        }
        spdlog::info("Scan of {}.0/24 found {} agent(s)", base, results.size());
        return results;
    }

} // namespace capydeploy::hub
