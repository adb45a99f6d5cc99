#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capydeploy::hub
{

    struct ScanResult
    {
        std::string address;
        std::optional<std::string> hostname;
        std::uint16_t port{};
    };

    using Prober = std::function<bool(const std::string &address, std::uint16_t port, std::chrono::milliseconds timeout)>;

    // TCP connect probe bounded by `timeout`.
    bool tcp_probe(const std::string &address, std::uint16_t port, std::chrono::milliseconds timeout);

    std::optional<std::string> reverse_lookup(const std::string &address);

    // First non-loopback IPv4 interface address.
    std::optional<std::string> local_ipv4();

    // "192.168.1.23" -> "192.168.1"; std::nullopt for anything else.
    std::optional<std::string> subnet_base(std::string_view ipv4);

    // Brute-force probe of a /24 for listening Agents. Results are an operator
    // list only; they do not feed the discovery registry.
    class NetworkScanner
    {
    public:
        static constexpr std::size_t kDefaultMaxConcurrent = 50;
        static constexpr std::chrono::milliseconds kDefaultProbeTimeout{500};

        explicit NetworkScanner(std::size_t max_concurrent = kDefaultMaxConcurrent, Prober prober = tcp_probe,
                                bool resolve_names = true);

        // Probes base.1 .. base.254; results are ordered by address.
        std::vector<ScanResult> scan(std::string_view base, std::uint16_t port,
                                     std::chrono::milliseconds probe_timeout = kDefaultProbeTimeout,
                                     const std::function<bool()> &cancelled = {});

        // Highest number of probes observed in flight during the last scan.
        std::size_t peak_concurrency() const noexcept { return peak_; }

    private:
        std::size_t max_concurrent_;
        Prober prober_;
        bool resolve_names_;
        std::size_t peak_{0};
    };

} // namespace capydeploy::hub
