/**
 * CapyDeploy - Length-prefixed JSON framing for the Hub <-> Agent channel.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace capydeploy::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    constexpr std::uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Payload length announced by a frame header. Throws INVALID_REQUEST when
    // the announced size exceeds kMaxFrameSize.
    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace capydeploy::protocol
