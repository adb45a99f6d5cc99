#include "capydeploy/framing.hpp"

#include <algorithm>
#include <string>

#include "capydeploy/protocol_error.hpp"

namespace capydeploy::protocol
{

    namespace
    {
        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        nlohmann::json parse_payload_text(const std::string &text)
        {
            try
            {
                return nlohmann::json::parse(text);
            }
            catch (const nlohmann::json::parse_error &)
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "frame does not contain valid JSON",
                                    std::current_exception());
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > kMaxFrameSize)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header)
    {
        const auto size = (static_cast<std::uint32_t>(header[0]) << 24) |
                          (static_cast<std::uint32_t>(header[1]) << 16) |
                          (static_cast<std::uint32_t>(header[2]) << 8) |
                          static_cast<std::uint32_t>(header[3]);
        if (size > kMaxFrameSize)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "frame exceeds maximum size");
        }
        return size;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = decode_frame_length(buffer.first<kFrameHeaderSize>());
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        return DecodedFrame{
            .message = parse_payload_text(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

} // namespace capydeploy::protocol
