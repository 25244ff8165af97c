/**
 * cobskit - Zero-delimited framing helpers built on the COBS codecs.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "cobskit/error_codes.hpp"

namespace cobskit::framing
{

    enum class Scheme : std::uint8_t
    {
        Cobs,
        CobsR
    };

    std::string_view to_string(Scheme scheme) noexcept;

    inline constexpr std::size_t kDefaultMaxFrameSize = 64 * 1024;

    std::vector<std::uint8_t> encode_payload(std::span<const std::uint8_t> payload, Scheme scheme);

    std::vector<std::uint8_t> decode_payload(std::span<const std::uint8_t> encoded, Scheme scheme);

    struct DecodedFrame
    {
        std::vector<std::uint8_t> payload;
        std::size_t bytes_consumed{};
        ErrorCode error{ErrorCode::Ok};
    };

    // Encoded payload followed by the zero delimiter.
    std::vector<std::uint8_t> encode_frame(std::span<const std::uint8_t> payload, Scheme scheme);

    // Decodes the bytes before the first delimiter. bytes_consumed includes the delimiter.
    // Returns std::nullopt while no delimiter has arrived.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, Scheme scheme);

    /**
     * Splits a byte stream into frames. Malformed frames and frames whose encoded size exceeds
     * max_frame_size are dropped with a warning on logger, and reading resumes after the next
     * delimiter. Pending data that grows past max_frame_size is discarded up to the next
     * delimiter. Without a logger, warnings go to a null sink.
     */
    class FrameReader
    {
    public:
        explicit FrameReader(Scheme scheme, std::size_t max_frame_size = kDefaultMaxFrameSize,
                             std::shared_ptr<spdlog::logger> logger = nullptr);

        void feed(std::span<const std::uint8_t> data);

        std::optional<std::vector<std::uint8_t>> next_frame();

        std::size_t frames_read() const noexcept { return frames_read_; }
        std::size_t dropped_frames() const noexcept { return dropped_frames_; }
        std::size_t pending_bytes() const noexcept { return buffer_.size() - read_pos_; }

    private:
        void skip_to(std::size_t position);
        void compact();

        Scheme scheme_;
        std::size_t max_frame_size_;
        std::shared_ptr<spdlog::logger> logger_;
        std::vector<std::uint8_t> buffer_;
        std::size_t read_pos_{0};
        // Bytes before scan_pos_ are known to hold no delimiter.
        std::size_t scan_pos_{0};
        bool discarding_{false};
        std::size_t frames_read_{0};
        std::size_t dropped_frames_{0};
    };

} // namespace cobskit::framing
