#include "cobskit/framing.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include <spdlog/sinks/null_sink.h>

#include "cobskit/cobs.hpp"
#include "cobskit/cobsr.hpp"
#include "cobskit/stuffing.hpp"

namespace cobskit::framing
{

    std::string_view to_string(Scheme scheme) noexcept
    {
        switch (scheme)
        {
        case Scheme::Cobs:
            return "cobs";
        case Scheme::CobsR:
            return "cobsr";
        }
        return "unknown";
    }

    std::vector<std::uint8_t> encode_payload(std::span<const std::uint8_t> payload, Scheme scheme)
    {
        return scheme == Scheme::CobsR ? cobsr::encode(payload) : cobs::encode(payload);
    }

    std::vector<std::uint8_t> decode_payload(std::span<const std::uint8_t> encoded, Scheme scheme)
    {
        return scheme == Scheme::CobsR ? cobsr::decode(encoded) : cobs::decode(encoded);
    }

    std::vector<std::uint8_t> encode_frame(std::span<const std::uint8_t> payload, Scheme scheme)
    {
        auto frame = encode_payload(payload, scheme);
        frame.push_back(kFrameDelimiter);
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, Scheme scheme)
    {
        const auto delimiter = std::find(buffer.begin(), buffer.end(), kFrameDelimiter);
        if (delimiter == buffer.end())
        {
            return std::nullopt;
        }
        const auto frame_size = static_cast<std::size_t>(delimiter - buffer.begin());
        DecodedFrame result{.bytes_consumed = frame_size + 1};
        try
        {
            result.payload = decode_payload(buffer.first(frame_size), scheme);
        }
        catch (const CodecError &ex)
        {
            result.error = ex.code();
        }
        return result;
    }

    FrameReader::FrameReader(Scheme scheme, std::size_t max_frame_size, std::shared_ptr<spdlog::logger> logger)
        : scheme_(scheme), max_frame_size_(max_frame_size), logger_(std::move(logger))
    {
        if (!logger_)
        {
            logger_ = std::make_shared<spdlog::logger>("framing", std::make_shared<spdlog::sinks::null_sink_mt>());
        }
    }

    void FrameReader::feed(std::span<const std::uint8_t> data)
    {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    std::optional<std::vector<std::uint8_t>> FrameReader::next_frame()
    {
        for (;;)
        {
            const auto delimiter = std::find(buffer_.begin() + static_cast<std::ptrdiff_t>(scan_pos_), buffer_.end(),
                                             kFrameDelimiter);
            if (delimiter == buffer_.end())
            {
                scan_pos_ = buffer_.size();
                if (discarding_)
                {
                    skip_to(buffer_.size());
                }
                else if (pending_bytes() > max_frame_size_)
                {
                    logger_->warn("Discarding {} bytes with no frame delimiter (limit {})", pending_bytes(),
                                  max_frame_size_);
                    ++dropped_frames_;
                    discarding_ = true;
                    skip_to(buffer_.size());
                }
                compact();
                return std::nullopt;
            }

            const auto delimiter_pos = static_cast<std::size_t>(delimiter - buffer_.begin());
            const auto frame_size = delimiter_pos - read_pos_;
            const auto frame = std::span<const std::uint8_t>(buffer_).subspan(read_pos_, frame_size);
            if (discarding_)
            {
                discarding_ = false;
                skip_to(delimiter_pos + 1);
                continue;
            }
            if (frame_size == 0)
            {
                // Back-to-back delimiters carry no frame.
                skip_to(delimiter_pos + 1);
                continue;
            }
            if (frame_size > max_frame_size_)
            {
                ++dropped_frames_;
                logger_->warn("Dropping {} byte {} frame: over the {} byte limit", frame_size, to_string(scheme_),
                              max_frame_size_);
                skip_to(delimiter_pos + 1);
                continue;
            }

            std::vector<std::uint8_t> payload;
            try
            {
                payload = decode_payload(frame, scheme_);
            }
            catch (const CodecError &ex)
            {
                ++dropped_frames_;
                logger_->warn("Dropping {} byte {} frame: {}", frame_size, to_string(scheme_),
                              cobskit::to_string(ex.code()));
                skip_to(delimiter_pos + 1);
                continue;
            }
            ++frames_read_;
            skip_to(delimiter_pos + 1);
            compact();
            return payload;
        }
    }

    void FrameReader::skip_to(std::size_t position)
    {
        read_pos_ = position;
        scan_pos_ = position;
    }

    void FrameReader::compact()
    {
        if (read_pos_ == buffer_.size())
        {
            buffer_.clear();
            skip_to(0);
        }
        else if (read_pos_ > buffer_.size() / 2)
        {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
            scan_pos_ -= read_pos_;
            read_pos_ = 0;
        }
    }

} // namespace cobskit::framing
