#include "cobskit/tool/commands.hpp"

#include <array>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "cobskit/cobs.hpp"
#include "cobskit/cobsr.hpp"
#include "cobskit/version.hpp"

namespace cobskit::tool
{

    namespace
    {
        constexpr std::size_t kReadChunkSize = 4096;

        std::vector<std::uint8_t> read_all(std::istream &input)
        {
            std::vector<std::uint8_t> data;
            std::array<char, kReadChunkSize> chunk{};
            while (input.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || input.gcount() > 0)
            {
                const auto count = static_cast<std::size_t>(input.gcount());
                data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(count));
            }
            return data;
        }

        void write_bytes(std::ostream &output, std::span<const std::uint8_t> data)
        {
            output.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        }

        template <typename Sequence>
        std::size_t drain_to(Sequence &sequence, std::ostream &output)
        {
            std::size_t written = 0;
            std::ostreambuf_iterator<char> out(output);
            for (const auto byte : sequence)
            {
                *out++ = static_cast<char>(byte);
                ++written;
            }
            return written;
        }

        nlohmann::json bounds_for(std::size_t input_len, framing::Scheme scheme)
        {
            if (scheme == framing::Scheme::CobsR)
            {
                return {
                    {"encode_min", cobsr::encode_min_output_size(input_len)},
                    {"encode_max", cobsr::encode_max_output_size(input_len)},
                    {"decode_min", cobsr::decode_min_output_size(input_len)},
                    {"decode_max", cobsr::decode_max_output_size(input_len)},
                };
            }
            return {
                {"encode_min", cobs::encode_min_output_size(input_len)},
                {"encode_max", cobs::encode_max_output_size(input_len)},
                {"decode_min", cobs::decode_min_output_size(input_len)},
                {"decode_max", cobs::decode_max_output_size(input_len)},
            };
        }

        // An encoded frame only bounds its decoded size.
        nlohmann::json decode_bounds_for(std::size_t encoded_len, framing::Scheme scheme)
        {
            const auto bounds = bounds_for(encoded_len, scheme);
            return {
                {"decode_min", bounds["decode_min"]},
                {"decode_max", bounds["decode_max"]},
            };
        }
    } // namespace

    std::size_t encode_stream(std::istream &input, std::ostream &output, framing::Scheme scheme,
                              bool append_delimiter)
    {
        std::istreambuf_iterator<char> first(input);
        std::istreambuf_iterator<char> last;
        std::size_t written = 0;
        if (scheme == framing::Scheme::CobsR)
        {
            auto encoder = cobsr::lazy_encode(first, last);
            written = drain_to(encoder, output);
        }
        else
        {
            auto encoder = cobs::lazy_encode(first, last);
            written = drain_to(encoder, output);
        }
        if (append_delimiter)
        {
            output.put(static_cast<char>(kFrameDelimiter));
            ++written;
        }
        spdlog::debug("Encoded {} bytes with {}", written, framing::to_string(scheme));
        return written;
    }

    std::size_t decode_stream(std::istream &input, std::ostream &output, framing::Scheme scheme)
    {
        auto encoded = read_all(input);
        if (!encoded.empty() && encoded.back() == kFrameDelimiter)
        {
            encoded.pop_back();
        }
        const auto decoded = framing::decode_payload(encoded, scheme);
        write_bytes(output, decoded);
        spdlog::debug("Decoded {} bytes into {} bytes with {}", encoded.size(), decoded.size(),
                      framing::to_string(scheme));
        return decoded.size();
    }

    UnframeSummary unframe_stream(std::istream &input, std::ostream &output, framing::Scheme scheme,
                                  std::size_t max_frame_size)
    {
        framing::FrameReader reader(scheme, max_frame_size, spdlog::default_logger());
        UnframeSummary summary{};
        std::array<char, kReadChunkSize> chunk{};
        while (input.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || input.gcount() > 0)
        {
            const auto count = static_cast<std::size_t>(input.gcount());
            reader.feed(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(chunk.data()), count));
            while (auto payload = reader.next_frame())
            {
                write_bytes(output, *payload);
                summary.payload_bytes += payload->size();
            }
        }
        if (reader.pending_bytes() > 0)
        {
            spdlog::warn("Ignoring {} trailing bytes without a frame delimiter", reader.pending_bytes());
        }
        summary.frames = reader.frames_read();
        summary.dropped = reader.dropped_frames();
        spdlog::info("Unframed {} frames ({} bytes), dropped {}", summary.frames, summary.payload_bytes,
                     summary.dropped);
        return summary;
    }

    nlohmann::json inspect_stream(std::istream &input, framing::Scheme scheme)
    {
        const auto data = read_all(input);
        auto remaining = std::span<const std::uint8_t>(data);

        nlohmann::json frames = nlohmann::json::array();
        std::size_t malformed = 0;
        std::size_t index = 0;
        while (const auto frame = framing::try_decode_frame(remaining, scheme))
        {
            const auto encoded_size = frame->bytes_consumed - 1;
            remaining = remaining.subspan(frame->bytes_consumed);
            if (encoded_size == 0)
            {
                continue;
            }
            if (frame->error != ErrorCode::Ok)
            {
                ++malformed;
            }
            nlohmann::json entry = {
                {"index", index++},
                {"encoded_size", encoded_size},
                {"decoded_size", frame->payload.size()},
                {"error", std::string(cobskit::to_string(frame->error))},
                {"bounds", decode_bounds_for(encoded_size, scheme)},
            };
            frames.push_back(std::move(entry));
        }

        return {
            {"scheme", std::string(framing::to_string(scheme))},
            {"frames", std::move(frames)},
            {"total_frames", index},
            {"malformed_frames", malformed},
            {"trailing_bytes", remaining.size()},
        };
    }

    nlohmann::json size_bounds_report(std::size_t input_len)
    {
        return {
            {"length", input_len},
            {"cobs", bounds_for(input_len, framing::Scheme::Cobs)},
            {"cobsr", bounds_for(input_len, framing::Scheme::CobsR)},
        };
    }

    int run_command(const ToolConfig &config, std::istream &input, std::ostream &output)
    {
        switch (config.command)
        {
        case Command::Encode:
            encode_stream(input, output, config.scheme, config.frame);
            break;
        case Command::Decode:
            decode_stream(input, output, config.scheme);
            break;
        case Command::Unframe:
        {
            const auto summary = unframe_stream(input, output, config.scheme, config.max_frame_size);
            return summary.dropped == 0 ? 0 : 2;
        }
        case Command::Inspect:
            output << inspect_stream(input, config.scheme).dump(2) << '\n';
            break;
        case Command::Bounds:
            output << size_bounds_report(config.bounds_length).dump(2) << '\n';
            break;
        case Command::Version:
            output << "cobskit " << version() << '\n';
            break;
        case Command::Help:
            output << usage("cobskit");
            break;
        }
        output.flush();
        return 0;
    }

} // namespace cobskit::tool
