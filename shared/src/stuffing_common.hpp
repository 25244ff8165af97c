#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "cobskit/error_codes.hpp"
#include "cobskit/stuffing.hpp"

namespace cobskit::detail
{

    // Fixed caller buffer. Every index is checked before it is written.
    class SpanWriter
    {
    public:
        explicit SpanWriter(std::span<std::uint8_t> output) : output_(output) {}

        void claim(std::size_t index) const
        {
            if (index >= output_.size())
            {
                throw CodecError(ErrorCode::OutputBufferTooSmall);
            }
        }

        std::uint8_t &operator[](std::size_t index) { return output_[index]; }

        std::span<std::uint8_t> finish(std::size_t length) const { return output_.first(length); }

    private:
        std::span<std::uint8_t> output_;
    };

    // Growable buffer. Claiming an index past the end extends the vector.
    class VectorWriter
    {
    public:
        explicit VectorWriter(std::size_t capacity_hint) { output_.reserve(capacity_hint); }

        void claim(std::size_t index)
        {
            if (index >= output_.size())
            {
                output_.resize(index + 1);
            }
        }

        std::uint8_t &operator[](std::size_t index) { return output_[index]; }

        std::vector<std::uint8_t> finish(std::size_t length)
        {
            output_.resize(length);
            return std::move(output_);
        }

    private:
        std::vector<std::uint8_t> output_;
    };

    template <typename Writer>
    std::size_t encode_runs(Writer &out, std::span<const std::uint8_t> input, Variant variant)
    {
        std::size_t code_pos = 0;
        std::size_t write_pos = 1;
        std::uint8_t last_value = 0;

        out.claim(code_pos);
        for (const auto byte : input)
        {
            if (write_pos - code_pos == kMaxCode)
            {
                out[code_pos] = kMaxCode;
                code_pos = write_pos;
                out.claim(code_pos);
                write_pos = code_pos + 1;
            }
            if (byte == 0)
            {
                out[code_pos] = static_cast<std::uint8_t>(write_pos - code_pos);
                code_pos = write_pos;
                out.claim(code_pos);
                write_pos = code_pos + 1;
                last_value = 0;
            }
            else
            {
                out.claim(write_pos);
                out[write_pos] = byte;
                ++write_pos;
                last_value = byte;
            }
        }

        // The trailing code is always present, even for empty input.
        const auto code = static_cast<std::uint8_t>(write_pos - code_pos);
        if (variant == Variant::Reduced && last_value >= code)
        {
            out[code_pos] = last_value;
            --write_pos;
        }
        else
        {
            out[code_pos] = code;
        }
        return write_pos;
    }

    template <typename Writer>
    std::size_t decode_runs(Writer &out, std::span<const std::uint8_t> input, Variant variant)
    {
        std::size_t code_pos = 0;
        std::size_t write_pos = 0;

        while (code_pos < input.size())
        {
            const auto code = input[code_pos];
            if (code == 0)
            {
                throw CodecError(ErrorCode::ZeroInEncodedData);
            }
            const auto run_end = code_pos + code;
            for (auto read_pos = code_pos + 1; read_pos < run_end; ++read_pos)
            {
                // COBS/R reports a full output buffer ahead of anything wrong with the input.
                if (variant == Variant::Reduced)
                {
                    out.claim(write_pos);
                }
                if (read_pos >= input.size())
                {
                    if (variant == Variant::Standard)
                    {
                        throw CodecError(ErrorCode::TruncatedEncodedData);
                    }
                    // COBS/R: the over-long final code stands in for the last data byte.
                    out.claim(write_pos);
                    out[write_pos++] = code;
                    break;
                }
                const auto byte = input[read_pos];
                if (byte == 0)
                {
                    throw CodecError(ErrorCode::ZeroInEncodedData);
                }
                out.claim(write_pos);
                out[write_pos++] = byte;
            }
            code_pos = run_end;
            if (code_pos >= input.size())
            {
                break;
            }
            if (code < kMaxCode)
            {
                out.claim(write_pos);
                out[write_pos++] = 0;
            }
        }
        return write_pos;
    }

} // namespace cobskit::detail
