/**
 * cobskit - Consistent Overhead Byte Stuffing (COBS).
 *
 * Encoded output never contains a zero byte, so a zero can delimit frames in a byte stream.
 * Encoding always costs at least one byte of overhead, and at most one byte per 254 bytes of
 * input.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <span>
#include <utility>
#include <vector>

#include "cobskit/lazy.hpp"
#include "cobskit/stuffing.hpp"

namespace cobskit::cobs
{

    constexpr std::size_t encode_min_output_size(std::size_t input_len) noexcept
    {
        constexpr auto kMax = std::numeric_limits<std::size_t>::max();
        if (input_len >= kMax - 1)
        {
            return kMax;
        }
        return input_len + 1;
    }

    constexpr std::size_t encode_max_output_size(std::size_t input_len) noexcept
    {
        constexpr auto kMax = std::numeric_limits<std::size_t>::max();
        if (input_len == 0)
        {
            return 1;
        }
        if (input_len >= kMax - (kMaxRunLength - 1))
        {
            return kMax;
        }
        const auto increase = (input_len + kMaxRunLength - 1) / kMaxRunLength;
        if (input_len >= kMax - increase)
        {
            return kMax;
        }
        return input_len + increase;
    }

    constexpr std::size_t decode_min_output_size(std::size_t input_len) noexcept
    {
        if (input_len == 0)
        {
            return 0;
        }
        return input_len - 1 - (input_len - 1) / kMaxCode;
    }

    constexpr std::size_t decode_max_output_size(std::size_t input_len) noexcept
    {
        return input_len > 1 ? input_len - 1 : 0;
    }

    /**
     * Encodes input into output and returns the written prefix of output.
     * Throws CodecError(OutputBufferTooSmall) as soon as a write would not fit;
     * encode_max_output_size() gives a size that always fits.
     */
    std::span<std::uint8_t> encode_into(std::span<std::uint8_t> output, std::span<const std::uint8_t> input);

    std::vector<std::uint8_t> encode(std::span<const std::uint8_t> input);

    /**
     * Decodes input into output and returns the written prefix of output.
     * Throws CodecError with OutputBufferTooSmall, ZeroInEncodedData or TruncatedEncodedData.
     */
    std::span<std::uint8_t> decode_into(std::span<std::uint8_t> output, std::span<const std::uint8_t> input);

    std::vector<std::uint8_t> decode(std::span<const std::uint8_t> input);

    template <typename InputIt, typename Sentinel = InputIt>
    using Encoder = BasicEncoder<Variant::Standard, InputIt, Sentinel>;

    template <typename InputIt, typename Sentinel = InputIt>
    using Decoder = BasicDecoder<Variant::Standard, InputIt, Sentinel>;

    template <typename InputIt, typename Sentinel = InputIt>
    using CheckedDecoder = BasicCheckedDecoder<Variant::Standard, InputIt, Sentinel>;

    template <typename InputIt, typename Sentinel>
    Encoder<InputIt, Sentinel> lazy_encode(InputIt first, Sentinel last)
    {
        return Encoder<InputIt, Sentinel>(std::move(first), std::move(last));
    }

    template <typename Range>
    auto lazy_encode(Range &range)
    {
        return lazy_encode(std::begin(range), std::end(range));
    }

    template <typename InputIt, typename Sentinel>
    Decoder<InputIt, Sentinel> lazy_decode(InputIt first, Sentinel last)
    {
        return Decoder<InputIt, Sentinel>(std::move(first), std::move(last));
    }

    template <typename Range>
    auto lazy_decode(Range &range)
    {
        return lazy_decode(std::begin(range), std::end(range));
    }

    template <typename InputIt, typename Sentinel>
    CheckedDecoder<InputIt, Sentinel> lazy_decode_checked(InputIt first, Sentinel last)
    {
        return CheckedDecoder<InputIt, Sentinel>(std::move(first), std::move(last));
    }

    template <typename Range>
    auto lazy_decode_checked(Range &range)
    {
        return lazy_decode_checked(std::begin(range), std::end(range));
    }

} // namespace cobskit::cobs
