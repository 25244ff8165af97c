/**
 * cobskit - COBS/R, the reduced variant of COBS.
 *
 * When the final data byte is at least as large as the final length code would be, the encoder
 * writes that byte in place of the length code and drops it from the end, saving the usual byte
 * of overhead. The decoder recognises this because the final code then claims more bytes than
 * remain. Plain COBS input decodes unchanged.
 *
 *   input              2F A2 00 92 73 26
 *   COBS               03 2F A2 04 92 73 26
 *   COBS/R             03 2F A2 26 92 73
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <utility>
#include <vector>

#include "cobskit/cobs.hpp"
#include "cobskit/lazy.hpp"
#include "cobskit/stuffing.hpp"

namespace cobskit::cobsr
{

    constexpr std::size_t encode_min_output_size(std::size_t input_len) noexcept
    {
        return input_len == 0 ? 1 : input_len;
    }

    constexpr std::size_t encode_max_output_size(std::size_t input_len) noexcept
    {
        return cobs::encode_max_output_size(input_len);
    }

    constexpr std::size_t decode_min_output_size(std::size_t input_len) noexcept
    {
        return cobs::decode_min_output_size(input_len);
    }

    constexpr std::size_t decode_max_output_size(std::size_t input_len) noexcept
    {
        return input_len;
    }

    std::span<std::uint8_t> encode_into(std::span<std::uint8_t> output, std::span<const std::uint8_t> input);

    std::vector<std::uint8_t> encode(std::span<const std::uint8_t> input);

    // Throws CodecError with OutputBufferTooSmall or ZeroInEncodedData. Never reports truncation.
    std::span<std::uint8_t> decode_into(std::span<std::uint8_t> output, std::span<const std::uint8_t> input);

    std::vector<std::uint8_t> decode(std::span<const std::uint8_t> input);

    template <typename InputIt, typename Sentinel = InputIt>
    using Encoder = BasicEncoder<Variant::Reduced, InputIt, Sentinel>;

    template <typename InputIt, typename Sentinel = InputIt>
    using Decoder = BasicDecoder<Variant::Reduced, InputIt, Sentinel>;

    template <typename InputIt, typename Sentinel = InputIt>
    using CheckedDecoder = BasicCheckedDecoder<Variant::Reduced, InputIt, Sentinel>;

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

} // namespace cobskit::cobsr
