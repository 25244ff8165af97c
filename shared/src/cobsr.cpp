#include "cobskit/cobsr.hpp"

#include "stuffing_common.hpp"

namespace cobskit::cobsr
{

    std::span<std::uint8_t> encode_into(std::span<std::uint8_t> output, std::span<const std::uint8_t> input)
    {
        detail::SpanWriter writer(output);
        const auto length = detail::encode_runs(writer, input, Variant::Reduced);
        return writer.finish(length);
    }

    std::vector<std::uint8_t> encode(std::span<const std::uint8_t> input)
    {
        detail::VectorWriter writer(encode_max_output_size(input.size()));
        const auto length = detail::encode_runs(writer, input, Variant::Reduced);
        return writer.finish(length);
    }

    std::span<std::uint8_t> decode_into(std::span<std::uint8_t> output, std::span<const std::uint8_t> input)
    {
        detail::SpanWriter writer(output);
        const auto length = detail::decode_runs(writer, input, Variant::Reduced);
        return writer.finish(length);
    }

    std::vector<std::uint8_t> decode(std::span<const std::uint8_t> input)
    {
        detail::VectorWriter writer(decode_max_output_size(input.size()));
        const auto length = detail::decode_runs(writer, input, Variant::Reduced);
        return writer.finish(length);
    }

} // namespace cobskit::cobsr
