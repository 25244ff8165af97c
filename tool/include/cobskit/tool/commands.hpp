#pragma once

#include <cstddef>
#include <istream>
#include <ostream>

#include <nlohmann/json.hpp>

#include "cobskit/framing.hpp"
#include "cobskit/tool/config.hpp"

namespace cobskit::tool
{

    // Streams input through the lazy encoder; with append_delimiter a zero byte closes the frame.
    std::size_t encode_stream(std::istream &input, std::ostream &output, framing::Scheme scheme,
                              bool append_delimiter);

    // Decodes the whole input as one frame. A single trailing delimiter is ignored.
    std::size_t decode_stream(std::istream &input, std::ostream &output, framing::Scheme scheme);

    struct UnframeSummary
    {
        std::size_t frames{};
        std::size_t dropped{};
        std::size_t payload_bytes{};
    };

    UnframeSummary unframe_stream(std::istream &input, std::ostream &output, framing::Scheme scheme,
                                  std::size_t max_frame_size);

    nlohmann::json inspect_stream(std::istream &input, framing::Scheme scheme);

    nlohmann::json size_bounds_report(std::size_t input_len);

    // Runs the configured command. Throws on failure.
    int run_command(const ToolConfig &config, std::istream &input, std::ostream &output);

} // namespace cobskit::tool
