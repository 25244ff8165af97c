#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cobskit/framing.hpp"

namespace cobskit::tool
{

    enum class Command : std::uint8_t
    {
        Encode,
        Decode,
        Unframe,
        Inspect,
        Bounds,
        Version,
        Help
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    struct ToolConfig
    {
        Command command{Command::Help};
        framing::Scheme scheme{framing::Scheme::Cobs};
        bool frame{};
        std::optional<std::filesystem::path> input_path;
        std::optional<std::filesystem::path> output_path;
        std::optional<std::filesystem::path> log_path;
        std::size_t max_frame_size{framing::kDefaultMaxFrameSize};
        std::size_t bounds_length{};
        bool verbose{};
    };

    std::string usage(std::string_view program_name);

    ToolConfig parse_arguments(int argc, char *argv[]);

} // namespace cobskit::tool
