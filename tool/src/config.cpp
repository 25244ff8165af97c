#include "cobskit/tool/config.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace cobskit::tool
{

    namespace
    {
        struct CommandName
        {
            Command command;
            std::string_view name;
        };

        constexpr std::array<CommandName, 7> kCommandNames{{
            {Command::Encode, "encode"},
            {Command::Decode, "decode"},
            {Command::Unframe, "unframe"},
            {Command::Inspect, "inspect"},
            {Command::Bounds, "bounds"},
            {Command::Version, "version"},
            {Command::Help, "help"},
        }};

        std::size_t parse_size(const std::string &option, const std::string &value)
        {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
            {
                throw std::runtime_error(option + " expects a non-negative integer, got '" + value + "'");
            }
            try
            {
                return static_cast<std::size_t>(std::stoull(value));
            }
            catch (const std::out_of_range &)
            {
                throw std::runtime_error(option + " value is out of range: " + value);
            }
        }
    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &entry : kCommandNames)
        {
            if (entry.command == command)
            {
                return entry.name;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kCommandNames)
        {
            if (entry.name == value)
            {
                return entry.command;
            }
        }
        return std::nullopt;
    }

    std::string usage(std::string_view program_name)
    {
        std::string text = "Usage: ";
        text += program_name;
        text += " <encode|decode|unframe|inspect|bounds N|version|help> [--reduced] [--frame] [--input <FILE>] "
                "[--output <FILE>] [--max-frame <BYTES>] [--log <FILE>] [--verbose]\n";
        return text;
    }

    ToolConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage(argc > 0 ? argv[0] : "cobskit"));
        }

        ToolConfig config;
        int index = 1;
        const std::string command_name = argv[index++];
        if (command_name == "--help" || command_name == "-h")
        {
            config.command = Command::Help;
            return config;
        }
        const auto command = command_from_string(command_name);
        if (!command)
        {
            throw std::runtime_error("Unknown command: " + command_name);
        }
        config.command = *command;

        if (config.command == Command::Bounds)
        {
            if (index >= argc)
            {
                throw std::runtime_error("bounds requires an input length");
            }
            config.bounds_length = parse_size("bounds", argv[index++]);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--reduced")
            {
                config.scheme = framing::Scheme::CobsR;
            }
            else if (arg == "--frame")
            {
                config.frame = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
            }
            else if (arg == "--input" || arg == "--output" || arg == "--log" || arg == "--max-frame")
            {
                if (index >= argc)
                {
                    throw std::runtime_error(arg + " requires a value");
                }
                const std::string value = argv[index++];
                if (arg == "--input")
                {
                    config.input_path = std::filesystem::path(value);
                }
                else if (arg == "--output")
                {
                    config.output_path = std::filesystem::path(value);
                }
                else if (arg == "--log")
                {
                    config.log_path = std::filesystem::path(value);
                }
                else
                {
                    config.max_frame_size = parse_size(arg, value);
                    if (config.max_frame_size == 0)
                    {
                        throw std::runtime_error("--max-frame must be greater than zero");
                    }
                }
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace cobskit::tool
