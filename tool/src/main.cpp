#include <cstdlib>
#include <fstream>
#include <iostream>
#include <istream>
#include <ostream>
#include <stdexcept>

#include "cobskit/tool/commands.hpp"
#include "cobskit/tool/config.hpp"
#include "cobskit/tool/logging.hpp"
#include "cobskit/version.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using cobskit::tool::Command;
    using cobskit::tool::ToolConfig;

    ToolConfig config;
    try
    {
        config = cobskit::tool::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << cobskit::tool::usage(argc > 0 ? argv[0] : "cobskit");
        return EXIT_FAILURE;
    }

    if (config.command == Command::Help)
    {
        std::cout << "cobskit " << cobskit::version() << "\n" << cobskit::tool::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        cobskit::tool::configure_logging(config.log_path, config.verbose);
        spdlog::debug("Running {} with {}", cobskit::tool::to_string(config.command),
                      cobskit::framing::to_string(config.scheme));

        std::ifstream input_file;
        if (config.input_path)
        {
            input_file.open(*config.input_path, std::ios::binary);
            if (!input_file)
            {
                throw std::runtime_error("Cannot open input file: " + config.input_path->string());
            }
        }
        std::ofstream output_file;
        if (config.output_path)
        {
            output_file.open(*config.output_path, std::ios::binary | std::ios::trunc);
            if (!output_file)
            {
                throw std::runtime_error("Cannot open output file: " + config.output_path->string());
            }
        }
        std::istream &input = config.input_path ? static_cast<std::istream &>(input_file) : std::cin;
        std::ostream &output = config.output_path ? static_cast<std::ostream &>(output_file) : std::cout;

        const int status = cobskit::tool::run_command(config, input, output);
        if (!output)
        {
            throw std::runtime_error("Failed to write output");
        }
        return status == 0 ? EXIT_SUCCESS : status;
    }
    catch (const cobskit::CodecError &ex)
    {
        std::cerr << "Decoding failed: " << ex.what() << std::endl;
        spdlog::error("Codec error {}: {}", cobskit::to_string(ex.code()), ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "cobskit failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
