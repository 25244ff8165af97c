#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cobskit/framing.hpp"
#include "cobskit/tool/commands.hpp"
#include "cobskit/tool/config.hpp"
#include "cobskit/tool/logging.hpp"

#include "test_support.hpp"

using namespace cobskit;
using namespace cobskit::tool;
using namespace cobskit::testing;

namespace
{

    ToolConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "cobskit");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return parse_arguments(static_cast<int>(args.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    std::string run(const ToolConfig &config, const std::string &input, int expected_status = 0)
    {
        std::istringstream in(input);
        std::ostringstream out;
        const int status = run_command(config, in, out);
        assert(status == expected_status);
        return out.str();
    }

    void test_parse_arguments()
    {
        const auto encode = parse({"encode", "--reduced", "--frame", "--input", "in.bin", "-v"});
        assert(encode.command == Command::Encode);
        assert(encode.scheme == framing::Scheme::CobsR);
        assert(encode.frame);
        assert(encode.verbose);
        assert(encode.input_path && encode.input_path->string() == "in.bin");
        assert(!encode.output_path);

        const auto unframe = parse({"unframe", "--max-frame", "512", "--output", "out.bin", "--log", "tool.log"});
        assert(unframe.command == Command::Unframe);
        assert(unframe.scheme == framing::Scheme::Cobs);
        assert(unframe.max_frame_size == 512);
        assert(unframe.output_path && unframe.output_path->string() == "out.bin");
        assert(unframe.log_path && unframe.log_path->string() == "tool.log");

        const auto bounds = parse({"bounds", "1000"});
        assert(bounds.command == Command::Bounds);
        assert(bounds.bounds_length == 1000);

        assert(parse({"--help"}).command == Command::Help);
        assert(parse({"decode", "-h"}).command == Command::Help);
        assert(parse({"version"}).command == Command::Version);

        assert(parse_fails({}));
        assert(parse_fails({"compress"}));
        assert(parse_fails({"encode", "--fast"}));
        assert(parse_fails({"encode", "--input"}));
        assert(parse_fails({"bounds"}));
        assert(parse_fails({"bounds", "-3"}));
        assert(parse_fails({"bounds", "99999999999999999999999"}));
        assert(parse_fails({"unframe", "--max-frame", "0"}));
        assert(parse_fails({"unframe", "--max-frame", "12k"}));

        assert(command_from_string("inspect") == Command::Inspect);
        assert(!command_from_string("Inspect").has_value());
        assert(to_string(Command::Unframe) == "unframe");
        assert(usage("cobskit").starts_with("Usage: cobskit "));
    }

    void test_encode_and_decode_commands()
    {
        ToolConfig config;
        config.command = Command::Encode;
        assert(run(config, std::string("12345\0" "6789", 10)) == std::string("\x06" "12345\x05" "6789", 11));

        config.frame = true;
        assert(run(config, "hello") == std::string("\x06" "hello\0", 7));

        config.scheme = framing::Scheme::CobsR;
        config.frame = false;
        assert(run(config, "12345") == "51234");
        assert(run(config, "") == "\x01");

        config.command = Command::Decode;
        assert(run(config, "51234") == "12345");
        // A trailing delimiter is accepted.
        assert(run(config, std::string("51234\0", 6)) == "12345");

        config.scheme = framing::Scheme::Cobs;
        assert(run(config, std::string("\x06" "hello\0", 7)) == "hello");
        assert(error_from([&] { run(config, "\x05" "AAA"); }) == ErrorCode::TruncatedEncodedData);
        assert(error_from([&] { run(config, std::string("\x03" "A\0" "B", 4)); }) == ErrorCode::ZeroInEncodedData);
    }

    void test_unframe_command()
    {
        std::string stream;
        for (const auto *payload : {"alpha", "beta"})
        {
            const auto frame = framing::encode_frame(bytes(payload), framing::Scheme::Cobs);
            stream.append(frame.begin(), frame.end());
        }

        ToolConfig config;
        config.command = Command::Unframe;
        assert(run(config, stream) == "alphabeta");

        std::istringstream in(stream + std::string("\x05" "AAA\0", 5));
        std::ostringstream out;
        const auto summary = unframe_stream(in, out, framing::Scheme::Cobs, framing::kDefaultMaxFrameSize);
        assert(summary.frames == 2);
        assert(summary.dropped == 1);
        assert(summary.payload_bytes == 9);
        assert(out.str() == "alphabeta");

        // Dropped frames turn into a non-zero status.
        assert(run(config, stream + std::string("\x05" "AAA\0", 5), 2) == "alphabeta");
    }

    void test_inspect_command()
    {
        std::string stream("\x06" "hello\0" "\0" "\x05" "AAA\0" "\x02", 14);
        std::istringstream in(stream);
        const auto report = inspect_stream(in, framing::Scheme::Cobs);

        assert(report["scheme"] == "cobs");
        assert(report["total_frames"] == 2);
        assert(report["malformed_frames"] == 1);
        assert(report["trailing_bytes"] == 1);
        assert(report["frames"].size() == 2);

        const auto &first = report["frames"][0];
        assert(first["index"] == 0);
        assert(first["encoded_size"] == 6);
        assert(first["decoded_size"] == 5);
        assert(first["error"] == "ok");
        assert(first["bounds"]["decode_max"] == 5);
        assert(first["bounds"]["decode_min"] == 5);
        assert(first["bounds"].size() == 2);
        assert(!first["bounds"].contains("encode_max"));

        const auto &second = report["frames"][1];
        assert(second["encoded_size"] == 4);
        assert(second["decoded_size"] == 0);
        assert(second["error"] == "truncated_encoded_data");

        std::istringstream reduced_in(std::string("\x05" "AAA\0", 5));
        const auto reduced = inspect_stream(reduced_in, framing::Scheme::CobsR);
        assert(reduced["scheme"] == "cobsr");
        assert(reduced["malformed_frames"] == 0);
        assert(reduced["frames"][0]["decoded_size"] == 4);

        ToolConfig config;
        config.command = Command::Inspect;
        const auto printed = nlohmann::json::parse(run(config, stream));
        assert(printed == report);
    }

    void test_bounds_command()
    {
        const auto empty = size_bounds_report(0);
        assert(empty["length"] == 0);
        assert(empty["cobs"]["encode_min"] == 1);
        assert(empty["cobs"]["encode_max"] == 1);
        assert(empty["cobs"]["decode_max"] == 0);
        assert(empty["cobsr"]["encode_min"] == 1);
        assert(empty["cobsr"]["decode_max"] == 0);

        const auto full_run = size_bounds_report(254);
        assert(full_run["cobs"]["encode_min"] == 255);
        assert(full_run["cobs"]["encode_max"] == 255);
        assert(full_run["cobs"]["decode_min"] == 253);
        assert(full_run["cobs"]["decode_max"] == 253);
        assert(full_run["cobsr"]["encode_min"] == 254);
        assert(full_run["cobsr"]["encode_max"] == 255);
        assert(full_run["cobsr"]["decode_max"] == 254);

        ToolConfig config;
        config.command = Command::Bounds;
        config.bounds_length = 254;
        assert(nlohmann::json::parse(run(config, "")) == full_run);
    }

    void test_version_and_help_commands()
    {
        ToolConfig config;
        config.command = Command::Version;
        assert(run(config, "").starts_with("cobskit "));

        config.command = Command::Help;
        assert(run(config, "") == usage("cobskit"));
    }

} // namespace

void run_tool_tests()
{
    configure_logging(std::nullopt, false);
    test_parse_arguments();
    test_encode_and_decode_commands();
    test_unframe_command();
    test_inspect_command();
    test_bounds_command();
    test_version_and_help_commands();
}
