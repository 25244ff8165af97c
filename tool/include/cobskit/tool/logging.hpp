#pragma once

#include <filesystem>
#include <optional>

namespace cobskit::tool
{

    // Installs the default spdlog logger: stderr, plus a file sink when log_path is set.
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace cobskit::tool
