#include "cobskit/error_codes.hpp"

#include <array>
#include <string>

namespace cobskit
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view name;
            std::string_view message;
        };

        constexpr std::array<ErrorCodeDescription, 4> kDescriptions{{
            {ErrorCode::Ok, "ok", "Success"},
            {ErrorCode::OutputBufferTooSmall, "output_buffer_too_small", "Output buffer is too small"},
            {ErrorCode::ZeroInEncodedData, "zero_in_encoded_data", "Zero found in encoded input data"},
            {ErrorCode::TruncatedEncodedData, "truncated_encoded_data", "Unexpected end of encoded input data"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.name;
            }
        }
        return "unknown";
    }

    std::string_view describe(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.message;
            }
        }
        return "Unknown error";
    }

    std::optional<ErrorCode> error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    CodecError::CodecError(ErrorCode code)
        : std::runtime_error(std::string(describe(code))), code_(code)
    {
    }

} // namespace cobskit
