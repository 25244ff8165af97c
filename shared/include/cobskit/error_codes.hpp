/**
 * cobskit - Error codes reported by the strict and checked codec interfaces.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace cobskit
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        OutputBufferTooSmall = 1,
        ZeroInEncodedData = 2,
        TruncatedEncodedData = 3
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::string_view describe(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    std::optional<ErrorCode> error_code_from_int(std::uint16_t value) noexcept;

    class CodecError : public std::runtime_error
    {
    public:
        explicit CodecError(ErrorCode code);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace cobskit
