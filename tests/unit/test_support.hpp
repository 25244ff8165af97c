#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cobskit/error_codes.hpp"

namespace cobskit::testing
{

    using namespace std::string_view_literals;

    inline std::vector<std::uint8_t> bytes(std::string_view text)
    {
        return {text.begin(), text.end()};
    }

    struct Mapping
    {
        std::string description;
        std::string raw;
        std::string encoded;
    };

    // 250 bytes of non-zero filler used to reach the run length cap.
    inline std::string filler()
    {
        const std::string block = "0123456789ABCDEFGHIJKLMNOPQRSTabcdefghijklmnopqrst";
        return block + block + block + block + block;
    }

    inline std::vector<Mapping> cobs_encodings()
    {
        const auto fill = filler();
        return {
            {"empty", "", "\x01"},
            {"1 non-zero", "1", "\x02"
                                "1"},
            {"5 non-zero", "12345", "\x06"
                                    "12345"},
            {"1 zero in middle", std::string("12345\x00"
                                             "6789"sv),
             std::string("\x06"
                         "12345\x05"
                         "6789"sv)},
            {"2 clumps starting with zero", std::string("\x00"
                                                        "12345\x00"
                                                        "6789"sv),
             std::string("\x01\x06"
                         "12345\x05"
                         "6789"sv)},
            {"2 clumps ending with zero", std::string("12345\x00"
                                                      "6789\x00"sv),
             std::string("\x06"
                         "12345\x05"
                         "6789\x01"sv)},
            {"1 zero", std::string("\x00"sv), "\x01\x01"},
            {"2 zeros", std::string("\x00\x00"sv), "\x01\x01\x01"},
            {"3 zeros", std::string("\x00\x00\x00"sv), "\x01\x01\x01\x01"},
            {"253 non-zero bytes", fill + "123", "\xFE" + fill + "123"},
            {"254 non-zero bytes", fill + "1234", "\xFF" + fill + "1234"},
            {"255 non-zero bytes", fill + "12345", "\xFF" + fill + "1234\x02"
                                                                   "5"},
            {"zero followed by 255 non-zero bytes", std::string("\x00"sv) + fill + "12345",
             "\x01\xFF" + fill + "1234\x02"
                                 "5"},
            {"253 non-zero bytes followed by zero", fill + std::string("123\x00"sv),
             "\xFE" + fill + "123\x01"},
            {"254 non-zero bytes followed by zero", fill + std::string("1234\x00"sv),
             "\xFF" + fill + "1234\x01\x01"},
            {"255 non-zero bytes followed by zero", fill + std::string("12345\x00"sv),
             "\xFF" + fill + "1234\x02"
                             "5\x01"},
        };
    }

    // Valid but non-optimal encodings another encoder might produce.
    inline std::vector<Mapping> cobs_decodings()
    {
        const auto fill = filler();
        return {
            {"empty", "", ""},
            {"254 non-zero bytes with redundant trailing code", fill + "1234", "\xFF" + fill + "1234\x01"},
        };
    }

    inline std::vector<Mapping> cobsr_encodings()
    {
        const auto fill = filler();
        return {
            {"empty", "", "\x01"},
            {"0x01", "\x01", "\x02\x01"},
            {"0x02", "\x02", "\x02"},
            {"0x03", "\x03", "\x03"},
            {"0x7E", "\x7E", "\x7E"},
            {"0x7F", "\x7F", "\x7F"},
            {"0x80", "\x80", "\x80"},
            {"0xD5", "\xD5", "\xD5"},
            {"0xFE", "\xFE", "\xFE"},
            {"0xFF", "\xFF", "\xFF"},
            {"1", "1", "1"},
            {"descending", "\x05\x04\x03\x02\x01", "\x06\x05\x04\x03\x02\x01"},
            {"5 non-zero", "12345", "51234"},
            {"small final run", std::string("12345\x00\x04\x03\x02\x01"sv),
             std::string("\x06"
                         "12345\x05\x04\x03\x02\x01"sv)},
            {"1 zero in middle", std::string("12345\x00"
                                             "6789"sv),
             "\x06"
             "123459678"},
            {"2 clumps starting with zero", std::string("\x00"
                                                        "12345\x00"
                                                        "6789"sv),
             "\x01\x06"
             "123459678"},
            {"2 clumps ending with zero", std::string("12345\x00"
                                                      "6789\x00"sv),
             std::string("\x06"
                         "12345\x05"
                         "6789\x01"sv)},
            {"1 zero", std::string("\x00"sv), "\x01\x01"},
            {"2 zeros", std::string("\x00\x00"sv), "\x01\x01\x01"},
            {"3 zeros", std::string("\x00\x00\x00"sv), "\x01\x01\x01\x01"},
            {"254 non-zero bytes", fill + "1234", "\xFF" + fill + "1234"},
            {"254 non-zero bytes ending in 0xFF", fill + "123\xFF", "\xFF" + fill + "123"},
            {"255 non-zero bytes", fill + "12345", "\xFF" + fill + "12345"},
            {"255 non-zero bytes followed by zero", fill + std::string("12345\x00"sv),
             "\xFF" + fill + "1234\x02"
                             "5\x01"},
        };
    }

    // Deterministic byte generator; zero_one_in controls how often a zero appears.
    class ByteGenerator
    {
    public:
        explicit ByteGenerator(std::uint32_t seed) : state_(seed) {}

        std::vector<std::uint8_t> make(std::size_t length, std::uint32_t zero_one_in)
        {
            std::vector<std::uint8_t> data;
            data.reserve(length);
            for (std::size_t i = 0; i < length; ++i)
            {
                const auto value = advance();
                if (zero_one_in != 0 && value % zero_one_in == 0)
                {
                    data.push_back(0);
                }
                else
                {
                    data.push_back(static_cast<std::uint8_t>(1 + (value >> 8) % 255));
                }
            }
            return data;
        }

    private:
        std::uint32_t advance()
        {
            state_ = state_ * 1664525u + 1013904223u;
            return state_ >> 8;
        }

        std::uint32_t state_;
    };

    template <typename Fn>
    ErrorCode error_from(Fn &&fn)
    {
        try
        {
            std::forward<Fn>(fn)();
        }
        catch (const CodecError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

} // namespace cobskit::testing
