/**
 * cobskit - Pull-driven encoders and decoders over byte iterators.
 *
 * Each sequence consumes its input one element at a time and produces output on demand through
 * next(), so a stream never has to be held in memory as a whole. Sequences are fused: once next()
 * has returned std::nullopt (or, for checked decoders, an error item) it keeps returning
 * std::nullopt.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "cobskit/error_codes.hpp"
#include "cobskit/stuffing.hpp"

namespace cobskit
{

    // Item produced by a checked decoder: either a decoded byte or the error that ended decoding.
    struct DecodedByte
    {
        std::uint8_t value{};
        ErrorCode error{ErrorCode::Ok};

        bool ok() const noexcept { return error == ErrorCode::Ok; }
    };

    // Input iterator over a pull sequence, terminated by std::default_sentinel.
    template <typename Sequence>
    class SequenceIterator
    {
    public:
        using value_type = typename Sequence::value_type;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        SequenceIterator() = default;

        explicit SequenceIterator(Sequence &sequence)
            : sequence_(&sequence), current_(sequence.next())
        {
        }

        const value_type &operator*() const { return *current_; }

        SequenceIterator &operator++()
        {
            current_ = sequence_->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const SequenceIterator &it, std::default_sentinel_t) noexcept
        {
            return !it.current_.has_value();
        }

    private:
        Sequence *sequence_{nullptr};
        std::optional<value_type> current_{};
    };

    namespace detail
    {

        template <typename InputIt, typename Sentinel>
        class ByteSource
        {
        public:
            ByteSource(InputIt first, Sentinel last)
                : current_(std::move(first)), last_(std::move(last))
            {
            }

            std::optional<std::uint8_t> pull()
            {
                if (current_ == last_)
                {
                    return std::nullopt;
                }
                const auto byte = static_cast<std::uint8_t>(*current_);
                ++current_;
                return byte;
            }

        private:
            InputIt current_;
            Sentinel last_;
        };

        // Decoding state carried between pulls: bytes left in the current run and the code that
        // opened it. The previous code decides whether an implied zero sits between two runs.
        template <Variant V>
        class RunTracker
        {
        public:
            enum class Outcome : std::uint8_t
            {
                Byte,
                Skip,
                End,
                Error
            };

            struct Step
            {
                Outcome outcome{Outcome::Skip};
                std::uint8_t value{};
                ErrorCode error{ErrorCode::Ok};
            };

            // byte must be non-zero.
            Step feed(std::uint8_t byte) noexcept
            {
                if (count_run_ == 0)
                {
                    const auto previous = last_run_;
                    last_run_ = byte;
                    count_run_ = static_cast<std::uint8_t>(byte - 1);
                    if (previous != 0 && previous != kMaxCode)
                    {
                        return {.outcome = Outcome::Byte, .value = 0};
                    }
                    return {.outcome = Outcome::Skip};
                }
                --count_run_;
                return {.outcome = Outcome::Byte, .value = byte};
            }

            Step finish() noexcept
            {
                if (count_run_ == 0)
                {
                    return {.outcome = Outcome::End};
                }
                if constexpr (V == Variant::Reduced)
                {
                    // The code claimed more bytes than arrived: it was the final data byte.
                    count_run_ = 0;
                    return {.outcome = Outcome::Byte, .value = last_run_};
                }
                else
                {
                    return {.outcome = Outcome::Error, .error = ErrorCode::TruncatedEncodedData};
                }
            }

        private:
            std::uint8_t last_run_{0};
            std::uint8_t count_run_{0};
        };

    } // namespace detail

    /**
     * Lazy encoder. Data bytes of the current run are held back until the run boundary is known,
     * then released behind their length code. COBS/R reads one byte past a capped run to learn
     * whether the input ends there.
     */
    template <Variant V, typename InputIt, typename Sentinel = InputIt>
    class BasicEncoder
    {
    public:
        using value_type = std::uint8_t;

        BasicEncoder(InputIt first, Sentinel last)
            : source_(std::move(first), std::move(last))
        {
        }

        std::optional<std::uint8_t> next()
        {
            if (hold_read_ < hold_len_)
            {
                const auto byte = hold_[hold_read_++];
                if (hold_read_ == hold_len_)
                {
                    hold_read_ = 0;
                    hold_len_ = 0;
                }
                return byte;
            }
            if (finished_)
            {
                return std::nullopt;
            }
            for (;;)
            {
                const auto input = pull();
                if (!input)
                {
                    finished_ = true;
                    if (after_full_run_)
                    {
                        return std::nullopt;
                    }
                    return close_run(true);
                }
                after_full_run_ = false;
                if (*input == 0)
                {
                    return close_run(false);
                }
                hold_[hold_len_++] = *input;
                if (hold_len_ == kMaxRunLength)
                {
                    after_full_run_ = true;
                    if constexpr (V == Variant::Reduced)
                    {
                        lookahead_ = source_.pull();
                        peeked_ = true;
                        if (!lookahead_)
                        {
                            finished_ = true;
                            if (hold_[hold_len_ - 1] == kMaxCode)
                            {
                                --hold_len_;
                            }
                        }
                    }
                    return kMaxCode;
                }
            }
        }

        SequenceIterator<BasicEncoder> begin() { return SequenceIterator<BasicEncoder>(*this); }

        std::default_sentinel_t end() const noexcept { return {}; }

    private:
        std::optional<std::uint8_t> pull()
        {
            if (peeked_)
            {
                peeked_ = false;
                return lookahead_;
            }
            return source_.pull();
        }

        std::uint8_t close_run(bool at_end)
        {
            auto code = static_cast<std::uint8_t>(hold_len_ + 1);
            if constexpr (V == Variant::Reduced)
            {
                if (at_end && hold_len_ > 0 && hold_[hold_len_ - 1] >= code)
                {
                    code = hold_[--hold_len_];
                }
            }
            return code;
        }

        detail::ByteSource<InputIt, Sentinel> source_;
        std::array<std::uint8_t, kMaxRunLength> hold_{};
        std::size_t hold_len_{0};
        std::size_t hold_read_{0};
        std::optional<std::uint8_t> lookahead_{};
        bool peeked_{false};
        bool after_full_run_{false};
        bool finished_{false};
    };

    /**
     * Best-effort lazy decoder. Never reports errors: a zero byte is taken as the end of the data,
     * and a run cut short simply ends the output (COBS) or yields its code as the last byte
     * (COBS/R).
     */
    template <Variant V, typename InputIt, typename Sentinel = InputIt>
    class BasicDecoder
    {
    public:
        using value_type = std::uint8_t;

        BasicDecoder(InputIt first, Sentinel last)
            : source_(std::move(first), std::move(last))
        {
        }

        std::optional<std::uint8_t> next()
        {
            using Outcome = typename detail::RunTracker<V>::Outcome;
            while (!finished_)
            {
                const auto input = source_.pull();
                const bool at_end = !input || *input == kFrameDelimiter;
                const auto step = at_end ? tracker_.finish() : tracker_.feed(*input);
                if (at_end)
                {
                    finished_ = true;
                }
                if (step.outcome == Outcome::Byte)
                {
                    return step.value;
                }
            }
            return std::nullopt;
        }

        SequenceIterator<BasicDecoder> begin() { return SequenceIterator<BasicDecoder>(*this); }

        std::default_sentinel_t end() const noexcept { return {}; }

    private:
        detail::ByteSource<InputIt, Sentinel> source_;
        detail::RunTracker<V> tracker_{};
        bool finished_{false};
    };

    // Lazy decoder that reports malformed input as a final error item.
    template <Variant V, typename InputIt, typename Sentinel = InputIt>
    class BasicCheckedDecoder
    {
    public:
        using value_type = DecodedByte;

        BasicCheckedDecoder(InputIt first, Sentinel last)
            : source_(std::move(first), std::move(last))
        {
        }

        std::optional<DecodedByte> next()
        {
            using Outcome = typename detail::RunTracker<V>::Outcome;
            while (!finished_)
            {
                const auto input = source_.pull();
                if (input && *input == 0)
                {
                    finished_ = true;
                    return DecodedByte{.error = ErrorCode::ZeroInEncodedData};
                }
                if (!input)
                {
                    finished_ = true;
                }
                const auto step = input ? tracker_.feed(*input) : tracker_.finish();
                switch (step.outcome)
                {
                case Outcome::Byte:
                    return DecodedByte{.value = step.value};
                case Outcome::Error:
                    finished_ = true;
                    return DecodedByte{.error = step.error};
                case Outcome::End:
                    finished_ = true;
                    break;
                case Outcome::Skip:
                    break;
                }
            }
            return std::nullopt;
        }

        SequenceIterator<BasicCheckedDecoder> begin() { return SequenceIterator<BasicCheckedDecoder>(*this); }

        std::default_sentinel_t end() const noexcept { return {}; }

    private:
        detail::ByteSource<InputIt, Sentinel> source_;
        detail::RunTracker<V> tracker_{};
        bool finished_{false};
    };

    // Drains a byte sequence into a vector.
    template <typename Sequence>
    std::vector<std::uint8_t> collect(Sequence &&sequence)
    {
        std::vector<std::uint8_t> output;
        while (const auto byte = sequence.next())
        {
            output.push_back(*byte);
        }
        return output;
    }

    // Drains a checked decoder, throwing CodecError at the first error item.
    template <typename Sequence>
    std::vector<std::uint8_t> collect_checked(Sequence &&sequence)
    {
        std::vector<std::uint8_t> output;
        while (const auto item = sequence.next())
        {
            if (!item->ok())
            {
                throw CodecError(item->error);
            }
            output.push_back(item->value);
        }
        return output;
    }

} // namespace cobskit
