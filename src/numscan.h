// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "fallback.h"
#include "fast_path.h"
#include "float_traits.h"
#include "scanner.h"
#include "special.h"

#include <string>

namespace numscan {

//==================================================================================================
// CharSpan
//==================================================================================================

// A read-only view of the characters buffer[start, stop).
//
// Any other type with the same member functions Start(), Stop() and Get(i) may be used as a
// span in ParseWithDiagnostics(span, fallback) and Parse(span, fallback, value).
class CharSpan
{
    char const* buffer_;
    Index start_;
    Index stop_;

public:
    CharSpan(char const* buffer, Index start, Index stop)
        : buffer_(buffer)
        , start_(start)
        , stop_(stop)
    {
        NUMSCAN_ASSERT(0 <= start);
        NUMSCAN_ASSERT(start <= stop);
        NUMSCAN_ASSERT(buffer != nullptr || start == stop);
    }

    CharSpan(char const* first, char const* last)
        : CharSpan(first, 0, last - first)
    {
    }

    explicit CharSpan(std::string const& str)
        : CharSpan(str.data(), 0, static_cast<Index>(str.size()))
    {
    }

    Index Start() const { return start_; }
    Index Stop() const { return stop_; }

    char Get(Index i) const
    {
        NUMSCAN_ASSERT(start_ <= i);
        NUMSCAN_ASSERT(i < stop_);
        return buffer_[i];
    }
};

//==================================================================================================
// ParseResult
//==================================================================================================

template <typename Float>
struct ParseResult
{
    Float value = 0;
    Index consumed = 0; // number of characters consumed, counted from the start of the span
    ParseStatus status = ParseStatus::invalid;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status != ParseStatus::invalid;
    }

    bool TookFastPath() const
    {
        return status == ParseStatus::fast_path;
    }
};

//==================================================================================================
// ParseWithDiagnostics
//==================================================================================================

// ParseResult<Float> result = ParseWithDiagnostics<Float>(span, fallback);
//
// Converts the decimal number at the start of 'span' (after optional whitespace) into the
// nearest single- or double-precision number.
//
// Accepted inputs are [+-~]digits[.digits][(e|E)[+-~]digits] and, case-insensitive, [+-~]nan,
// [+-~]inf and [+-~]infinity. '~' is an alternate minus sign.
//
// Inputs with at most 19 digits and a small exponent are converted using integer arithmetic and
// a single floating-point multiplication (or division). All other inputs are handed to
// 'fallback', which is called as
//
//      bool ok = fallback(SpanReader<Span>(span), span.Start(), value, next);
//
// and must return the correctly rounded value and the index just past the number.
//
// If there is no number at the start of the span, the result is empty (status is
// ParseStatus::invalid) and its value must not be used.
//
// Any IEEE type for which FloatTraits<Float> holds can be used with a matching fallback. The
// overloads without a fallback use DoubleConversionFallback and only support float and double.
template <typename Float, typename Span, typename Fallback>
inline ParseResult<Float> ParseWithDiagnostics(Span const& span, Fallback const& fallback)
{
    Index const start = span.Start();

    ParseResult<Float> result;

    impl::ScanRecord record;
    if (!impl::Scan(span, record))
        return result;

    if (record.num_digits == 0)
    {
        // Something like "e5" or "-.e+1".
        if (record.has_exponent || record.has_point)
            return result;

        Index next = record.body;
        if (next == span.Stop())
            return result;

        result.status = impl::ParseSpecial(span, record.is_negative, next, result.value);
        if (result.status != ParseStatus::invalid)
            result.consumed = next - start;
        return result;
    }

    if (impl::FastPath(record, result.value))
    {
        result.consumed = record.next - start;
        result.status = ParseStatus::fast_path;
        return result;
    }

    Index next = start;
    if (!fallback(SpanReader<Span>(span), start, result.value, next))
        return result;

    NUMSCAN_ASSERT(start < next);
    NUMSCAN_ASSERT(next <= span.Stop());

    result.consumed = next - start;
    result.status = ParseStatus::fallback;
    return result;
}

template <typename Float>
inline ParseResult<Float> ParseWithDiagnostics(CharSpan const& span)
{
    return ParseWithDiagnostics<Float>(span, DoubleConversionFallback{});
}

template <typename Float>
inline ParseResult<Float> ParseWithDiagnostics(std::string const& str)
{
    return ParseWithDiagnostics<Float>(CharSpan(str), DoubleConversionFallback{});
}

//==================================================================================================
// Parse
//==================================================================================================

// Returns whether a number has been found at the start of 'span'.
// 'value' is only modified on success.
template <typename Float, typename Span, typename Fallback>
inline bool Parse(Span const& span, Fallback const& fallback, Float& value)
{
    auto const res = ParseWithDiagnostics<Float>(span, fallback);
    if (!res)
        return false;

    value = res.value;
    return true;
}

template <typename Float>
inline bool Parse(CharSpan const& span, Float& value)
{
    return Parse(span, DoubleConversionFallback{}, value);
}

template <typename Float>
inline bool Parse(std::string const& str, Float& value)
{
    return Parse(CharSpan(str), DoubleConversionFallback{}, value);
}

} // namespace numscan
