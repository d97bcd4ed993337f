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

#include "float_traits.h"

#include <cstdint>

namespace numscan {
namespace impl {

inline bool IsDigit(char ch)
{
    return static_cast<unsigned>(ch - '0') <= 9u;
}

inline int DigitValue(char ch)
{
    NUMSCAN_ASSERT(IsDigit(ch));
    return ch - '0';
}

inline bool IsSpace(char ch)
{
    return ch == ' ' || ('\t' <= ch && ch <= '\r'); // \t \n \v \f \r
}

// '~' is the historical spelling of the minus sign.
inline bool IsMinus(char ch)
{
    return ch == '-' || ch == '~';
}

inline bool IsSign(char ch)
{
    return ch == '+' || IsMinus(ch);
}

//==================================================================================================
// Scan
//==================================================================================================

// The decomposition 'mantissa * 10^exponent' of a number-like token.
struct ScanRecord
{
    bool     is_negative = false;
    uint64_t mantissa = 0;            // only valid iff num_digits <= 19
    int64_t  num_digits = 0;          // including leading zeros
    bool     has_point = false;
    bool     has_exponent = false;
    int64_t  num_exponent_digits = 0;
    int64_t  exponent = 0;
    Index    body = 0;                // index just past the sign
    Index    next = 0;                // index just past the token
};

// Exponents larger than this limit are clamped.
// All the digits are still consumed and counted.
constexpr int64_t kMaxParsedExponent = 999999;

// Reads a run of decimal digits starting at 'next' into 'value'.
// Returns the number of digits read.
template <typename Span>
inline int64_t ScanDigits(Span const& span, Index& next, uint64_t& value)
{
    Index const last = span.Stop();
    Index const first = next;

    while (next != last && IsDigit(span.Get(next)))
    {
        value = 10 * value + static_cast<uint64_t>(DigitValue(span.Get(next)));
        ++next;
    }

    return next - first;
}

// Decomposes the number-like token at the start of 'span' into 'record'.
//
// Returns false if the span is empty after skipping leading whitespace.
// A record with num_digits == 0 is not an error here; it is up to the caller to decide whether
// the remaining input starts a special token.
template <typename Span>
inline bool Scan(Span const& span, ScanRecord& record)
{
    Index const last = span.Stop();
    Index next = span.Start();

    NUMSCAN_ASSERT(next <= last);

    while (next != last && IsSpace(span.Get(next)))
        ++next;

    if (next == last)
        return false;

    record = ScanRecord{};

// [-]

    char const sign = span.Get(next);
    if (IsSign(sign))
    {
        record.is_negative = IsMinus(sign);
        ++next;
    }

    record.body = next;

// int

    record.num_digits = ScanDigits(span, next, record.mantissa);

// frac

    if (next != last && span.Get(next) == '.')
    {
        ++next;
        record.has_point = true;

        int64_t const digits_past_point = ScanDigits(span, next, record.mantissa);
        record.num_digits += digits_past_point;
        record.exponent = -digits_past_point;
    }

// exp

    if (next != last && (span.Get(next) == 'e' || span.Get(next) == 'E'))
    {
        // An exponent marker without any digits is not part of the number.
        // 'next' is updated if and only if at least one exponent digit has been found.
        Index p = next + 1;

        bool exponent_is_negative = false;
        if (p != last && IsSign(span.Get(p)))
        {
            exponent_is_negative = IsMinus(span.Get(p));
            ++p;
        }

        if (p != last && IsDigit(span.Get(p)))
        {
            int64_t parsed_exponent = 0;
            Index const first = p;
            for ( ; p != last && IsDigit(span.Get(p)); ++p)
            {
                if (parsed_exponent <= kMaxParsedExponent)
                    parsed_exponent = 10 * parsed_exponent + DigitValue(span.Get(p));
            }

            record.has_exponent = true;
            record.num_exponent_digits = p - first;
            record.exponent += exponent_is_negative ? -parsed_exponent : parsed_exponent;
            next = p;
        }
    }

    record.next = next;
    return true;
}

} // namespace impl
} // namespace numscan
