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
#include "scanner.h"

#include <climits>
#include <string>
#include <type_traits>
#include <vector>

namespace numscan {

//==================================================================================================
// SpanReader
//==================================================================================================

// Reads the characters of a span one at a time.
template <typename Span>
struct SpanReader
{
    Span const& span;

    explicit SpanReader(Span const& span_) : span(span_) {}

    // Reads the character at 'index' and the index of the character following it.
    // Returns false if the span is exhausted.
    bool operator()(Index index, char& ch, Index& next) const
    {
        if (index >= span.Stop())
            return false;

        ch = span.Get(index);
        next = index + 1;
        return true;
    }
};

//==================================================================================================
// DoubleConversionFallback
//
// Uses the double-conversion library:
// https://github.com/google/double-conversion
//==================================================================================================

// Converts the longest prefix of [first, first + length) which is a decimal number into the
// nearest single- or double-precision number. Leading whitespace is not allowed, trailing junk
// is ignored.
// Returns false if the input does not start with a number.
bool DecimalToFloat(char const* first, int length, double& value, int& processed_characters_count);
bool DecimalToFloat(char const* first, int length, float& value, int& processed_characters_count);

struct DoubleConversionFallback
{
    // double-conversion only produces single- and double-precision numbers.
    template <typename Float>
    static constexpr bool SupportsFloat = std::is_same<Float, double>::value || std::is_same<Float, float>::value;

    static bool IsNumberChar(char ch)
    {
        return impl::IsDigit(ch) || impl::IsSign(ch) || ch == '.' || ch == 'e' || ch == 'E';
    }

    // Converts the number starting at index 'first' (after optional whitespace) into 'value'
    // and stores the index just past the number in 'next'.
    // Returns false if there is no number.
    //
    // This function is actually almost never going to be called, so it is ok to copy the
    // number-like prefix of the input into a temporary buffer.
    template <typename Reader, typename Float>
    bool operator()(Reader const& read, Index first, Float& value, Index& next) const
    {
        static_assert(SupportsFloat<Float>,
            "DoubleConversionFallback only supports float and double. Pass a fallback for other types.");

        std::string digits;
        std::vector<Index> ends; // ends[i] = index just past the i-th character in digits

        char  ch    = '\0';
        Index index = first;
        Index after = first;

        while (read(index, ch, after) && impl::IsSpace(ch))
            index = after;

        while (read(index, ch, after) && IsNumberChar(ch))
        {
            digits.push_back(impl::IsMinus(ch) ? '-' : ch);
            ends.push_back(after);
            index = after;
        }

        if (digits.empty() || digits.size() > static_cast<size_t>(INT_MAX))
            return false;

        Float flt = 0;
        int processed_characters_count = 0;
        if (!DecimalToFloat(digits.data(), static_cast<int>(digits.size()), flt, processed_characters_count))
            return false;

        NUMSCAN_ASSERT(processed_characters_count > 0);
        NUMSCAN_ASSERT(static_cast<size_t>(processed_characters_count) <= digits.size());

        value = flt;
        next = ends[static_cast<size_t>(processed_characters_count) - 1];
        return true;
    }
};

} // namespace numscan
