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

namespace numscan {
namespace impl {

inline bool IsLowerASCII(char ch)
{
    return 'a' <= ch && ch <= 'z';
}

inline char ToLowerASCII(char ch)
{
    return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

// Returns whether the characters at 'next' match 'lower_case_prefix', ignoring case.
template <typename Span>
inline bool StartsWith(Span const& span, Index next, char const* lower_case_prefix)
{
    Index const last = span.Stop();

    for ( ; next != last && *lower_case_prefix != '\0'; ++next, ++lower_case_prefix)
    {
        NUMSCAN_ASSERT(IsLowerASCII(*lower_case_prefix));
        if (ToLowerASCII(span.Get(next)) != *lower_case_prefix)
            return false;
    }

    return *lower_case_prefix == '\0';
}

// Recognizes "nan", "inf" and "infinity" at 'next'.
// On success, stores the value, advances 'next' past the token and returns ParseStatus::nan or
// ParseStatus::inf. Otherwise returns ParseStatus::invalid and leaves 'next' and 'value' alone.
template <typename Float, typename Span>
NUMSCAN_NEVER_INLINE ParseStatus ParseSpecial(Span const& span, bool is_negative, Index& next, Float& value)
{
    using Traits = FloatTraits<Float>;

    if (StartsWith(span, next, "inf"))
    {
        next += 3;
        if (StartsWith(span, next, "inity"))
            next += 5;

        value = is_negative ? Traits::Negate(Traits::Infinity()) : Traits::Infinity();
        return ParseStatus::inf;
    }

    if (StartsWith(span, next, "nan"))
    {
        next += 3;

        // The sign is dropped.
        value = Traits::QuietNaN();
        return ParseStatus::nan;
    }

    return ParseStatus::invalid;
}

} // namespace impl
} // namespace numscan
