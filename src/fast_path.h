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

namespace numscan {
namespace impl {

//==================================================================================================
// FastPath
//
// [1] Clinger, "How to read floating point numbers accurately",
//     PLDI '90 Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and
//     implementation, Pages 92-101
//==================================================================================================

// 10^19 - 1 < 2^64 <= 10^20 - 1:
// Any integer with at most 19 decimal digits fits into a uint64_t.
constexpr int64_t kMaxFastDigits = 19;

// Any exponent with more digits than this is left to the fallback, even if its value is small
// (e.g. "1e00000000000000000001").
constexpr int64_t kMaxFastExponentDigits = 19;

template <typename Float>
inline bool FastPathApplies(ScanRecord const& record)
{
    using Profile = typename FloatTraits<Float>::Profile;

    return kFastPathEnabled
        && 1 <= record.num_digits && record.num_digits <= kMaxFastDigits
        && record.num_exponent_digits <= kMaxFastExponentDigits
        && Profile::MinFastExponent <= record.exponent && record.exponent <= Profile::MaxFastExponent
        && record.mantissa <= Profile::MaxFastMantissa;
}

// Computes 'mantissa * 10^exponent' directly.
// Returns false if the preconditions do not hold; 'value' is left untouched in this case.
//
// The mantissa fits into the significand of Float. If 10^exponent (resp. 10^-exponent) fits
// into a Float too, then we can compute the result simply by multiplying (resp. dividing) the
// two numbers. This is possible because IEEE guarantees that floating-point operations return
// the best possible approximation.
template <typename Float>
inline bool FastPath(ScanRecord const& record, Float& value)
{
    using Traits = FloatTraits<Float>;

    if (!FastPathApplies<Float>(record))
        return false;

    Float d = Traits::FromInteger(record.mantissa);
    if (record.exponent < 0)
    {
        d = Traits::Divide(d, ExactPowerOfTen<Float>(static_cast<int>(-record.exponent)));
    }
    else
    {
        d = Traits::Multiply(d, ExactPowerOfTen<Float>(static_cast<int>(record.exponent)));
    }

    value = record.is_negative ? Traits::Negate(d) : d;
    return true;
}

} // namespace impl
} // namespace numscan
