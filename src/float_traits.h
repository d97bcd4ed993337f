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

#include <cassert>
#include <cstdint>
#include <limits>

#ifndef NUMSCAN_ASSERT
#define NUMSCAN_ASSERT(X) assert(X)
#endif

#ifndef NUMSCAN_NEVER_INLINE
#if _MSC_VER
#define NUMSCAN_NEVER_INLINE __declspec(noinline) inline
#elif __GNUC__
#define NUMSCAN_NEVER_INLINE __attribute__((noinline)) inline
#else
#define NUMSCAN_NEVER_INLINE inline
#endif
#endif

// Double operations detection based on target architecture.
// Linux uses a 80bit wide floating point stack on x86. This induces double rounding, which in
// turn leads to wrong results.
// An easy way to test if the floating-point operations are correct is to evaluate: 89255.0/1e22.
// If the floating-point stack is 64 bits wide then the result is equal to 89255e-22.
#ifndef NUMSCAN_CORRECT_FLOAT_OPERATIONS
#if defined(_M_X64)              || \
    defined(__x86_64__)          || \
    defined(__ARMEL__)           || \
    defined(__avr32__)           || \
    defined(__hppa__)            || \
    defined(__ia64__)            || \
    defined(__mips__)            || \
    defined(__powerpc__)         || \
    defined(__ppc__)             || \
    defined(__ppc64__)           || \
    defined(_POWER)              || \
    defined(_ARCH_PPC)           || \
    defined(_ARCH_PPC64)         || \
    defined(__sparc__)           || \
    defined(__sparc)             || \
    defined(__s390__)            || \
    defined(__SH4__)             || \
    defined(__alpha__)           || \
    defined(_MIPS_ARCH_MIPS32R2) || \
    defined(__AARCH64EL__)       || \
    defined(__aarch64__)         || \
    defined(__riscv)
#define NUMSCAN_CORRECT_FLOAT_OPERATIONS 1
#elif defined(_M_IX86) || defined(__i386__) || defined(__i386)
#if defined(_WIN32) || (defined(__SSE2_MATH__) && defined(__FLT_EVAL_METHOD__) && __FLT_EVAL_METHOD__ == 0)
// Windows uses a 64bit wide floating point stack. So does -mfpmath=sse.
#define NUMSCAN_CORRECT_FLOAT_OPERATIONS 1
#else
#define NUMSCAN_CORRECT_FLOAT_OPERATIONS 0
#endif
#else
#define NUMSCAN_CORRECT_FLOAT_OPERATIONS 0
#endif
#endif

namespace numscan {

// Indices into a character span.
using Index = int64_t;

// Whether FastPath may be used on this target at all.
constexpr bool kFastPathEnabled = NUMSCAN_CORRECT_FLOAT_OPERATIONS != 0;

// How a number has been converted. 'invalid' means no number has been found.
enum class ParseStatus {
    invalid,
    fast_path,
    fallback,
    inf,
    nan,
};

//==================================================================================================
// PrecisionProfile
//
// Bounds for which 'mantissa * 10^exponent' (resp. 'mantissa / 10^-exponent') is computed
// correctly rounded by a single floating-point operation on exact operands.
//==================================================================================================

template <int Precision>
struct PrecisionProfile
{
    static_assert(Precision > 0, "invalid precision");

    static constexpr int      MantissaBits    = Precision; // = p (includes the hidden bit)
    static constexpr int      MinFastExponent = 0;
    static constexpr int      MaxFastExponent = 0;
    static constexpr uint64_t MaxFastMantissa = Precision < 64 ? uint64_t{1} << (Precision < 64 ? Precision : 0)
                                                               : ~uint64_t{0};
};

template <>
struct PrecisionProfile<53>
{
    static constexpr int      MantissaBits    = 53;
    static constexpr int      MinFastExponent = -22; // 10^22 = 4768371582031250 * 2^21 < 2^53 * 2^21
    static constexpr int      MaxFastExponent =  22;
    static constexpr uint64_t MaxFastMantissa = uint64_t{1} << 53;
};

template <>
struct PrecisionProfile<24>
{
    static constexpr int      MantissaBits    = 24;
    static constexpr int      MinFastExponent = -10; // 10^10 = 9765625 * 2^10 < 2^24 * 2^10
    static constexpr int      MaxFastExponent =  10;
    static constexpr uint64_t MaxFastMantissa = uint64_t{1} << 24;
};

//==================================================================================================
// FloatTraits
//==================================================================================================

template <typename Float>
struct FloatTraits
{
    static_assert(std::numeric_limits<Float>::is_iec559,
        "IEEE-754 floating-point implementation required");
    static_assert(std::numeric_limits<Float>::has_infinity && std::numeric_limits<Float>::has_quiet_NaN,
        "infinity and quiet NaN must be representable");

    using value_type = Float;
    using Profile = PrecisionProfile<std::numeric_limits<Float>::digits>;

    static constexpr int Precision = std::numeric_limits<Float>::digits;

    // PRE: value <= Profile::MaxFastMantissa, i.e. the conversion is exact.
    static value_type FromInteger(uint64_t value) { return static_cast<value_type>(value); }

    static value_type Multiply(value_type x, value_type y) { return x * y; }
    static value_type Divide(value_type x, value_type y) { return x / y; }
    static value_type Negate(value_type x) { return -x; }

    static value_type Infinity() { return std::numeric_limits<value_type>::infinity(); }
    static value_type QuietNaN() { return std::numeric_limits<value_type>::quiet_NaN(); }
};

//==================================================================================================
// ExactPowerOfTen
//==================================================================================================

constexpr int kMaxExactPowerOfTen = 22;

// Returns 10^k.
// The result is exact only if |k| is within the range of the matching PrecisionProfile.
template <typename Float>
inline Float ExactPowerOfTen(int k)
{
    static constexpr Float kExactPowersOfTen[] = {
        static_cast<Float>(1.0e+00),
        static_cast<Float>(1.0e+01),
        static_cast<Float>(1.0e+02),
        static_cast<Float>(1.0e+03),
        static_cast<Float>(1.0e+04),
        static_cast<Float>(1.0e+05),
        static_cast<Float>(1.0e+06),
        static_cast<Float>(1.0e+07),
        static_cast<Float>(1.0e+08),
        static_cast<Float>(1.0e+09),
        static_cast<Float>(1.0e+10), // 10^10 = 9765625 * 2^10 (single precision ends here)
        static_cast<Float>(1.0e+11),
        static_cast<Float>(1.0e+12),
        static_cast<Float>(1.0e+13),
        static_cast<Float>(1.0e+14),
        static_cast<Float>(1.0e+15), // 10^15 < 9007199254740992 = 2^53
        static_cast<Float>(1.0e+16), // 10^16 = 5000000000000000 * 2^1  = (10^15 * 5^1 ) * 2^1
        static_cast<Float>(1.0e+17), // 10^17 = 6250000000000000 * 2^4  = (10^13 * 5^4 ) * 2^4
        static_cast<Float>(1.0e+18), // 10^18 = 7812500000000000 * 2^7  = (10^11 * 5^7 ) * 2^7
        static_cast<Float>(1.0e+19), // 10^19 = 4882812500000000 * 2^11 = (10^8  * 5^11) * 2^11
        static_cast<Float>(1.0e+20), // 10^20 = 6103515625000000 * 2^14 = (10^6  * 5^14) * 2^14
        static_cast<Float>(1.0e+21), // 10^21 = 7629394531250000 * 2^17 = (10^4  * 5^17) * 2^17
        static_cast<Float>(1.0e+22), // 10^22 = 4768371582031250 * 2^21 = (10^1  * 5^21) * 2^21
    };
    static_assert(sizeof(kExactPowersOfTen) / sizeof(kExactPowersOfTen[0]) == kMaxExactPowerOfTen + 1,
        "internal error");

    NUMSCAN_ASSERT(k >= 0);
    NUMSCAN_ASSERT(k <= kMaxExactPowerOfTen);
    return kExactPowersOfTen[k];
}

} // namespace numscan
