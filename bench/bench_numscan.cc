#include "benchmark/benchmark.h"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "../src/numscan.h"

#include "double-conversion/double-conversion.h"

#define BENCH_NUMSCAN()             1
#define BENCH_STD_STRTOD()          1
#define BENCH_DOUBLE_CONVERSION()   1

static constexpr int NumFloats = 1 << 14;

#if BENCH_NUMSCAN()
struct S2DNumscan
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        auto const res = numscan::ParseWithDiagnostics<value_type>(str);
        assert(res);
        return res.value;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct S2DStdStrtod
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        value_type flt = std::strtod(str.c_str(), nullptr);
        return flt;
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
struct S2DDoubleConversion
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, std::vector<std::string> const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers[index]) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(std::string const& name, std::vector<std::string> const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(name.c_str(), BenchIt<Converter>, numbers);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
}

static std::mt19937 rng(0x5EED);

static inline void RegisterAll(std::string const& name, std::vector<std::string> const& numbers)
{
#if BENCH_NUMSCAN()
    RegisterBenchmarks<S2DNumscan         >(name + " numscan", numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2DStdStrtod       >(name + " std::strtod", numbers);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks<S2DDoubleConversion>(name + " double_conversion", numbers);
#endif
}

// 'format' selects the number of printed digits:
// "%.6g" mostly takes the fast path, "%.17g" mostly takes the fallback.
static inline void RegisterUniform_double(char const* name, char const* format, double min, double max)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        char buf[128];
        int const len = std::snprintf(buf, 128, format, gen(rng));
        return std::string(buf, buf + len);
    });

    RegisterAll(name, numbers);
}

static inline void RegisterIntegers(char const* name, uint32_t max)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen(0, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        return std::to_string(gen(rng));
    });

    RegisterAll(name, numbers);
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", "%.6g", 0, 1);

    RegisterUniform_double("6 digits  [0,1]", "%.6g", 0, 1);
    RegisterUniform_double("6 digits  [0,1e10]", "%.6g", 0, 1e10);
    RegisterUniform_double("17 digits [0,1]", "%.17g", 0, 1);
    RegisterUniform_double("17 digits [0,1e300]", "%.17g", 0, 1e300);
    RegisterIntegers      ("integers  [0,2^16]", 1u << 16);
    RegisterIntegers      ("integers  [0,2^32-1]", UINT32_MAX);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
