// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief IntTrig benchmark entry-point.
///
/// Headless benchmark: sweeps the full angle domain through the integer
/// sine, cosine and combined entry points for profiling.
// /////////////////////////////////////////////////////////////////////////////

#include <itrig/core/Constants.hpp>
#include <itrig/core/Log.hpp>
#include <itrig/core/Types.hpp>
#include <itrig/math/Trig.hpp>

#include <chrono>
#include <cstdio>

using namespace itrig;

namespace {

constexpr core::u32 kIterations = 1'000'000;

template <typename Fn>
core::f64 benchmarkMs(const char* label, Fn&& fn)
{
    const auto start = std::chrono::steady_clock::now();
    const core::i64 checksum = fn();
    const auto end = std::chrono::steady_clock::now();
    const core::f64 ms = std::chrono::duration<core::f64, std::milli>(end - start).count();
    std::printf("  %-28s %10.3f ms   (checksum %lld)\n", label, ms, static_cast<long long>(checksum));
    return ms;
}

void benchmarkSin()
{
    benchmarkMs("Trig::sin 1M", []()
    {
        core::i64 acc = 0;
        for (core::u32 i = 0; i < kIterations; ++i)
            acc += math::Trig::sin(static_cast<core::u16>(i & core::kAngleMask));
        return acc;
    });
}

void benchmarkCos()
{
    benchmarkMs("Trig::cos 1M", []()
    {
        core::i64 acc = 0;
        for (core::u32 i = 0; i < kIterations; ++i)
            acc += math::Trig::cos(static_cast<core::u16>(i & core::kAngleMask));
        return acc;
    });
}

void benchmarkSinCos()
{
    benchmarkMs("Trig::sincos 1M", []()
    {
        core::i64 acc = 0;
        for (core::u32 i = 0; i < kIterations; ++i)
        {
            core::i32 s = 0;
            core::i32 c = 0;
            math::Trig::sincos(static_cast<core::u16>(i & core::kAngleMask), s, c);
            acc += s - c;
        }
        return acc;
    });
}

} // anonymous namespace

int main(int /*argc*/, char* /*argv*/[])
{
    core::Log::info("=== IntTrig Benchmark ===");
    std::printf("\n");

    benchmarkSin();
    benchmarkCos();
    benchmarkSinCos();

    std::printf("\n");
    core::Log::info("Benchmark complete");
    return 0;
}
