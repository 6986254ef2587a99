#include <benchmark/benchmark.h>
#include "biopat/logging.hpp"
#include "biopat/pattern.hpp"
#include "biopat/scan.hpp"

#include <random>
#include <string>

using namespace biopat;

// ============================================================================
// Helper Functions
// ============================================================================

static std::string generateRandomSequence(size_t length, unsigned seed = 42) {
    static const char bases[] = "ACGT";
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 3);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += bases[dist(rng)];
    }
    return result;
}

// Random background with the target planted at the end
static Sequence generateWithTarget(size_t length, const std::string& target) {
    auto symbols = generateRandomSequence(length);
    symbols.replace(symbols.length() - target.length(), target.length(), target);
    return Sequence(symbols);
}

// ============================================================================
// Motif Benchmarks
// ============================================================================

static void BM_MotifMatch(benchmark::State& state) {
    Motif motif("ACGTACGTAC", 0.8);
    auto input = generateRandomSequence(100);

    for (auto _ : state) {
        auto result = motif.match(input);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_MotifMatch);

static void BM_LocateMotif(benchmark::State& state) {
    auto seq = generateWithTarget(static_cast<size_t>(state.range(0)), "GATTACAGATTACA");
    Pattern pattern = Motif("GATTACAGATTACA");

    for (auto _ : state) {
        auto pos = locate(seq, pattern);
        benchmark::DoNotOptimize(pos);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LocateMotif)->Range(1000, 100000);

static void BM_LocateFuzzyMotif(benchmark::State& state) {
    auto seq = generateWithTarget(static_cast<size_t>(state.range(0)), "GATTACAGATTACA");
    Pattern pattern = Motif("GATTACAGATTNCA", 0.9);

    for (auto _ : state) {
        auto pos = locate(seq, pattern);
        benchmark::DoNotOptimize(pos);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LocateFuzzyMotif)->Range(1000, 100000);

// ============================================================================
// Composite Benchmarks
// ============================================================================

static void BM_LocateSeries(benchmark::State& state) {
    auto seq = generateWithTarget(static_cast<size_t>(state.range(0)), "TATAATTTTTTTTTTGCGCGC");
    Pattern pattern = Series({Motif("TATAAT"), Gap(5, 15), Motif("GCGCGC")});

    for (auto _ : state) {
        auto pos = locate(seq, pattern);
        benchmark::DoNotOptimize(pos);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LocateSeries)->Range(1000, 100000);

static void BM_LocateRepeat(benchmark::State& state) {
    auto seq = generateWithTarget(static_cast<size_t>(state.range(0)), "CAGTCAGTTCAGTTTCAG");
    Pattern pattern = Repeat("CAG", 1, 3, 1.0, 4);

    for (auto _ : state) {
        auto pos = locate(seq, pattern);
        benchmark::DoNotOptimize(pos);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LocateRepeat)->Range(1000, 100000);

static void BM_LocateSet(benchmark::State& state) {
    auto seq = generateWithTarget(static_cast<size_t>(state.range(0)), "GGGGCCCCGGGGCCCC");
    Pattern pattern = Set({Motif("AAAAAAAAAAAA"), Motif("TTTTTTTTTTTT"), Motif("GGGGCCCCGGGG")}, 0.9);

    for (auto _ : state) {
        auto pos = locate(seq, pattern);
        benchmark::DoNotOptimize(pos);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LocateSet)->Range(1000, 100000);

// ============================================================================
// Prosite Benchmarks
// ============================================================================

static void BM_PrositeCompile(benchmark::State& state) {
    for (auto _ : state) {
        auto expression = Prosite::compile("A-x-[CG]-{T}-G(2,4)-x-T");
        benchmark::DoNotOptimize(expression);
    }
}
BENCHMARK(BM_PrositeCompile);

static void BM_ExistsProsite(benchmark::State& state) {
    auto seq = generateWithTarget(static_cast<size_t>(state.range(0)), "AACGGGGATT");
    Pattern pattern = Prosite("A-x-[CG]-{T}-G(2,4)-x-T");

    for (auto _ : state) {
        auto found = exists(seq, pattern);
        benchmark::DoNotOptimize(found);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ExistsProsite)->Range(1000, 10000);

int main(int argc, char** argv) {
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    biopat::logging::init();
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
