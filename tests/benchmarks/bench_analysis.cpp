// bench_analysis.cpp - impact analysis benchmarks
//
// Measures graph construction, bounded enumeration, scoring and result
// serialization on synthetic layered dependency graphs.
// Baselines for spotting performance regressions.

#include <depimpact/canonical_json.hpp>
#include <depimpact/graph_builder.hpp>
#include <depimpact/impact_analyzer.hpp>
#include <depimpact/path_enumerator.hpp>
#include <depimpact/report.hpp>
#include <depimpact/risk_evaluator.hpp>
#include <depimpact/verdict.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

namespace {

// ===========================================================================
// Test data
// ===========================================================================

constexpr std::array<const char*, 4> kUsages = {"Select", "Update", "Insert", "Delete"};

const depimpact::graph::EntityRef kRoot{.type = depimpact::graph::EntityType::kTable,
                                        .id = 0,
                                        .name = {}};

// Table 0 feeds `width` views; every entity in a layer is used by two
// entities of the next layer, so path counts grow quickly with depth.
std::vector<depimpact::graph::DependencyGraphRow> create_layered_rows(int layers, int width)
{
    std::vector<depimpact::graph::DependencyGraphRow> rows;
    auto id_of = [width](int layer, int index) -> std::int64_t {
        return static_cast<std::int64_t>(layer) * width + index + 1;
    };
    auto type_of = [](int layer) -> std::string {
        return layer % 2 == 0 ? "View" : "StoredProcedure";
    };

    for (int index = 0; index < width; ++index) {
        rows.push_back({.source_type = "View",
                        .source_id = id_of(0, index),
                        .source_name = std::nullopt,
                        .source_criticality = std::nullopt,
                        .target_type = "Table",
                        .target_id = 0,
                        .target_name = std::nullopt,
                        .target_criticality = 4,
                        .dependency_type = kUsages[static_cast<std::size_t>(index) % kUsages.size()]});
    }
    for (int layer = 1; layer < layers; ++layer) {
        for (int index = 0; index < width; ++index) {
            for (int offset = 0; offset < 2; ++offset) {
                const int from = (index + offset) % width;
                rows.push_back({.source_type = type_of(layer),
                                .source_id = id_of(layer, index),
                                .source_name = std::nullopt,
                                .source_criticality = std::nullopt,
                                .target_type = type_of(layer - 1),
                                .target_id = id_of(layer - 1, from),
                                .target_name = std::nullopt,
                                .target_criticality = std::nullopt,
                                .dependency_type =
                                    kUsages[static_cast<std::size_t>(layer + offset) % kUsages.size()]});
            }
        }
    }
    return rows;
}

// ===========================================================================
// Graph and enumeration benchmarks
// ===========================================================================

static void BM_GraphBuild(benchmark::State& state)
{
    const auto rows = create_layered_rows(static_cast<int>(state.range(0)), 50);
    const depimpact::graph::GraphBuilder builder;
    for (auto _ : state) {
        auto graph = builder.build(rows);
        benchmark::DoNotOptimize(graph);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows.size()));
}
BENCHMARK(BM_GraphBuild)->Arg(4)->Arg(8);

static void BM_EnumeratePaths(benchmark::State& state)
{
    const auto rows = create_layered_rows(6, 20);
    auto graph = depimpact::graph::GraphBuilder{}.build(rows);
    if (!graph) {
        state.SkipWithError(graph.error().message.c_str());
        return;
    }
    const depimpact::pathing::EnumerationLimits limits{.max_depth = 6,
                                                       .max_paths =
                                                           static_cast<int>(state.range(0))};
    for (auto _ : state) {
        auto result = depimpact::pathing::enumerate_paths(*graph, kRoot, limits);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EnumeratePaths)->Arg(100)->Arg(1'000)->Arg(10'000);

// ===========================================================================
// Scoring benchmarks
// ===========================================================================

static void BM_EvaluatePaths(benchmark::State& state)
{
    const auto rows = create_layered_rows(6, 20);
    auto graph = depimpact::graph::GraphBuilder{}.build(rows);
    if (!graph) {
        state.SkipWithError(graph.error().message.c_str());
        return;
    }
    auto enumeration = depimpact::pathing::enumerate_paths(*graph, kRoot, {.max_depth = 6, .max_paths = 1'000});
    if (!enumeration) {
        state.SkipWithError(enumeration.error().message.c_str());
        return;
    }
    const depimpact::scoring::PathRiskEvaluator evaluator;
    for (auto _ : state) {
        for (const auto& path : enumeration->paths) {
            auto scored = evaluator.evaluate(path, depimpact::scoring::ChangeType::kModify);
            benchmark::DoNotOptimize(scored);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(enumeration->paths.size()));
}
BENCHMARK(BM_EvaluatePaths);

// ===========================================================================
// End-to-end (analyze + verdict + canonical document)
// ===========================================================================

static void BM_AnalyzeToCanonical(benchmark::State& state)
{
    const auto rows = create_layered_rows(5, 20);
    const depimpact::analysis::ImpactAnalyzer analyzer;
    const depimpact::verdict::VerdictBuilder verdict_builder;
    for (auto _ : state) {
        auto result = analyzer.analyze_rows(rows,
                                            kRoot,
                                            depimpact::scoring::ChangeType::kDelete,
                                            {.max_depth = 5, .max_paths = 2'000});
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        const auto verdict = verdict_builder.build(*result, "2024-01-01T00:00:00Z");
        auto canonical = depimpact::canonical::canonicalize(
            depimpact::report::build_result_document(*result,
                                                     verdict,
                                                     depimpact::default_tool_info()));
        benchmark::DoNotOptimize(canonical);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AnalyzeToCanonical);

}  // namespace
