// docdelta-cpp benchmarks — measures diff throughput on synthetic documents.

#include <docdelta-cpp/docdelta.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace docdelta_cpp;

static auto paragraph(const std::string& text) -> Element {
    return make_paragraph(text);
}

// n paragraphs, with a table every 10 paragraphs.
static auto make_body(std::size_t n, const std::string& tag) -> Section {
    auto body = Section{};
    for (std::size_t i = 0; i < n; ++i) {
        body.content.push_back(paragraph("paragraph " + std::to_string(i) + " " + tag));
        if (i % 10 == 9) {
            body.content.emplace_back(make_table({{"a" + tag, "b"}, {"c", "d" + std::to_string(i)}}));
        }
    }
    body.content.push_back(paragraph(""));
    return body;
}

static auto make_document(std::size_t n, std::size_t headers, const std::string& tag) -> Document {
    auto doc = Document{};
    doc.sections.push_back(make_body(n, tag));
    for (std::size_t h = 0; h < headers; ++h) {
        auto header = Section{};
        header.kind = SectionKind::header;
        header.id = "h" + std::to_string(h);
        for (std::size_t i = 0; i < n / 4 + 1; ++i) {
            header.content.push_back(paragraph("header line " + std::to_string(i) + " " + tag));
        }
        doc.sections.push_back(std::move(header));
    }
    return doc;
}

// =============================================================================
// Body diffs
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_document(n, 0, "x");
    const auto engine = DiffEngine{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.diff(doc, doc));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical)->Arg(100)->Arg(1000);

static void bm_diff_every_paragraph_changed(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto pristine = make_document(n, 0, "old");
    const auto current = make_document(n, 0, "new");
    const auto engine = DiffEngine{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.diff(pristine, current));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_every_paragraph_changed)->Arg(100)->Arg(1000);

static void bm_diff_append(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto pristine = make_document(n, 0, "x");
    auto current = pristine;
    auto& content = current.sections.front().content;
    content.insert(content.end() - 1, paragraph("appended"));
    const auto engine = DiffEngine{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.diff(pristine, current));
    }
}
BENCHMARK(bm_diff_append)->Arg(100)->Arg(1000);

// =============================================================================
// Segments
// =============================================================================

static void bm_diff_headers(benchmark::State& state) {
    const auto threads = static_cast<unsigned int>(state.range(0));
    const auto pristine = make_document(200, 32, "old");
    const auto current = make_document(200, 32, "new");
    const auto engine = DiffEngine{DiffOptions{.num_threads = threads, .tab_id = std::nullopt}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.diff(pristine, current));
    }
}
BENCHMARK(bm_diff_headers)->Arg(1)->Arg(4)->UseRealTime();

// =============================================================================
// Serialization
// =============================================================================

static void bm_to_batch_update(benchmark::State& state) {
    const auto ops = DiffEngine{}.diff(make_document(500, 0, "old"), make_document(500, 0, "new"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(to_batch_update(ops).dump());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(ops.size()));
}
BENCHMARK(bm_to_batch_update);
