#include <benchmark/benchmark.h>
#include <visual_chunker/document_chunker.h>
#include <visual_chunker/json_serializer.h>
#include <string>
#include <vector>

using namespace visual_chunker;

namespace {

// Paginated synthetic report: `pages` pages of prose, one chart per page
Document make_report(int pages) {
    Document document;
    document.name = "synthetic";
    document.type = DocumentType::paginated;

    for (int page = 0; page < pages; ++page) {
        if (page > 0) document.content += '\f';
        for (int i = 0; i < 30; ++i) {
            document.content += "Section " + std::to_string(i) +
                                " reviews the quarterly figures, see the revenue chart for page " +
                                std::to_string(page + 1) + ". ";
        }
    }
    return document;
}

std::vector<VisualElement> make_charts(int pages) {
    std::vector<VisualElement> visuals;
    for (int page = 1; page <= pages; ++page) {
        VisualElement chart;
        chart.id = "chart_" + std::to_string(page);
        chart.type = "chart";
        chart.page_number = page;
        chart.bounding_box = BoundingBox{100, 300, 400, 200};
        chart.title = "revenue chart";
        visuals.push_back(chart);
    }
    return visuals;
}

} // namespace

static void BM_ChunkPaginated(benchmark::State& state) {
    int pages = static_cast<int>(state.range(0));
    Document document = make_report(pages);
    auto visuals = make_charts(pages);
    ChunkingConfig config;

    size_t chunks = 0;
    for (auto _ : state) {
        auto result = chunk_document(document, visuals, config);
        chunks = result.chunks.size();
        benchmark::DoNotOptimize(result);
    }

    state.counters["chunks"] = static_cast<double>(chunks);
    state.counters["pages_per_second"] = benchmark::Counter(
        static_cast<double>(pages), benchmark::Counter::kIsIterationInvariantRate);
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * document.content.size());
}
BENCHMARK(BM_ChunkPaginated)->Range(1, 256);

static void BM_ChunkFlat(benchmark::State& state) {
    Document document = make_report(static_cast<int>(state.range(0)));
    document.type = DocumentType::flat;
    ChunkingConfig config;

    for (auto _ : state) {
        auto result = chunk_document(document, {}, config);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * document.content.size());
}
BENCHMARK(BM_ChunkFlat)->Range(1, 256);

static void BM_VisualAssociation(benchmark::State& state) {
    Document document = make_report(16);
    auto visuals = make_charts(static_cast<int>(state.range(0)));
    ChunkingConfig config;
    config.semantic_boundary_detection = false;
    config.adaptive_chunk_sizing = false;

    for (auto _ : state) {
        auto result = chunk_document(document, visuals, config);
        benchmark::DoNotOptimize(result);
    }

    state.counters["visuals"] = static_cast<double>(visuals.size());
}
BENCHMARK(BM_VisualAssociation)->Range(1, 1024);

static void BM_SerializeResult(benchmark::State& state) {
    int pages = static_cast<int>(state.range(0));
    auto visuals = make_charts(pages);
    auto result = chunk_document(make_report(pages), visuals, ChunkingConfig{});

    for (auto _ : state) {
        auto json = JsonSerializer::serialize_result(result, "synthetic");
        benchmark::DoNotOptimize(json);
    }

    state.counters["chunks"] = static_cast<double>(result.chunks.size());
}
BENCHMARK(BM_SerializeResult)->Range(1, 256);

BENCHMARK_MAIN();
