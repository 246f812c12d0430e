#include <gtest/gtest.h>
#include <visual_chunker/document_chunker.h>
#include <visual_chunker/errors.h>
#include <visual_chunker/structure_parser.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <limits>
#include <set>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace visual_chunker;

class DocumentChunkerTest : public ::testing::Test {
protected:
    static std::string MakeUnbrokenText(size_t length) {
        std::string text;
        for (size_t i = 0; i < length; ++i) {
            text += static_cast<char>('a' + i % 26);
        }
        return text;
    }

    static std::string MakeSentences(int count, const std::string& topic) {
        std::string text;
        for (int i = 0; i < count; ++i) {
            if (!text.empty()) text += ' ';
            text += "Sentence " + std::to_string(i) + " describes the " + topic + " in some detail.";
        }
        return text;
    }

    static Document MakeTwoPageDocument() {
        Document document;
        document.name = "report";
        document.type = DocumentType::paginated;
        document.content = MakeSentences(40, "survey results") + "\f" + MakeSentences(35, "budget plan");
        return document;
    }

    static std::vector<VisualElement> MakeVisuals() {
        std::vector<VisualElement> visuals(4);
        visuals[0].id = "chart_p1";
        visuals[0].type = "chart";
        visuals[0].page_number = 1;
        visuals[0].bounding_box = BoundingBox{100, 200, 300, 150};

        visuals[1].id = "table_p2";
        visuals[1].type = "table";
        visuals[1].page_number = 2;

        visuals[2].id = "diagram_far";
        visuals[2].type = "diagram";
        visuals[2].page_number = 9;
        visuals[2].title = "budget plan";

        double nan = std::numeric_limits<double>::quiet_NaN();
        visuals[3].id = "broken";
        visuals[3].type = "image";
        visuals[3].page_number = 1;
        visuals[3].bounding_box = BoundingBox{nan, nan, nan, nan};
        return visuals;
    }

    static std::vector<std::pair<size_t, size_t>> SortedRanges(const ChunkingResult& result) {
        std::vector<std::pair<size_t, size_t>> ranges;
        for (const auto& chunk : result.chunks) {
            ranges.emplace_back(chunk.start_index, chunk.end_index);
        }
        std::sort(ranges.begin(), ranges.end());
        return ranges;
    }

    ChunkingConfig config_;
};

TEST_F(DocumentChunkerTest, ScenarioFlatTextWithOverlap) {
    Document document{"flat", MakeUnbrokenText(2500), DocumentType::flat};

    auto result = chunk_document(document, {}, config_);

    ASSERT_EQ(result.chunks.size(), 3u);
    EXPECT_EQ(result.chunks[0].start_index, 0u);
    EXPECT_EQ(result.chunks[0].end_index, 1000u);
    EXPECT_EQ(result.chunks[1].start_index, 850u);
    EXPECT_EQ(result.chunks[1].end_index, 1850u);
    EXPECT_EQ(result.chunks[2].start_index, 1700u);
    EXPECT_EQ(result.chunks[2].end_index, 2500u);

    for (size_t i = 0; i < result.chunks.size(); ++i) {
        EXPECT_LE(result.chunks[i].content.size(), 1000u);
        if (i + 1 < result.chunks.size()) {
            const auto& tail = result.chunks[i].content;
            const auto& head = result.chunks[i + 1].content;
            EXPECT_EQ(tail.substr(tail.size() - 150), head.substr(0, 150));
        }
    }
    EXPECT_EQ(result.metadata.total_chunks, 3u);
    EXPECT_EQ(result.metadata.average_chunk_size, 933u);
}

TEST_F(DocumentChunkerTest, ScenarioTwoPagesStayApart) {
    auto document = MakeTwoPageDocument();

    auto result = chunk_document(document, MakeVisuals(), config_);

    ASSERT_FALSE(result.chunks.empty());
    size_t distributed = 0;
    for (const auto& [page, count] : result.metadata.page_distribution) {
        distributed += count;
    }
    EXPECT_EQ(distributed, result.metadata.total_chunks);
    EXPECT_EQ(result.metadata.page_distribution.size(), 2u);

    for (const auto& chunk : result.chunks) {
        ASSERT_TRUE(chunk.page_number.has_value());
        std::string text = document.content.substr(chunk.start_index, chunk.end_index - chunk.start_index);
        EXPECT_EQ(text.find('\f'), std::string::npos) << chunk.id;
    }
}

TEST_F(DocumentChunkerTest, ScenarioVisualHeavyChunk) {
    Document document;
    document.type = DocumentType::paginated;
    document.content = "Chart one shows the distribution of monthly revenue across all regions.";

    VisualElement chart;
    chart.id = "revenue_chart";
    chart.type = "chart";
    chart.page_number = 1;
    chart.bounding_box = BoundingBox{200, 300, 200, 100};

    auto result = chunk_document(document, {chart}, config_);

    ASSERT_EQ(result.chunks.size(), 1u);
    const auto& chunk = result.chunks[0];
    EXPECT_EQ(chunk.section_type, SectionType::visual_heavy);
    EXPECT_GT(chunk.context.visual_density, 0.6);
    ASSERT_EQ(chunk.visual_references.size(), 1u);
    EXPECT_EQ(chunk.visual_references[0], "revenue_chart");
    EXPECT_EQ(result.metadata.visual_context_chunks, 1u);
}

TEST_F(DocumentChunkerTest, ScenarioCommaBoundaryMerge) {
    Document document;
    document.type = DocumentType::structured;
    document.content = "Revenue grew strongly this quarter, as Figure A shows in detail,\n\n"
                       "and costs fell as shown in Figure B.";

    std::vector<VisualElement> visuals(2);
    visuals[0].id = "fig_a";
    visuals[0].type = "chart";
    visuals[0].title = "Figure A";
    visuals[1].id = "fig_b";
    visuals[1].type = "chart";
    visuals[1].title = "Figure B";

    auto result = chunk_document(document, visuals, config_);

    ASSERT_EQ(result.chunks.size(), 1u);
    const auto& chunk = result.chunks[0];
    EXPECT_TRUE(chunk.merged);
    EXPECT_EQ(chunk.start_index, 0u);
    EXPECT_EQ(chunk.end_index, document.content.size());
    std::set<std::string> references(chunk.visual_references.begin(), chunk.visual_references.end());
    EXPECT_EQ(references, (std::set<std::string>{"fig_a", "fig_b"}));
}

TEST_F(DocumentChunkerTest, RangesCoverContent) {
    Document document{"long", MakeSentences(120, "chunking pipeline"), DocumentType::flat};

    auto result = chunk_document(document, {}, config_);
    auto ranges = SortedRanges(result);

    ASSERT_FALSE(ranges.empty());
    EXPECT_EQ(ranges.front().first, 0u);
    size_t covered = 0;
    for (const auto& [start, end] : ranges) {
        EXPECT_LE(start, covered);
        covered = std::max(covered, end);
    }
    EXPECT_EQ(covered, document.content.size());
}

TEST_F(DocumentChunkerTest, ChunkSizesStayWithinBounds) {
    Document document{"long", MakeSentences(120, "chunking pipeline"), DocumentType::flat};

    auto result = chunk_document(document, {}, config_);

    ASSERT_GT(result.chunks.size(), 2u);
    for (size_t i = 0; i + 1 < result.chunks.size(); ++i) {
        const auto& chunk = result.chunks[i];
        if (chunk.merged) continue;
        EXPECT_GE(chunk.content.size(), config_.min_chunk_size) << chunk.id;
        EXPECT_LE(chunk.content.size(), config_.max_chunk_size) << chunk.id;
    }
}

TEST_F(DocumentChunkerTest, ReferencesPointAtInputVisuals) {
    auto visuals = MakeVisuals();
    std::set<std::string> ids;
    for (const auto& visual : visuals) ids.insert(visual.id);

    auto result = chunk_document(MakeTwoPageDocument(), visuals, config_);

    bool any_reference = false;
    for (const auto& chunk : result.chunks) {
        for (const auto& reference : chunk.visual_references) {
            EXPECT_TRUE(ids.count(reference)) << reference;
            EXPECT_NE(reference, "broken");
            any_reference = true;
        }
        for (const auto* visual : chunk.context.nearby_visuals) {
            EXPECT_GE(visual, visuals.data());
            EXPECT_LT(visual, visuals.data() + visuals.size());
        }
    }
    EXPECT_TRUE(any_reference);
}

TEST_F(DocumentChunkerTest, Deterministic) {
    auto document = MakeTwoPageDocument();
    auto visuals = MakeVisuals();

    auto first = chunk_document(document, visuals, config_);
    auto second = chunk_document(document, visuals, config_);

    ASSERT_EQ(first.chunks.size(), second.chunks.size());
    for (size_t i = 0; i < first.chunks.size(); ++i) {
        EXPECT_EQ(first.chunks[i].id, second.chunks[i].id);
        EXPECT_EQ(first.chunks[i].content, second.chunks[i].content);
        EXPECT_EQ(first.chunks[i].start_index, second.chunks[i].start_index);
        EXPECT_EQ(first.chunks[i].end_index, second.chunks[i].end_index);
        EXPECT_EQ(first.chunks[i].visual_references, second.chunks[i].visual_references);
    }
}

TEST_F(DocumentChunkerTest, ChunksNeverCrossPages) {
    auto document = MakeTwoPageDocument();
    auto pages = StructureParser().parse_pages(document.content);
    ASSERT_EQ(pages.size(), 2u);

    auto result = chunk_document(document, MakeVisuals(), config_);

    for (const auto& chunk : result.chunks) {
        ASSERT_TRUE(chunk.page_number.has_value());
        const auto& page = pages[*chunk.page_number - 1];
        EXPECT_GE(chunk.start_index, page.start_offset) << chunk.id;
        EXPECT_LE(chunk.end_index, page.end_offset) << chunk.id;
    }
}

TEST_F(DocumentChunkerTest, ZeroOverlapChunksAreDisjoint) {
    config_.overlap_size = 0;
    Document document{"long", MakeSentences(120, "chunking pipeline"), DocumentType::flat};

    auto ranges = SortedRanges(chunk_document(document, {}, config_));

    ASSERT_GT(ranges.size(), 1u);
    for (size_t i = 1; i < ranges.size(); ++i) {
        EXPECT_GE(ranges[i].first, ranges[i - 1].second);
    }
}

TEST_F(DocumentChunkerTest, StagesCanBeDisabled) {
    config_.semantic_boundary_detection = false;
    config_.adaptive_chunk_sizing = false;
    config_.include_visual_context = false;
    Document document;
    document.type = DocumentType::structured;
    document.content = "Ends on a comma,\n\nand continues here.";

    auto result = chunk_document(document, MakeVisuals(), config_);

    ASSERT_EQ(result.chunks.size(), 2u);
    EXPECT_FALSE(result.chunks[0].merged);
    EXPECT_EQ(result.metadata.visual_context_chunks, 0u);
    EXPECT_EQ(result.chunks[0].section_title.value_or(""), "Section 1");
}

TEST_F(DocumentChunkerTest, EmptyDocument) {
    Document document;
    document.content = "   ";

    auto result = chunk_document(document, MakeVisuals(), config_);

    EXPECT_TRUE(result.chunks.empty());
    EXPECT_EQ(result.metadata.total_chunks, 0u);
    EXPECT_EQ(result.metadata.average_chunk_size, 0u);
}

TEST_F(DocumentChunkerTest, BrokenMarkupFallsBackToFlat) {
    Document document;
    document.type = DocumentType::markup;
    document.content = "<h1>Heading that never closes\n\nBody text follows.";

    ChunkingResult result;
    ASSERT_NO_THROW(result = chunk_document(document, {}, config_));

    ASSERT_EQ(result.chunks.size(), 1u);
    EXPECT_FALSE(result.chunks[0].section_title.has_value());
    EXPECT_FALSE(result.chunks[0].section_index.has_value());
}

TEST_F(DocumentChunkerTest, InvalidConfigThrowsPipelineError) {
    Document document{"doc", "Some text.", DocumentType::flat};

    config_.max_chunk_size = 0;
    EXPECT_THROW(chunk_document(document, {}, config_), PipelineError);

    config_.max_chunk_size = 100;
    config_.min_chunk_size = 200;
    EXPECT_THROW(chunk_document(document, {}, config_), PipelineError);
}

TEST_F(DocumentChunkerTest, FacadeReportsErrors) {
    config_.max_chunk_size = 0;
    DocumentChunker chunker(config_);

    ChunkingResult result;
    ASSERT_NO_THROW(result = chunker.chunk(Document{"doc", "Some text.", DocumentType::flat}));

    EXPECT_FALSE(result.error.empty());
    EXPECT_NE(result.error.find("maxChunkSize"), std::string::npos);
    EXPECT_TRUE(result.chunks.empty());
}

TEST_F(DocumentChunkerTest, FacadeKeepsConfiguration) {
    config_.max_chunk_size = 640;
    DocumentChunker chunker(config_);

    EXPECT_EQ(chunker.get_config().max_chunk_size, 640u);
    EXPECT_TRUE(chunker.chunk(Document{"doc", "Short text.", DocumentType::flat}).error.empty());
}

TEST_F(DocumentChunkerTest, ConcurrentCallersShareOneChunker) {
    DocumentChunker chunker(config_);
    auto document = MakeTwoPageDocument();
    auto visuals = MakeVisuals();
    auto expected = chunker.chunk(document, visuals);

    std::vector<std::future<ChunkingResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&]() {
            return chunker.chunk(document, visuals);
        }));
    }

    for (auto& future : futures) {
        auto result = future.get();
        EXPECT_TRUE(result.error.empty());
        ASSERT_EQ(result.chunks.size(), expected.chunks.size());
        for (size_t i = 0; i < result.chunks.size(); ++i) {
            EXPECT_EQ(result.chunks[i].content, expected.chunks[i].content);
            EXPECT_EQ(result.chunks[i].visual_references, expected.chunks[i].visual_references);
        }
    }
}

TEST_F(DocumentChunkerTest, ProcessToJson) {
    DocumentChunker chunker(config_);
    auto document = MakeTwoPageDocument();
    fs::path output = fs::temp_directory_path() / "visual_chunker_process_to_json.json";

    ASSERT_TRUE(chunker.process_to_json(document, MakeVisuals(), output.string()));

    std::ifstream file(output);
    auto json = nlohmann::json::parse(file);
    EXPECT_EQ(json["document"], "report");
    EXPECT_FALSE(json["chunks"].empty());
    EXPECT_EQ(json["metadata"]["totalChunks"].get<size_t>(), json["chunks"].size());

    file.close();
    fs::remove(output);
}

TEST_F(DocumentChunkerTest, ProcessToJsonFailsOnInvalidConfig) {
    config_.max_chunk_size = 0;
    DocumentChunker chunker(config_);
    fs::path output = fs::temp_directory_path() / "visual_chunker_invalid.json";

    EXPECT_FALSE(chunker.process_to_json(Document{"doc", "text", DocumentType::flat}, {}, output.string()));
    EXPECT_FALSE(fs::exists(output));
}
