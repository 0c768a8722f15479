/**
 * @file test_similaritygraph.cpp
 * @brief Unit tests for the SimilarityGraph class
 *
 * Signatures are built by hand so that the similarity of every pair is
 * known exactly: two signatures of ten slots agreeing in eight slots score
 * 0.8.
 */

#include <gtest/gtest.h>
#include "errors.hpp"
#include "similaritygraph.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace {

const std::vector<uint32_t> BASE = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

/** BASE with the given slots replaced by 100 + slot */
std::vector<uint32_t> variant(std::initializer_list<std::size_t> slots,
                              uint32_t offset = 100) {
    std::vector<uint32_t> values = BASE;
    for (auto slot : slots) {
        values[slot] = offset + static_cast<uint32_t>(slot);
    }
    return values;
}

FileRecord record(const std::string& path, std::vector<uint32_t> values) {
    FileRecord file(path, 10, FileRecord::Clock::now(), FileRecord::Clock::now());
    file.setSignature(Signature(std::move(values)));
    return file;
}

FileRecord unsignedRecord(const std::string& path) {
    return FileRecord(path, 10, FileRecord::Clock::now(), FileRecord::Clock::now());
}

GraphConfig withThreshold(double threshold,
                          EdgePropagation propagation = EdgePropagation::Representative) {
    GraphConfig config;
    config.threshold = threshold;
    config.propagation = propagation;
    return config;
}

} // namespace

class SimilarityGraphTest : public ::testing::Test {
protected:
    Logger quiet{nullptr};
    SignatureCache cache;
};

TEST_F(SimilarityGraphTest, EmptyGraphHasNoGroups) {
    SimilarityGraph graph(cache, {}, quiet);

    EXPECT_EQ(graph.add({}), 0u);
    EXPECT_TRUE(graph.groups().empty());
    EXPECT_EQ(graph.nodeCount(), 0u);
}

TEST_F(SimilarityGraphTest, SingleFileFormsNoGroup) {
    SimilarityGraph graph(cache, {}, quiet);

    EXPECT_EQ(graph.add({record("/d/a.txt", BASE)}), 1u);
    EXPECT_TRUE(graph.groups().empty());
    EXPECT_TRUE(graph.contains("/d/a.txt"));
}

/**
 * @test AllSimilarFilesFormOneGroup
 * @brief Identical signatures end up in one group with similarity 1.0
 */
TEST_F(SimilarityGraphTest, AllSimilarFilesFormOneGroup) {
    SimilarityGraph graph(cache, {}, quiet);
    graph.add({record("/d/c.txt", BASE), record("/d/a.txt", BASE),
               record("/d/b.txt", BASE)});

    auto groups = graph.groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].files,
              (std::vector<std::string>{"/d/a.txt", "/d/b.txt", "/d/c.txt"}));
    EXPECT_DOUBLE_EQ(groups[0].similarity, 1.0);
    EXPECT_EQ(graph.edgeCount(), 3u);
}

TEST_F(SimilarityGraphTest, DissimilarFilesFormNoGroup) {
    SimilarityGraph graph(cache, withThreshold(0.8), quiet);
    graph.add({record("/d/a.txt", BASE),
               record("/d/b.txt", variant({0, 1, 2, 3, 4, 5}))});

    EXPECT_TRUE(graph.groups().empty());
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_EQ(graph.nodeCount(), 2u);
}

/**
 * @test ThresholdIsInclusive
 * @brief A pair scoring exactly the threshold is connected, one slot less
 *        is not
 */
TEST_F(SimilarityGraphTest, ThresholdIsInclusive) {
    SimilarityGraph graph(cache, withThreshold(0.8), quiet);
    graph.add({record("/d/a.txt", BASE), record("/d/b.txt", variant({0, 1})),
               record("/d/c.txt", variant({7, 8, 9}))});

    auto ab = graph.weight("/d/a.txt", "/d/b.txt");
    ASSERT_TRUE(ab.has_value());
    EXPECT_DOUBLE_EQ(*ab, 0.8);
    EXPECT_FALSE(graph.weight("/d/a.txt", "/d/c.txt").has_value());

    auto groups = graph.groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].files, (std::vector<std::string>{"/d/a.txt", "/d/b.txt"}));
}

TEST_F(SimilarityGraphTest, GroupsSortedByMeanSimilarity) {
    SimilarityGraph graph(cache, withThreshold(0.8), quiet);
    const auto other = variant({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, 500);

    graph.add({record("/a/1.txt", BASE), record("/a/2.txt", variant({3})),
               record("/b/1.txt", other), record("/b/2.txt", other)});

    auto groups = graph.groups();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].files[0], "/b/1.txt");
    EXPECT_DOUBLE_EQ(groups[0].similarity, 1.0);
    EXPECT_EQ(groups[1].files[0], "/a/1.txt");
    EXPECT_DOUBLE_EQ(groups[1].similarity, 0.9);
}

/**
 * @test GroupIdsStayStable
 * @brief A group keeps its id when files join it and when another group
 *        disappears
 */
TEST_F(SimilarityGraphTest, GroupIdsStayStable) {
    SimilarityGraph graph(cache, withThreshold(0.8), quiet);
    const auto other = variant({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, 500);

    graph.add({record("/a/1.txt", BASE), record("/a/2.txt", BASE)});
    graph.add({record("/b/1.txt", other), record("/b/2.txt", other)});

    auto first = graph.groups();
    ASSERT_EQ(first.size(), 2u);
    int idA = 0;
    int idB = 0;
    for (const auto& group : first) {
        (group.files[0] == "/a/1.txt" ? idA : idB) = group.id;
    }
    EXPECT_NE(idA, idB);

    graph.add({record("/a/3.txt", BASE)});
    graph.remove({"/b/1.txt"});

    auto second = graph.groups();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].id, idA);
    EXPECT_EQ(second[0].files.size(), 3u);
}

/**
 * @test MergedGroupsKeepOlderId
 * @brief A file bridging two groups merges them under the smaller id
 */
TEST_F(SimilarityGraphTest, MergedGroupsKeepOlderId) {
    SimilarityGraph graph(cache, withThreshold(0.8), quiet);
    // x differs from BASE in slots 0..3, the bridge only in slots 0 and 1
    std::vector<uint32_t> x = variant({0, 1, 2, 3});
    std::vector<uint32_t> bridge = BASE;
    bridge[0] = x[0];
    bridge[1] = x[1];

    graph.add({record("/a/1.txt", BASE), record("/a/2.txt", BASE)});
    auto before = graph.groups();
    ASSERT_EQ(before.size(), 1u);
    const int older = before[0].id;

    graph.add({record("/x/1.txt", x), record("/x/2.txt", x)});
    ASSERT_EQ(graph.groups().size(), 2u);

    graph.add({record("/m/bridge.txt", bridge)});
    auto merged = graph.groups();
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].id, older);
    EXPECT_EQ(merged[0].files.size(), 5u);
}

/**
 * @test RepresentativeEdgesAreInherited
 * @brief A file joining an existing group is compared with the group's
 *        representative and connected to every other member with that
 *        weight
 */
TEST_F(SimilarityGraphTest, RepresentativeEdgesAreInherited) {
    SimilarityGraph graph(cache, withThreshold(0.8), quiet);
    graph.add({record("/d/a.txt", BASE), record("/d/b.txt", variant({0, 1}))});
    graph.add({record("/d/c.txt", variant({8, 9}))});

    auto pairs = graph.pairSimilarities({"/d/a.txt", "/d/b.txt", "/d/c.txt"});
    ASSERT_EQ(pairs.size(), 3u);

    EXPECT_EQ(pairs[0].second, "/d/b.txt");
    EXPECT_FALSE(pairs[0].inherited);

    EXPECT_EQ(pairs[1].first, "/d/a.txt");
    EXPECT_EQ(pairs[1].second, "/d/c.txt");
    EXPECT_DOUBLE_EQ(pairs[1].weight, 0.8);
    EXPECT_FALSE(pairs[1].inherited);

    EXPECT_EQ(pairs[2].first, "/d/b.txt");
    EXPECT_EQ(pairs[2].second, "/d/c.txt");
    EXPECT_DOUBLE_EQ(pairs[2].weight, 0.8);
    EXPECT_TRUE(pairs[2].inherited);
}

TEST_F(SimilarityGraphTest, ExactPropagationComparesEveryNode) {
    SimilarityGraph graph(cache, withThreshold(0.8, EdgePropagation::Exact), quiet);
    graph.add({record("/d/a.txt", BASE), record("/d/b.txt", variant({0, 1}))});
    graph.add({record("/d/c.txt", variant({8, 9}))});

    EXPECT_TRUE(graph.weight("/d/a.txt", "/d/c.txt").has_value());
    EXPECT_FALSE(graph.weight("/d/b.txt", "/d/c.txt").has_value());

    auto groups = graph.groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].files.size(), 3u);
}

TEST_F(SimilarityGraphTest, RemovePurgesCache) {
    SimilarityGraph graph(cache, {}, quiet);
    graph.add({record("/d/a.txt", BASE), record("/d/b.txt", BASE)});
    ASSERT_TRUE(cache.contains("/d/a.txt"));

    graph.remove({"/d/a.txt", "/d/unknown.txt"});

    EXPECT_FALSE(graph.contains("/d/a.txt"));
    EXPECT_FALSE(cache.contains("/d/a.txt"));
    EXPECT_TRUE(cache.contains("/d/b.txt"));
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_TRUE(graph.groups().empty());
}

TEST_F(SimilarityGraphTest, DissolveKeepsNodes) {
    SimilarityGraph graph(cache, {}, quiet);
    graph.add({record("/d/a.txt", BASE), record("/d/b.txt", BASE),
               record("/d/c.txt", BASE)});

    graph.dissolve({"/d/a.txt", "/d/b.txt", "/d/c.txt"});

    EXPECT_TRUE(graph.groups().empty());
    EXPECT_EQ(graph.nodeCount(), 3u);
    EXPECT_TRUE(cache.contains("/d/a.txt"));
}

TEST_F(SimilarityGraphTest, UnsignedFilesStayIsolated) {
    SimilarityGraph graph(cache, {}, quiet);
    graph.add({unsignedRecord("/d/a.txt"), record("/d/b.txt", BASE),
               unsignedRecord("/d/c.txt")});

    EXPECT_EQ(graph.nodeCount(), 3u);
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_FALSE(cache.contains("/d/a.txt"));
}

TEST_F(SimilarityGraphTest, DuplicatePathsAreSkipped) {
    SimilarityGraph graph(cache, {}, quiet);
    EXPECT_EQ(graph.add({record("/d/a.txt", BASE), record("/d/a.txt", BASE)}), 1u);
    EXPECT_EQ(graph.add({record("/d/a.txt", BASE)}), 0u);
    EXPECT_EQ(graph.nodeCount(), 1u);
}

TEST_F(SimilarityGraphTest, ClearEmptiesGraphAndCache) {
    SimilarityGraph graph(cache, {}, quiet);
    graph.add({record("/d/a.txt", BASE), record("/d/b.txt", BASE)});

    graph.clear();

    EXPECT_EQ(graph.nodeCount(), 0u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SimilarityGraphTest, RejectsInvalidThreshold) {
    EXPECT_THROW({ SimilarityGraph graph(cache, withThreshold(0.0), quiet); },
                 InvalidArgumentError);
    EXPECT_THROW({ SimilarityGraph graph(cache, withThreshold(1.5), quiet); },
                 InvalidArgumentError);
}
