// =============================================================================
// Incremental Materializer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "forest_builder.hpp"
#include "materializer.hpp"

#include <memory>
#include <vector>

class MaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<ParsedItem> items = {
            {0, "C:."},
            {1, "fileA.txt"},
            {1, "dirB"},
            {2, "fileC.txt"},
            {2, "subD"},
            {3, "deep.txt"},
        };
        forest = std::make_shared<const Forest>(build_forest(items, BuildStrategy::Recursive));
        materializer.reset(forest);
    }

    TreeMaterializer::NodeId root() const {
        return materializer.roots().front();
    }

    std::shared_ptr<const Forest> forest {};
    TreeMaterializer materializer {};
};

// Only the roots exist until something is expanded
TEST_F(MaterializerTest, ExposesRootsOnly) {
    ASSERT_EQ(materializer.roots().size(), 1u);
    EXPECT_EQ(materializer.size(), 1u);
    EXPECT_EQ(materializer.node(root())->name, "C:.");
    EXPECT_TRUE(materializer.expandable(root()));
    EXPECT_FALSE(materializer.is_expanded(root()));
}

TEST_F(MaterializerTest, ExpandOneLevel) {
    std::vector<TreeMaterializer::NodeId> children {};
    ASSERT_TRUE(materializer.expand(root(), children));

    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(materializer.node(children[0])->name, "fileA.txt");
    EXPECT_FALSE(materializer.expandable(children[0]));
    EXPECT_EQ(materializer.node(children[1])->name, "dirB");
    EXPECT_TRUE(materializer.expandable(children[1]));

    // grandchildren stay unexposed
    EXPECT_EQ(materializer.size(), 3u);
    EXPECT_FALSE(materializer.is_expanded(children[1]));
}

TEST_F(MaterializerTest, ExpandIsIdempotent) {
    std::vector<TreeMaterializer::NodeId> first {};
    std::vector<TreeMaterializer::NodeId> second {};
    ASSERT_TRUE(materializer.expand(root(), first));
    const std::size_t size_after_first = materializer.size();
    ASSERT_TRUE(materializer.expand(root(), second));

    EXPECT_EQ(first, second);
    EXPECT_EQ(materializer.size(), size_after_first);
}

TEST_F(MaterializerTest, LeafExpandsToNothing) {
    std::vector<TreeMaterializer::NodeId> children {};
    materializer.expand(root(), children);

    std::vector<TreeMaterializer::NodeId> leaf_children {1};
    ASSERT_TRUE(materializer.expand(children[0], leaf_children));
    EXPECT_TRUE(leaf_children.empty());
}

TEST_F(MaterializerTest, UnknownIdIsRejected) {
    std::vector<TreeMaterializer::NodeId> children {};
    EXPECT_FALSE(materializer.expand(999, children));
    EXPECT_EQ(materializer.node(999), nullptr);
    EXPECT_FALSE(materializer.expandable(999));
    EXPECT_FALSE(materializer.set_open(999, true));
}

TEST_F(MaterializerTest, VisibleRowsFollowOpenState) {
    std::vector<TreeMaterializer::NodeId> rows {};
    materializer.visible_nodes(rows);
    EXPECT_EQ(rows.size(), 1u);

    materializer.set_open(root(), true);
    rows.clear();
    materializer.visible_nodes(rows);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(materializer.node(rows[1])->name, "fileA.txt");
    EXPECT_EQ(materializer.node(rows[2])->name, "dirB");

    materializer.set_open(rows[2], true);
    rows.clear();
    materializer.visible_nodes(rows);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(materializer.node(rows[3])->name, "fileC.txt");
    EXPECT_EQ(materializer.node(rows[4])->name, "subD");
}

// Closing hides rows but keeps what was materialized
TEST_F(MaterializerTest, CollapseKeepsChildren) {
    materializer.set_open(root(), true);
    const std::size_t size_open = materializer.size();
    materializer.set_open(root(), false);

    std::vector<TreeMaterializer::NodeId> rows {};
    materializer.visible_nodes(rows);
    EXPECT_EQ(rows.size(), 1u);
    EXPECT_TRUE(materializer.is_expanded(root()));
    EXPECT_FALSE(materializer.is_open(root()));
    EXPECT_EQ(materializer.size(), size_open);

    materializer.set_open(root(), true);
    EXPECT_EQ(materializer.size(), size_open);
}

TEST_F(MaterializerTest, ParentLinks) {
    std::vector<TreeMaterializer::NodeId> children {};
    materializer.expand(root(), children);

    TreeMaterializer::NodeId parent {};
    ASSERT_TRUE(materializer.parent_of(children[1], parent));
    EXPECT_EQ(parent, root());
    EXPECT_FALSE(materializer.parent_of(root(), parent));
}

TEST_F(MaterializerTest, ResetReplacesEverything) {
    materializer.set_open(root(), true);

    auto other = std::make_shared<const Forest>(
        build_forest({{0, "one"}, {0, "two"}}, BuildStrategy::Stack));
    materializer.reset(other);

    ASSERT_EQ(materializer.roots().size(), 2u);
    EXPECT_EQ(materializer.size(), 2u);
    EXPECT_EQ(materializer.node(materializer.roots()[1])->name, "two");
    EXPECT_FALSE(materializer.is_open(materializer.roots()[0]));
}

TEST_F(MaterializerTest, ClearEmpties) {
    materializer.clear();
    EXPECT_TRUE(materializer.empty());
    EXPECT_EQ(materializer.size(), 0u);
}

TEST(MaterializerProgressTest, ReportsPopulating) {
    auto forest = std::make_shared<const Forest>(
        build_forest({{0, "a"}, {0, "b"}, {0, "c"}}, BuildStrategy::Stack));

    std::vector<ProgressEvent> events {};
    ProgressReporter progress {[&events](const ProgressEvent& e) { events.push_back(e); }};
    TreeMaterializer materializer {};
    materializer.reset(forest, &progress);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().phase, Phase::Populating);
    EXPECT_EQ(events.front().done, 0u);
    EXPECT_EQ(events.back().done, 3u);
    EXPECT_EQ(events.back().total, 3u);
}

TEST(MaterializerProgressTest, NullForest) {
    TreeMaterializer materializer {};
    materializer.reset(nullptr);
    EXPECT_TRUE(materializer.empty());
}
