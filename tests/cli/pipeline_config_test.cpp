// File: tests/cli/pipeline_config_test.cpp
//
// Tests for YAML configuration of the batch job

#include "cli/pipeline_config.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>

using namespace itemrec;

class PipelineConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/test_itemrec_config.yaml";

    void TearDown() override {
        // Clean up temp file
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(PipelineConfigTest, DefaultConfig) {
    auto config = PipelineConfig::Default();

    EXPECT_EQ(config.pairwise.similarity_metric, "cosine");
    EXPECT_EQ(config.pairwise.top_n_recommendations, 6u);
    EXPECT_TRUE(config.pairwise.prune_items);

    EXPECT_DOUBLE_EQ(config.itemset.min_support, 0.0001);
    EXPECT_EQ(config.itemset.max_itemset_length, 10u);
    EXPECT_EQ(config.itemset.min_itemset_length_filter, 2u);
    EXPECT_EQ(config.itemset.min_basket_size, 4u);
    EXPECT_EQ(config.itemset.top_itemsets_per_candidate, 3u);

    EXPECT_TRUE(config.output.database_path.empty());
    EXPECT_EQ(config.output.table_name, "recommendations");
    EXPECT_EQ(config.output.max_write_attempts, 3u);

    EXPECT_FALSE(config.logging.debug_logging);
    EXPECT_TRUE(config.Validate());
}

TEST_F(PipelineConfigTest, LoadFromString) {
    std::string yaml = R"(
pairwise:
  similarity_metric: "jaccard"
  top_n_recommendations: 4
  prune_items: false

itemset:
  min_support: 0.05
  max_itemset_length: 6
  min_itemset_length_filter: 1
  min_basket_size: 2
  top_itemsets_per_candidate: 5

output:
  database_path: "recs.db"
  table_name: "nightly_recs"
  max_write_attempts: 5

logging:
  debug_logging: yes
)";

    auto config_opt = PipelineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_EQ(config.pairwise.similarity_metric, "jaccard");
    EXPECT_EQ(config.pairwise.top_n_recommendations, 4u);
    EXPECT_FALSE(config.pairwise.prune_items);

    EXPECT_DOUBLE_EQ(config.itemset.min_support, 0.05);
    EXPECT_EQ(config.itemset.max_itemset_length, 6u);
    EXPECT_EQ(config.itemset.min_itemset_length_filter, 1u);
    EXPECT_EQ(config.itemset.min_basket_size, 2u);
    EXPECT_EQ(config.itemset.top_itemsets_per_candidate, 5u);

    EXPECT_EQ(config.output.database_path, "recs.db");
    EXPECT_EQ(config.output.table_name, "nightly_recs");
    EXPECT_EQ(config.output.max_write_attempts, 5u);

    EXPECT_TRUE(config.logging.debug_logging);
}

TEST_F(PipelineConfigTest, PartialConfigKeepsDefaults) {
    std::string yaml = R"(
itemset:
  min_basket_size: 3
)";

    auto config = PipelineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->itemset.min_basket_size, 3u);
    EXPECT_EQ(config->pairwise.similarity_metric, "cosine");
    EXPECT_DOUBLE_EQ(config->itemset.min_support, 0.0001);
}

TEST_F(PipelineConfigTest, SaveAndLoad) {
    auto config = PipelineConfig::Default();
    config.pairwise.similarity_metric = "jaccard";
    config.itemset.min_support = 0.25;
    config.output.database_path = "/var/lib/itemrec/recs.db";

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded_opt = PipelineConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded_opt.has_value());

    auto loaded = loaded_opt.value();
    EXPECT_EQ(loaded.pairwise.similarity_metric, "jaccard");
    EXPECT_DOUBLE_EQ(loaded.itemset.min_support, 0.25);
    EXPECT_EQ(loaded.output.database_path, "/var/lib/itemrec/recs.db");
    EXPECT_EQ(loaded.itemset.min_basket_size, config.itemset.min_basket_size);
}

TEST_F(PipelineConfigTest, ToYamlStringHasEverySection) {
    std::string yaml = PipelineConfig::Default().ToYamlString();

    EXPECT_NE(yaml.find("pairwise:"), std::string::npos);
    EXPECT_NE(yaml.find("itemset:"), std::string::npos);
    EXPECT_NE(yaml.find("output:"), std::string::npos);
    EXPECT_NE(yaml.find("logging:"), std::string::npos);
}

TEST_F(PipelineConfigTest, UnknownKeysAreIgnored) {
    std::string yaml = R"(
pairwise:
  neighbourhood: 12
extras:
  anything: true
)";

    auto config = PipelineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->pairwise.top_n_recommendations, 6u);
}

TEST_F(PipelineConfigTest, UnsupportedMetricFailsValidation) {
    auto config = PipelineConfig::Default();
    config.pairwise.similarity_metric = "euclidean";

    EXPECT_FALSE(config.Validate());
    auto errors = config.GetValidationErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("euclidean"), std::string::npos);

    EXPECT_FALSE(PipelineConfig::LoadFromString("pairwise:\n  similarity_metric: pearson\n"));
}

TEST_F(PipelineConfigTest, ValidationCollectsEveryProblem) {
    auto config = PipelineConfig::Default();
    config.pairwise.top_n_recommendations = 0;
    config.itemset.min_support = 1.5;
    config.itemset.min_itemset_length_filter = 10;
    config.output.table_name = "bad name";

    EXPECT_EQ(config.GetValidationErrors().size(), 4u);
}

TEST_F(PipelineConfigTest, MalformedValuesAreRejected) {
    EXPECT_FALSE(PipelineConfig::LoadFromString("pairwise:\n  top_n_recommendations: -3\n"));
    EXPECT_FALSE(PipelineConfig::LoadFromString("pairwise:\n  prune_items: maybe\n"));
    EXPECT_FALSE(PipelineConfig::LoadFromString("itemset:\n  min_support: lots\n"));
    EXPECT_FALSE(PipelineConfig::LoadFromString("itemset:\n  max_itemset_length: 4x\n"));
}

TEST_F(PipelineConfigTest, ListValueIsRejected) {
    EXPECT_FALSE(PipelineConfig::LoadFromString(
        "pairwise:\n  similarity_metric: [a, b]\n  top_n_recommendations: 4\n").has_value());
}

TEST_F(PipelineConfigTest, NestedMappingValueIsRejected) {
    EXPECT_FALSE(PipelineConfig::LoadFromString(
        "itemset:\n  min_support:\n    value: 0.5\n  min_basket_size: 2\n").has_value());
}

TEST_F(PipelineConfigTest, KeysAfterSkippedListStillApply) {
    // A list under an unknown section is skipped without disturbing later keys
    auto config = PipelineConfig::LoadFromString(
        "extras: [1, 2]\npairwise:\n  top_n_recommendations: 4\n");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->pairwise.top_n_recommendations, 4u);
}

TEST_F(PipelineConfigTest, InvalidYamlIsRejected) {
    EXPECT_FALSE(PipelineConfig::LoadFromString("pairwise: [unclosed\n"));
}

TEST_F(PipelineConfigTest, MissingFileIsRejected) {
    EXPECT_FALSE(PipelineConfig::LoadFromFile("/nonexistent/itemrec/config.yaml"));
}
