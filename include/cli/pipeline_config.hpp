// File: include/cli/pipeline_config.hpp
//
// YAML Configuration Support for the batch recommendation job
// Allows loading model and output settings from YAML configuration files

#ifndef ITEMREC_PIPELINE_CONFIG_HPP
#define ITEMREC_PIPELINE_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace itemrec {

/// Configuration structure for the recommendation pipeline
struct PipelineConfig {
    // === Collaborative Path ===
    struct Pairwise {
        std::string similarity_metric = "cosine";
        size_t top_n_recommendations = 6;
        bool prune_items = true;
    } pairwise;

    // === Association Path ===
    struct Itemset {
        double min_support = 0.0001;
        size_t max_itemset_length = 10;
        size_t min_itemset_length_filter = 2;   // Exclusive lower bound
        size_t min_basket_size = 4;
        size_t top_itemsets_per_candidate = 3;
    } itemset;

    // === Output Sinks ===
    struct Output {
        std::string database_path;               // Empty disables the SQLite sink
        std::string table_name = "recommendations";
        size_t max_write_attempts = 3;
    } output;

    // === Logging ===
    struct Logging {
        bool debug_logging = false;
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return PipelineConfig if successful, std::nullopt on error
    static std::optional<PipelineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return PipelineConfig if successful, std::nullopt on error
    static std::optional<PipelineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Every validation problem, in section order
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static PipelineConfig Default();
};

} // namespace itemrec

#endif // ITEMREC_PIPELINE_CONFIG_HPP
