// File: src/cli/pipeline_config.cpp
//
// YAML Configuration Implementation for the batch recommendation job

#include "cli/pipeline_config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "storage/recommendation_store.hpp"
#include <yaml.h>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace itemrec {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" ||
        value == "1" || value == "on" || value == "On" || value == "ON") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" ||
        value == "0" || value == "off" || value == "Off" || value == "OFF") {
        return false;
    }
    throw std::invalid_argument("not a boolean: " + value);
}

// std::stoul accepts "-1" and wraps it; counts must be written unsigned
static size_t ParseSize(const std::string& value) {
    size_t consumed = 0;
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("not a non-negative integer: " + value);
    }
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size() || parsed > std::numeric_limits<size_t>::max()) {
        throw std::invalid_argument("not a non-negative integer: " + value);
    }
    return static_cast<size_t>(parsed);
}

static double ParseDouble(const std::string& value) {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("not a number: " + value);
    }
    return parsed;
}

// Apply one section/key/value triple; unknown keys are ignored
static void ApplyValue(PipelineConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "pairwise") {
        if (key == "similarity_metric") config.pairwise.similarity_metric = value;
        else if (key == "top_n_recommendations") config.pairwise.top_n_recommendations = ParseSize(value);
        else if (key == "prune_items") config.pairwise.prune_items = ParseBool(value);
    }
    else if (section == "itemset") {
        if (key == "min_support") config.itemset.min_support = ParseDouble(value);
        else if (key == "max_itemset_length") config.itemset.max_itemset_length = ParseSize(value);
        else if (key == "min_itemset_length_filter") config.itemset.min_itemset_length_filter = ParseSize(value);
        else if (key == "min_basket_size") config.itemset.min_basket_size = ParseSize(value);
        else if (key == "top_itemsets_per_candidate") config.itemset.top_itemsets_per_candidate = ParseSize(value);
    }
    else if (section == "output") {
        if (key == "database_path") config.output.database_path = value;
        else if (key == "table_name") config.output.table_name = value;
        else if (key == "max_write_attempts") config.output.max_write_attempts = ParseSize(value);
    }
    else if (section == "logging") {
        if (key == "debug_logging") config.logging.debug_logging = ParseBool(value);
    }
}

std::optional<PipelineConfig> PipelineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<PipelineConfig> PipelineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    PipelineConfig config = Default();
    std::vector<std::string> value_errors;
    std::string current_section;
    std::string current_key;
    int depth = 0;
    // Nesting inside a collection that sits where a scalar belongs
    int skip_depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " (line "
                          << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
            case YAML_SEQUENCE_START_EVENT:
                if (skip_depth > 0) {
                    skip_depth++;
                } else if (depth == 2 && !current_key.empty()) {
                    value_errors.push_back(current_section + "." + current_key +
                                           ": expected a scalar value");
                    current_key.clear();
                    skip_depth = 1;
                } else if (event.type == YAML_SEQUENCE_START_EVENT) {
                    skip_depth = 1;
                } else {
                    depth++;
                }
                break;

            case YAML_MAPPING_END_EVENT:
            case YAML_SEQUENCE_END_EVENT:
                if (skip_depth > 0) {
                    skip_depth--;
                    break;
                }
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                if (skip_depth > 0) {
                    break;
                }
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::logic_error& e) {
                            // invalid_argument and out_of_range from the parsers
                            value_errors.push_back(current_section + "." + current_key +
                                                   ": " + e.what());
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    std::vector<std::string> errors = value_errors;
    for (const auto& error : config.GetValidationErrors()) {
        errors.push_back(error);
    }

    if (!errors.empty()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : errors) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool PipelineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string PipelineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# Item recommendation batch configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "pairwise:\n";
    ss << "  similarity_metric: \"" << pairwise.similarity_metric << "\"\n";
    ss << "  top_n_recommendations: " << pairwise.top_n_recommendations << "\n";
    ss << "  prune_items: " << (pairwise.prune_items ? "true" : "false") << "\n\n";

    ss << "itemset:\n";
    ss << "  min_support: " << itemset.min_support << "\n";
    ss << "  max_itemset_length: " << itemset.max_itemset_length << "\n";
    ss << "  min_itemset_length_filter: " << itemset.min_itemset_length_filter << "\n";
    ss << "  min_basket_size: " << itemset.min_basket_size << "\n";
    ss << "  top_itemsets_per_candidate: " << itemset.top_itemsets_per_candidate << "\n\n";

    ss << "output:\n";
    ss << "  database_path: \"" << output.database_path << "\"\n";
    ss << "  table_name: \"" << output.table_name << "\"\n";
    ss << "  max_write_attempts: " << output.max_write_attempts << "\n\n";

    ss << "logging:\n";
    ss << "  debug_logging: " << (logging.debug_logging ? "true" : "false") << "\n";

    return ss.str();
}

bool PipelineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> PipelineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Pairwise
    try {
        ParseSimilarityKind(pairwise.similarity_metric);
    } catch (const UnsupportedSimilarityMetric& e) {
        errors.push_back(e.what());
    }
    if (pairwise.top_n_recommendations == 0) {
        errors.push_back("top_n_recommendations must be greater than 0");
    }

    // Itemset
    if (!(itemset.min_support > 0.0 && itemset.min_support <= 1.0)) {
        errors.push_back("min_support must be in (0.0, 1.0]");
    }
    if (itemset.max_itemset_length == 0) {
        errors.push_back("max_itemset_length must be greater than 0");
    }
    if (itemset.min_itemset_length_filter >= itemset.max_itemset_length) {
        errors.push_back("min_itemset_length_filter must be less than max_itemset_length");
    }
    if (itemset.min_basket_size == 0) {
        errors.push_back("min_basket_size must be greater than 0");
    }
    if (itemset.top_itemsets_per_candidate == 0) {
        errors.push_back("top_itemsets_per_candidate must be greater than 0");
    }

    // Output
    if (!RecommendationStore::IsValidIdentifier(output.table_name)) {
        errors.push_back("table_name must be a plain SQL identifier: '" + output.table_name + "'");
    }
    if (output.max_write_attempts == 0) {
        errors.push_back("max_write_attempts must be greater than 0");
    }

    return errors;
}

PipelineConfig PipelineConfig::Default() {
    return PipelineConfig{};  // Uses default member initializers
}

} // namespace itemrec
