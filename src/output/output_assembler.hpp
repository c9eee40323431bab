// File: src/output/output_assembler.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace itemrec {

/// RecommendationRecord: Canonical output row handed to persistence
struct RecommendationRecord {
    EntityID entity_id;
    ItemID recommended_item_id;
    std::optional<double> score;
    ModelType model_type{ModelType::PAIRWISE};
    std::string updated_at;
    bool is_current{true};

    bool operator==(const RecommendationRecord& other) const {
        return entity_id == other.entity_id &&
               recommended_item_id == other.recommended_item_id &&
               score == other.score &&
               model_type == other.model_type &&
               updated_at == other.updated_at &&
               is_current == other.is_current;
    }
};

/// OutputAssembler: Normalizes recommendation streams into records
///
/// - Stamps every record with the caller's generation time
/// - Drops itemset self-recommendations and duplicate (entity, item, model) rows,
///   reporting the dropped counts on stderr
/// - Orders by entity id, then recommended item id, then model type
class OutputAssembler {
public:
    struct Config {
        Config() = default;
        /// Decimal places written for scores in CSV output
        int csv_score_precision{5};
        bool debug_logging{false};
    };

    OutputAssembler() = default;
    explicit OutputAssembler(const Config& config) : config_(config) {}

    /// Build records from one or more recommendation streams
    /// @param recommendations Recommendations from either model
    /// @param generated_at Timestamp string written to updated_at
    std::vector<RecommendationRecord> Assemble(
        const std::vector<Recommendation>& recommendations,
        const std::string& generated_at) const;

    /// Merge two streams (e.g. both models) into one record list
    std::vector<RecommendationRecord> Assemble(
        const std::vector<Recommendation>& first,
        const std::vector<Recommendation>& second,
        const std::string& generated_at) const;

    /// Write records as CSV with a header row
    /// The stream's format flags and precision are restored afterwards
    void WriteCsv(std::ostream& out, const std::vector<RecommendationRecord>& records) const;

    /// CSV header line (without newline)
    static const char* CsvHeader();

    /// Current UTC time as "YYYY-MM-DD HH:MM:SS"
    static std::string CurrentTimestamp();

private:
    Config config_;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
