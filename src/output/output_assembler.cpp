// File: src/output/output_assembler.cpp
#include "output/output_assembler.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <tuple>

namespace itemrec {

std::vector<RecommendationRecord> OutputAssembler::Assemble(
        const std::vector<Recommendation>& recommendations,
        const std::string& generated_at) const {
    return Assemble(recommendations, {}, generated_at);
}

std::vector<RecommendationRecord> OutputAssembler::Assemble(
        const std::vector<Recommendation>& first,
        const std::vector<Recommendation>& second,
        const std::string& generated_at) const {
    std::vector<RecommendationRecord> records;
    records.reserve(first.size() + second.size());

    // Only itemset rows share an id space between source and target; a
    // pairwise source is a user id and may equal an item id by coincidence
    size_t self_references = 0;
    for (const auto* stream : {&first, &second}) {
        for (const auto& rec : *stream) {
            if (rec.model_type == ModelType::ITEMSET &&
                rec.recommended_item_id == rec.source_entity_id) {
                ++self_references;
                continue;
            }
            RecommendationRecord record;
            record.entity_id = rec.source_entity_id;
            record.recommended_item_id = rec.recommended_item_id;
            record.score = rec.score;
            record.model_type = rec.model_type;
            record.updated_at = generated_at;
            record.is_current = true;
            records.push_back(std::move(record));
        }
    }

    // Stable so that the first of two duplicate rows is the one kept
    std::stable_sort(records.begin(), records.end(),
        [](const RecommendationRecord& a, const RecommendationRecord& b) {
            return std::make_tuple(a.entity_id, a.recommended_item_id, a.model_type) <
                   std::make_tuple(b.entity_id, b.recommended_item_id, b.model_type);
        });

    auto last = std::unique(records.begin(), records.end(),
        [](const RecommendationRecord& a, const RecommendationRecord& b) {
            return a.entity_id == b.entity_id &&
                   a.recommended_item_id == b.recommended_item_id &&
                   a.model_type == b.model_type;
        });
    size_t duplicates = static_cast<size_t>(records.end() - last);
    records.erase(last, records.end());

    if (self_references > 0 || duplicates > 0) {
        std::cerr << "[OutputAssembler] Dropped " << self_references
                  << " self-recommendations and " << duplicates << " duplicate rows"
                  << std::endl;
    }
    LogDebug("Assembled " + std::to_string(records.size()) + " records");

    return records;
}

const char* OutputAssembler::CsvHeader() {
    return "entity_id,recommended_item_id,score,model_type,updated_at,is_current";
}

void OutputAssembler::WriteCsv(std::ostream& out,
                               const std::vector<RecommendationRecord>& records) const {
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();

    out << CsvHeader() << "\n";

    for (const auto& record : records) {
        out << record.entity_id.ToString() << ','
            << record.recommended_item_id.ToString() << ',';
        if (record.score) {
            out << std::fixed << std::setprecision(config_.csv_score_precision) << *record.score;
        }
        out << ',' << ToString(record.model_type)
            << ',' << record.updated_at
            << ',' << (record.is_current ? "true" : "false") << "\n";
    }

    out.flags(flags);
    out.precision(precision);
}

std::string OutputAssembler::CurrentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void OutputAssembler::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[OutputAssembler] " << message << std::endl;
    }
}

} // namespace itemrec
