// File: src/core/types.cpp
#include "core/types.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace itemrec {

std::string EntityID::ToString() const {
    return std::to_string(value_);
}

EntityID EntityID::Parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty identifier");
    }

    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid identifier: " + text);
    }

    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid identifier: " + text);
    }

    return EntityID(static_cast<ValueType>(value));
}

// Enum implementations

const char* ToString(ModelType type) {
    switch (type) {
        case ModelType::PAIRWISE: return "pairwise";
        case ModelType::ITEMSET: return "itemset";
        default: return "unknown";
    }
}

ModelType ParseModelType(const std::string& str) {
    if (str == "pairwise") return ModelType::PAIRWISE;
    if (str == "itemset") return ModelType::ITEMSET;
    throw std::invalid_argument("Unknown ModelType: " + str);
}

const char* ToString(SimilarityKind kind) {
    switch (kind) {
        case SimilarityKind::COSINE: return "cosine";
        case SimilarityKind::JACCARD: return "jaccard";
        default: return "unknown";
    }
}

SimilarityKind ParseSimilarityKind(const std::string& str) {
    std::string lowered(str);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "cosine") return SimilarityKind::COSINE;
    if (lowered == "jaccard") return SimilarityKind::JACCARD;
    throw UnsupportedSimilarityMetric(str);
}

} // namespace itemrec
