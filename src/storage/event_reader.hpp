// File: src/storage/event_reader.hpp
#pragma once

#include "core/types.hpp"
#include <istream>
#include <string>
#include <vector>

namespace itemrec {

/// EventReader: Loads InteractionEvents from comma-separated text
///
/// The first non-blank line is a header. Recognized columns are user_id,
/// item_id (or product_id) and order_id, matched case-insensitively; any
/// other column is skipped. Empty fields become missing values so that
/// partially-null rows reach the builders, which discard them.
class EventReader {
public:
    struct Config {
        Config() = default;
        bool debug_logging{false};
    };

    EventReader() = default;
    explicit EventReader(const Config& config) : config_(config) {}

    /// Read all events from a file
    /// @throws std::runtime_error if the file cannot be opened
    /// @throws std::invalid_argument on malformed header or ids
    std::vector<InteractionEvent> ReadFile(const std::string& path) const;

    /// Read all events from a stream
    /// @throws std::invalid_argument on malformed header or ids
    std::vector<InteractionEvent> Read(std::istream& in) const;

private:
    Config config_;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
