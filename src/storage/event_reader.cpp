// File: src/storage/event_reader.cpp
#include "storage/event_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace itemrec {

namespace {

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(Trim(field));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

/// Column positions resolved from the header row
struct ColumnLayout {
    std::optional<size_t> user;
    std::optional<size_t> item;
    std::optional<size_t> order;
};

ColumnLayout ResolveHeader(const std::vector<std::string>& header) {
    ColumnLayout layout;
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = ToLower(header[i]);
        if (name == "user_id") {
            layout.user = i;
        } else if (name == "item_id" || name == "product_id") {
            layout.item = i;
        } else if (name == "order_id") {
            layout.order = i;
        }
    }

    if (!layout.item) {
        throw std::invalid_argument("Event header has no item_id or product_id column");
    }
    if (!layout.user && !layout.order) {
        throw std::invalid_argument("Event header needs a user_id or order_id column");
    }
    return layout;
}

std::optional<EntityID> ParseField(const std::vector<std::string>& fields,
                                   const std::optional<size_t>& column,
                                   size_t line_number) {
    if (!column || *column >= fields.size() || fields[*column].empty()) {
        return std::nullopt;
    }
    try {
        return EntityID::Parse(fields[*column]);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Line " + std::to_string(line_number) + ": " + e.what());
    }
}

} // namespace

std::vector<InteractionEvent> EventReader::ReadFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open event file: " + path);
    }
    LogDebug("Reading events from " + path);
    return Read(file);
}

std::vector<InteractionEvent> EventReader::Read(std::istream& in) const {
    std::vector<InteractionEvent> events;
    std::optional<ColumnLayout> layout;

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (Trim(line).empty()) {
            continue;
        }

        auto fields = SplitFields(line);
        if (!layout) {
            layout = ResolveHeader(fields);
            continue;
        }

        InteractionEvent event;
        event.user_id = ParseField(fields, layout->user, line_number);
        event.item_id = ParseField(fields, layout->item, line_number);
        event.order_id = ParseField(fields, layout->order, line_number);
        events.push_back(event);
    }

    if (!layout) {
        throw std::invalid_argument("Event input has no header row");
    }

    LogDebug("Read " + std::to_string(events.size()) + " events");
    return events;
}

void EventReader::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[EventReader] " << message << std::endl;
    }
}

} // namespace itemrec
