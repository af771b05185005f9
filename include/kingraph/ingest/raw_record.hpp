#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace kingraph {

// ---------------------------------------------------------------------------
// RawRecord: one note as handed over by the record store: its path, its
// tags and its frontmatter field map. Field values are loosely typed
// (strings, numbers, booleans, lists, nested objects).
// ---------------------------------------------------------------------------
struct RawRecord {
    std::string path;
    std::vector<std::string> tags;
    nlohmann::json fields = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// RecordKind: what a record describes.
// ---------------------------------------------------------------------------
enum class RecordKind {
    Person,
    Source,
    Event,
    Place,
    Organization,
    Map,
    Schema,
    Timeline,
    Unknown,
};

const char* RecordKindName(RecordKind kind);

} // namespace kingraph
