#include <kingraph/ingest/record_classifier.hpp>

#include <kingraph/core/text.hpp>

namespace kingraph {

const char* RecordKindName(RecordKind kind) {
    switch (kind) {
        case RecordKind::Person:       return "person";
        case RecordKind::Source:       return "source";
        case RecordKind::Event:        return "event";
        case RecordKind::Place:        return "place";
        case RecordKind::Organization: return "organization";
        case RecordKind::Map:          return "map";
        case RecordKind::Schema:       return "schema";
        case RecordKind::Timeline:     return "timeline";
        case RecordKind::Unknown:      return "unknown";
    }
    return "unknown";
}

std::optional<RecordKind> RecordKindFromNoteType(std::string_view note_type) {
    if (note_type == "person") return RecordKind::Person;
    if (note_type == "source") return RecordKind::Source;
    if (note_type == "event") return RecordKind::Event;
    if (note_type == "place") return RecordKind::Place;
    if (note_type == "organization") return RecordKind::Organization;
    if (note_type == "map") return RecordKind::Map;
    if (note_type == "schema") return RecordKind::Schema;
    if (note_type == "timeline") return RecordKind::Timeline;
    return std::nullopt;
}

RecordClassifier::RecordClassifier(const AliasResolver& resolver)
    : resolver_(resolver) {}

std::optional<RecordKind> RecordClassifier::KindFromValue(std::string_view value) const {
    return RecordKindFromNoteType(resolver_.ResolveValue(ValueDomain::NoteType, value));
}

RecordKind RecordClassifier::Classify(const RawRecord& record) const {
    for (const char* field : {"cr_type", "type"}) {
        if (auto value = resolver_.ResolveString(record.fields, field)) {
            if (auto kind = KindFromValue(*value)) {
                return *kind;
            }
        }
    }

    for (const auto& tag : record.tags) {
        std::string_view t(tag);
        if (!t.empty() && t.front() == '#') {
            t.remove_prefix(1);
        }
        auto slash = t.rfind('/');
        if (slash != std::string_view::npos) {
            t = t.substr(slash + 1);
        }
        auto lowered = ToLower(t);
        if (lowered == "people") {
            return RecordKind::Person;
        }
        if (auto kind = KindFromValue(lowered)) {
            return *kind;
        }
    }

    if (resolver_.ResolveString(record.fields, "cr_id")) {
        return RecordKind::Person;
    }
    return RecordKind::Unknown;
}

} // namespace kingraph
