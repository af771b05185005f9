#pragma once

#include <kingraph/ingest/alias_resolver.hpp>
#include <kingraph/ingest/i_record_classifier.hpp>

#include <optional>
#include <string_view>

namespace kingraph {

// Kind named by a canonical note type ("person", "event", ...).
std::optional<RecordKind> RecordKindFromNoteType(std::string_view note_type);

// ---------------------------------------------------------------------------
// RecordClassifier: default classifier over note frontmatter.
//
// Order: the `cr_type` field, then the legacy `type` field, then tags
// ("#person", "genealogy/person"). Type values go through the note_type
// value aliases, so "character" classifies as a person. A record that
// matches none of these but carries a `cr_id` is a person; anything else is
// Unknown.
// ---------------------------------------------------------------------------
class RecordClassifier : public IRecordClassifier {
public:
    explicit RecordClassifier(const AliasResolver& resolver);

    [[nodiscard]] RecordKind Classify(const RawRecord& record) const override;

private:
    [[nodiscard]] std::optional<RecordKind> KindFromValue(std::string_view value) const;

    const AliasResolver& resolver_;
};

} // namespace kingraph
