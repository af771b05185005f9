#pragma once

#include <kingraph/ingest/alias_resolver.hpp>
#include <kingraph/ingest/i_link_index.hpp>
#include <kingraph/ingest/raw_record.hpp>

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kingraph {

// ---------------------------------------------------------------------------
// NameLinkIndex: default link index built from the record set itself.
//
// A reference is first stripped of wikilink syntax, then looked up
// case-insensitively as an identity key, a file path (with or without
// ".md"), a file basename or a display name, in that order. A basename or
// display name shared by two records is ambiguous and stays unresolved.
// ---------------------------------------------------------------------------
class NameLinkIndex : public ILinkIndex {
public:
    NameLinkIndex(const std::vector<RawRecord>& records, const AliasResolver& resolver);

    [[nodiscard]] std::optional<std::string> Resolve(std::string_view reference) const override;

    [[nodiscard]] size_t Size() const { return ids_.size(); }

private:
    using Table = std::unordered_map<std::string, std::string>;

    static void AddUnique(Table& table, std::set<std::string>& ambiguous,
                          const std::string& key, const std::string& id);

    Table ids_;
    Table paths_;
    Table basenames_;
    Table names_;
    std::set<std::string> ambiguous_basenames_;
    std::set<std::string> ambiguous_names_;
};

} // namespace kingraph
