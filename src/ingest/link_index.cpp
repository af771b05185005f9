#include <kingraph/ingest/link_index.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

namespace kingraph {

namespace {

constexpr const char* kComponent = "LinkIndex";

std::string StripMarkdownExtension(const std::string& path) {
    constexpr std::string_view kExtension = ".md";
    if (path.size() > kExtension.size() &&
        path.compare(path.size() - kExtension.size(), kExtension.size(), kExtension) == 0) {
        return path.substr(0, path.size() - kExtension.size());
    }
    return path;
}

} // anonymous namespace

NameLinkIndex::NameLinkIndex(const std::vector<RawRecord>& records,
                             const AliasResolver& resolver) {
    for (const auto& record : records) {
        auto id = resolver.ResolveString(record.fields, "cr_id");
        if (!id) {
            continue;
        }
        ids_.emplace(ToLower(*id), *id);

        if (!record.path.empty()) {
            paths_[ToLower(StripMarkdownExtension(record.path))] = *id;
            AddUnique(basenames_, ambiguous_basenames_, ToLower(Basename(record.path)), *id);
        }
        if (auto name = resolver.ResolveString(record.fields, "name")) {
            AddUnique(names_, ambiguous_names_, ToLower(*name), *id);
        }
    }

    for (const auto& key : ambiguous_basenames_) basenames_.erase(key);
    for (const auto& key : ambiguous_names_) names_.erase(key);

    LogDebug(kComponent, "Indexed " + std::to_string(ids_.size()) + " identity keys, " +
                         std::to_string(ambiguous_names_.size()) + " ambiguous names");
}

void NameLinkIndex::AddUnique(Table& table, std::set<std::string>& ambiguous,
                              const std::string& key, const std::string& id) {
    if (key.empty()) {
        return;
    }
    auto [it, inserted] = table.emplace(key, id);
    if (!inserted && it->second != id) {
        ambiguous.insert(key);
    }
}

std::optional<std::string> NameLinkIndex::Resolve(std::string_view reference) const {
    auto target = ToLower(StripWikilink(reference));
    if (target.empty()) {
        return std::nullopt;
    }

    auto id_it = ids_.find(target);
    if (id_it != ids_.end()) {
        return id_it->second;
    }
    auto path_it = paths_.find(StripMarkdownExtension(target));
    if (path_it != paths_.end()) {
        return path_it->second;
    }
    for (const auto* table : {&basenames_, &names_}) {
        auto it = table->find(target);
        if (it != table->end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

} // namespace kingraph
