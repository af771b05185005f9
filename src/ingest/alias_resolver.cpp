#include <kingraph/ingest/alias_resolver.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <algorithm>

namespace kingraph {

namespace {

constexpr const char* kComponent = "AliasResolver";

using SynonymTable = std::unordered_map<std::string, std::string>;

const SynonymTable& BuiltinSynonyms(ValueDomain domain) {
    static const SynonymTable sex = {
        {"male", "M"}, {"man", "M"}, {"boy", "M"},
        {"female", "F"}, {"woman", "F"}, {"girl", "F"},
        {"nonbinary", "X"}, {"non-binary", "X"}, {"nb", "X"}, {"enby", "X"},
        {"intersex", "X"}, {"other", "X"},
        {"unknown", "U"}, {"?", "U"}, {"unk", "U"},
    };
    static const SynonymTable gender_identity = {
        {"m", "male"}, {"man", "male"},
        {"f", "female"}, {"woman", "female"},
        {"nb", "nonbinary"}, {"enby", "nonbinary"}, {"non-binary", "nonbinary"},
        {"genderqueer", "nonbinary"},
        {"gender-fluid", "genderfluid"}, {"fluid", "genderfluid"},
    };
    static const SynonymTable event_type = {
        {"move", "residence"}, {"moved", "residence"}, {"relocation", "residence"},
        {"migration", "residence"},
        {"born", "birth"}, {"nameday", "birth"},
        {"died", "death"}, {"passing", "death"},
        {"wedding", "marriage"}, {"married", "marriage"},
    };
    static const SynonymTable place_category = {
        {"actual", "real"},
        {"fantasy", "fictional"}, {"imaginary", "fictional"},
        {"myth", "mythological"},
        {"legend", "legendary"},
    };
    static const SynonymTable note_type = {
        {"org", "organization"}, {"company", "organization"}, {"group", "organization"},
        {"faction", "organization"}, {"guild", "organization"}, {"house", "organization"},
        {"character", "person"}, {"individual", "person"},
        {"location", "place"}, {"locale", "place"},
        {"reference", "source"}, {"citation", "source"}, {"document", "source"},
    };

    switch (domain) {
        case ValueDomain::Sex:            return sex;
        case ValueDomain::GenderIdentity: return gender_identity;
        case ValueDomain::EventType:      return event_type;
        case ValueDomain::PlaceCategory:  return place_category;
        case ValueDomain::NoteType:       return note_type;
    }
    return sex;
}

const nlohmann::json* FindPresent(const nlohmann::json& fields, std::string_view key) {
    auto it = fields.find(std::string(key));
    if (it == fields.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

} // anonymous namespace

const char* ValueDomainName(ValueDomain domain) {
    switch (domain) {
        case ValueDomain::Sex:            return "sex";
        case ValueDomain::GenderIdentity: return "gender_identity";
        case ValueDomain::EventType:      return "event_type";
        case ValueDomain::PlaceCategory:  return "place_category";
        case ValueDomain::NoteType:       return "note_type";
    }
    return "sex";
}

std::optional<ValueDomain> ParseValueDomain(std::string_view name) {
    if (name == "sex") return ValueDomain::Sex;
    if (name == "gender_identity") return ValueDomain::GenderIdentity;
    if (name == "event_type") return ValueDomain::EventType;
    if (name == "place_category") return ValueDomain::PlaceCategory;
    if (name == "note_type") return ValueDomain::NoteType;
    return std::nullopt;
}

const std::vector<std::string>& CanonicalValues(ValueDomain domain) {
    static const std::vector<std::string> sex = {"M", "F", "X", "U"};
    static const std::vector<std::string> gender_identity = {
        "male", "female", "nonbinary", "genderfluid", "agender", "other"};
    static const std::vector<std::string> event_type = {
        "birth", "death", "marriage", "burial", "residence", "occupation",
        "education", "military", "immigration", "baptism", "confirmation",
        "ordination", "transfer", "custom"};
    static const std::vector<std::string> place_category = {
        "real", "historical", "disputed", "legendary", "mythological", "fictional"};
    static const std::vector<std::string> note_type = {
        "person", "place", "event", "source", "organization", "map", "schema", "timeline"};

    switch (domain) {
        case ValueDomain::Sex:            return sex;
        case ValueDomain::GenderIdentity: return gender_identity;
        case ValueDomain::EventType:      return event_type;
        case ValueDomain::PlaceCategory:  return place_category;
        case ValueDomain::NoteType:       return note_type;
    }
    return sex;
}

std::optional<std::string> ScalarText(const nlohmann::json& value) {
    if (value.is_string()) {
        return Trim(value.get_ref<const std::string&>());
    }
    if (value.is_boolean()) {
        return std::string(value.get<bool>() ? "true" : "false");
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number()) {
        return value.dump();
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// AliasResolver
// ---------------------------------------------------------------------------

AliasResolver::AliasResolver() : AliasResolver(EngineConfig{}) {}

AliasResolver::AliasResolver(const EngineConfig& config) {
    for (const auto& alias : config.field_aliases) {
        auto& users = field_index_[alias.canonical];
        if (std::find(users.begin(), users.end(), alias.user_field) == users.end()) {
            users.push_back(alias.user_field);
        }
    }

    for (const auto& [domain_name, table] : config.value_aliases) {
        auto domain = ParseValueDomain(domain_name);
        if (!domain) {
            LogWarn(kComponent, "Ignoring value aliases for unknown domain '" + domain_name + "'");
            continue;
        }
        auto& index = value_index_[*domain];
        for (const auto& [user_value, canonical] : table) {
            index[ToLower(Trim(user_value))] = canonical;
        }
    }
}

const nlohmann::json* AliasResolver::ResolveField(const nlohmann::json& fields,
                                                  std::string_view canonical) const {
    if (!fields.is_object()) {
        return nullptr;
    }
    if (const auto* value = FindPresent(fields, canonical)) {
        return value;
    }
    auto it = field_index_.find(canonical);
    if (it == field_index_.end()) {
        return nullptr;
    }
    for (const auto& user_field : it->second) {
        if (const auto* value = FindPresent(fields, user_field)) {
            return value;
        }
    }
    return nullptr;
}

std::optional<std::string> AliasResolver::ResolveString(const nlohmann::json& fields,
                                                        std::string_view canonical) const {
    const auto* value = ResolveField(fields, canonical);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_array()) {
        for (const auto& item : *value) {
            auto text = ScalarText(item);
            if (text && !text->empty()) {
                return text;
            }
        }
        return std::nullopt;
    }
    auto text = ScalarText(*value);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return text;
}

std::string AliasResolver::ResolveValue(ValueDomain domain, std::string_view raw) const {
    auto probe = ToLower(Trim(raw));

    for (const auto& canonical : CanonicalValues(domain)) {
        if (EqualsIgnoreCase(canonical, probe)) {
            return canonical;
        }
    }

    auto user = value_index_.find(domain);
    if (user != value_index_.end()) {
        auto hit = user->second.find(probe);
        if (hit != user->second.end()) {
            return hit->second;
        }
    }

    const auto& builtin = BuiltinSynonyms(domain);
    auto hit = builtin.find(probe);
    if (hit != builtin.end()) {
        return hit->second;
    }

    return std::string(raw);
}

const std::vector<std::string>& AliasResolver::AliasesFor(std::string_view canonical) const {
    static const std::vector<std::string> empty;
    auto it = field_index_.find(canonical);
    return it == field_index_.end() ? empty : it->second;
}

} // namespace kingraph
