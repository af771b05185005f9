#pragma once

#include <kingraph/config/engine_config.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kingraph {

// Enumerated value domains that accept synonyms.
enum class ValueDomain {
    Sex,             // M, F, X, U
    GenderIdentity,  // male, female, nonbinary, genderfluid, agender, other
    EventType,       // birth, death, marriage, ...
    PlaceCategory,   // real, historical, disputed, legendary, mythological, fictional
    NoteType,        // person, place, event, source, organization, map, schema, timeline
};

// "sex", "gender_identity", "event_type", "place_category", "note_type".
const char* ValueDomainName(ValueDomain domain);
std::optional<ValueDomain> ParseValueDomain(std::string_view name);

// Canonical values of a domain, in declaration order.
const std::vector<std::string>& CanonicalValues(ValueDomain domain);

// ---------------------------------------------------------------------------
// AliasResolver: maps user-renamed fields and user-spelled values onto the
// canonical names the engine understands.
//
// Field lookup: the canonical field wins when present; otherwise the user
// fields aliased to it are tried in configuration order. A field counts as
// present when the key exists and its value is not null.
//
// Value lookup: case-insensitive canonical match, then user synonyms, then
// built-in synonyms, else the raw value unchanged.
//
// Both indexes are built once in the constructor.
// ---------------------------------------------------------------------------
class AliasResolver {
public:
    AliasResolver();
    explicit AliasResolver(const EngineConfig& config);

    // Value of `canonical` (or of its first present alias), nullptr if absent.
    [[nodiscard]] const nlohmann::json* ResolveField(const nlohmann::json& fields,
                                                     std::string_view canonical) const;

    // Scalar field as text. Strings are trimmed; numbers and booleans are
    // printed; for a list the first non-empty scalar is used. Empty text
    // counts as absent.
    [[nodiscard]] std::optional<std::string> ResolveString(const nlohmann::json& fields,
                                                           std::string_view canonical) const;

    [[nodiscard]] std::string ResolveValue(ValueDomain domain, std::string_view raw) const;

    // User fields aliased to `canonical`, in configuration order.
    [[nodiscard]] const std::vector<std::string>& AliasesFor(std::string_view canonical) const;

private:
    // canonical field -> user fields
    std::map<std::string, std::vector<std::string>, std::less<>> field_index_;
    // domain -> lower-cased user value -> canonical value
    std::map<ValueDomain, std::unordered_map<std::string, std::string>> value_index_;
};

// Text of a scalar JSON value (string, number, boolean); nullopt otherwise.
std::optional<std::string> ScalarText(const nlohmann::json& value);

} // namespace kingraph
