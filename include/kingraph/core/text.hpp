#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kingraph {

// ASCII lower-casing. Non-ASCII bytes pass through untouched.
std::string ToLower(std::string_view value);

// Strip leading and trailing ASCII whitespace.
std::string Trim(std::string_view value);

// Case-insensitive ASCII equality.
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

// Link target of a wikilink: "[[People/Jane Doe|Jane]]" -> "People/Jane Doe".
// Values that are not wikilinks are returned trimmed.
std::string StripWikilink(std::string_view value);

// Last path component without a trailing ".md": "People/Jane Doe.md" ->
// "Jane Doe".
std::string Basename(std::string_view path);

// True for identifiers left behind by an import that could not translate a
// foreign-system reference: Gramps handles ("_a1B2c3") and GEDCOM
// cross-references ("@I12@").
bool IsImportArtifact(std::string_view id);

// ---------------------------------------------------------------------------
// Dates are opaque strings ("1850", "1850-03", "abt 1850", "1850-03-02").
// Only the first standalone four-digit run is interpreted as a year.
// ---------------------------------------------------------------------------

std::optional<int> ExtractYear(std::string_view date);

// Sort key for free-form dates. Month and day are taken from an ISO-style
// "YYYY-MM-DD" prefix when present and default to 0 otherwise.
struct DateKey {
    bool has_year = false;
    int year = 0;
    int month = 0;
    int day = 0;
};

DateKey ParseDateKey(std::string_view date);

// Dated keys order before undated ones; dated keys compare chronologically.
bool DateKeyLess(const DateKey& a, const DateKey& b);

} // namespace kingraph
