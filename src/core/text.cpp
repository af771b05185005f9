#include <kingraph/core/text.hpp>

#include <cctype>
#include <tuple>

namespace kingraph {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsAlnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Parse exactly two digits at `pos`, returning 0 when absent.
int TwoDigitsAt(std::string_view s, size_t pos) {
    if (pos + 2 > s.size() || !IsDigit(s[pos]) || !IsDigit(s[pos + 1])) {
        return 0;
    }
    if (pos + 2 < s.size() && IsDigit(s[pos + 2])) {
        return 0;
    }
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

} // anonymous namespace

std::string ToLower(std::string_view value) {
    std::string out(value);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string Trim(std::string_view value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && IsSpace(value[begin])) {
        ++begin;
    }
    while (end > begin && IsSpace(value[end - 1])) {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string StripWikilink(std::string_view value) {
    auto trimmed = Trim(value);
    std::string_view v(trimmed);
    if (v.size() < 4 || v.substr(0, 2) != "[[" || v.substr(v.size() - 2) != "]]") {
        return trimmed;
    }
    auto inner = v.substr(2, v.size() - 4);
    auto pipe = inner.find('|');
    if (pipe != std::string_view::npos) {
        inner = inner.substr(0, pipe);
    }
    // Heading and block anchors do not change the target note.
    auto hash = inner.find('#');
    if (hash != std::string_view::npos) {
        inner = inner.substr(0, hash);
    }
    return Trim(inner);
}

std::string Basename(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        path = path.substr(slash + 1);
    }
    constexpr std::string_view kExtension = ".md";
    if (path.size() > kExtension.size() &&
        path.substr(path.size() - kExtension.size()) == kExtension) {
        path = path.substr(0, path.size() - kExtension.size());
    }
    return std::string(path);
}

bool IsImportArtifact(std::string_view id) {
    if (id.size() >= 2 && id.front() == '_') {
        for (size_t i = 1; i < id.size(); ++i) {
            if (!IsAlnum(id[i])) {
                return false;
            }
        }
        return true;
    }
    if (id.size() >= 3 && id.front() == '@' && id.back() == '@') {
        return id.substr(1, id.size() - 2).find('@') == std::string_view::npos;
    }
    return false;
}

std::optional<int> ExtractYear(std::string_view date) {
    size_t i = 0;
    while (i < date.size()) {
        if (!IsDigit(date[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < date.size() && IsDigit(date[i])) {
            ++i;
        }
        if (i - start == 4) {
            int year = 0;
            for (size_t k = start; k < i; ++k) {
                year = year * 10 + (date[k] - '0');
            }
            return year;
        }
    }
    return std::nullopt;
}

DateKey ParseDateKey(std::string_view date) {
    DateKey key;
    auto year = ExtractYear(date);
    if (!year) {
        return key;
    }
    key.has_year = true;
    key.year = *year;

    // ISO-style "YYYY-MM-DD": only trust month/day when the string starts
    // with the year.
    auto trimmed = Trim(date);
    std::string_view v(trimmed);
    if (v.size() >= 7 && IsDigit(v[0]) && IsDigit(v[1]) && IsDigit(v[2]) &&
        IsDigit(v[3]) && v[4] == '-') {
        key.month = TwoDigitsAt(v, 5);
        if (key.month > 0 && v.size() >= 10 && v[7] == '-') {
            key.day = TwoDigitsAt(v, 8);
        }
    }
    return key;
}

bool DateKeyLess(const DateKey& a, const DateKey& b) {
    if (a.has_year != b.has_year) {
        return a.has_year;
    }
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

} // namespace kingraph
