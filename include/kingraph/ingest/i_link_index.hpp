#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kingraph {

// ---------------------------------------------------------------------------
// ILinkIndex: resolves a textual reference (a wikilink, a file path, a
// display name) to the identity key of the record it denotes.
//
// Resolve() is a pure lookup; returning nullopt means "unresolved".
// ---------------------------------------------------------------------------
class ILinkIndex {
public:
    virtual ~ILinkIndex() = default;

    ILinkIndex(const ILinkIndex&) = delete;
    ILinkIndex& operator=(const ILinkIndex&) = delete;
    ILinkIndex(ILinkIndex&&) = delete;
    ILinkIndex& operator=(ILinkIndex&&) = delete;

    [[nodiscard]] virtual std::optional<std::string> Resolve(
        std::string_view reference) const = 0;

protected:
    ILinkIndex() = default;
};

} // namespace kingraph
