#pragma once

#include "directory/directory_client.hpp"
#include "directory/directory_session.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace directory
{

struct DirectoryEntry
{
    std::string dn;
    AttributeValues attributes;

    [[nodiscard]] std::optional<std::string> first(const std::string& attribute) const;
    [[nodiscard]] std::vector<std::string> values(const std::string& attribute) const;
};

// (uid=value), or (&(uid=value)(extra)) when an extra filter is given. The value is escaped.
[[nodiscard]] std::string build_filter(std::string_view uid_attribute,
                                       std::string_view value,
                                       const std::optional<std::string>& extra_filter = std::nullopt);

/**
 * Searches base for filter and keeps only result entries.
 * Exactly one entry yields it; none or several yield nullopt, never the first of several.
 * Protocol errors are logged and returned as Failure.
 */
[[nodiscard]] std::expected<std::optional<DirectoryEntry>, Failure> find_unique_entry(
    DirectorySession& session,
    std::string_view base,
    std::string_view filter,
    const std::vector<std::string>& attributes
);

}
