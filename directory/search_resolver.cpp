#include "directory/search_resolver.hpp"
#include "directory/escape.hpp"
#include "logger/logger.hpp"

#include <format>

namespace directory
{

std::optional<std::string> DirectoryEntry::first(const std::string& attribute) const
{
    auto it = attributes.find(attribute);
    if (it == attributes.end() || it->second.empty())
    {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<std::string> DirectoryEntry::values(const std::string& attribute) const
{
    auto it = attributes.find(attribute);
    if (it == attributes.end())
    {
        return {};
    }
    return it->second;
}

std::string build_filter(std::string_view uid_attribute,
                         std::string_view value,
                         const std::optional<std::string>& extra_filter)
{
    auto query = std::format("({}={})", uid_attribute, escape_filter_value(value));
    if (!extra_filter || extra_filter->empty())
    {
        return query;
    }
    if (extra_filter->front() == '(')
    {
        return std::format("(&{}{})", query, *extra_filter);
    }
    return std::format("(&{}({}))", query, *extra_filter);
}

std::expected<std::optional<DirectoryEntry>, Failure> find_unique_entry(
    DirectorySession& session,
    std::string_view base,
    std::string_view filter,
    const std::vector<std::string>& attributes
)
{
    LOG_DEBUG("LDAP search filter: {}", filter);

    std::vector<SearchResponse> responses;
    try
    {
        responses = session.connection().search(base, filter, attributes);
    }
    catch (const DirectoryError& e)
    {
        LOG_WARN("Error during LDAP search {}: {}", filter, e.what());
        return std::unexpected(Failure{Failure::Kind::ProtocolError, e.what()});
    }

    std::vector<DirectoryEntry> entries;
    for (auto& resp : responses)
    {
        if (resp.kind == SearchResponse::Kind::Entry)
        {
            entries.push_back(DirectoryEntry{std::move(resp.dn), std::move(resp.attributes)});
        }
    }

    if (entries.size() == 1)
    {
        LOG_DEBUG("LDAP search found dn: {}", entries.front().dn);
        return std::optional<DirectoryEntry>(std::move(entries.front()));
    }

    if (entries.empty())
    {
        LOG_WARN("LDAP search {} returned no results", filter);
    }
    else
    {
        LOG_WARN("LDAP search {} returned too many ({}) results", filter, entries.size());
    }
    return std::optional<DirectoryEntry>{};
}

}
