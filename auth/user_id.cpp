#include "auth/user_id.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <format>

namespace auth
{

std::string normalize_user_id(std::string_view user_id)
{
    return boost::algorithm::to_lower_copy(std::string(user_id));
}

std::optional<std::string> extract_localpart(std::string_view normalized_user_id)
{
    auto localpart = normalized_user_id.substr(0, normalized_user_id.find(':'));
    if (localpart.starts_with('@'))
    {
        localpart.remove_prefix(1);
    }
    if (localpart.empty())
    {
        return std::nullopt;
    }
    return std::string(localpart);
}

std::string make_user_id(std::string_view localpart, std::string_view server_name)
{
    return std::format("@{}:{}", localpart, server_name);
}

}
