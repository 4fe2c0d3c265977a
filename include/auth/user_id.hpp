#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace auth
{

[[nodiscard]] std::string normalize_user_id(std::string_view user_id);

// "@alice:example.org" -> "alice". nullopt when nothing usable is left.
[[nodiscard]] std::optional<std::string> extract_localpart(std::string_view normalized_user_id);

[[nodiscard]] std::string make_user_id(std::string_view localpart, std::string_view server_name);

}
