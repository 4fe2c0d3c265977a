#pragma once

#include <string>
#include <string_view>

namespace directory
{

// RFC 4515: '*', '(', ')', '\' and NUL become \XX inside a filter assertion value.
[[nodiscard]] std::string escape_filter_value(std::string_view value);

// RFC 4514: escapes an attribute value for use inside a distinguished name.
[[nodiscard]] std::string escape_dn_value(std::string_view value);

}
