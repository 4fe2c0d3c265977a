#include "directory/escape.hpp"

#include <format>

namespace directory
{

std::string escape_filter_value(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (char ch : value)
    {
        switch (ch)
        {
            case '*':
            case '(':
            case ')':
            case '\\':
            case '\0':
                out += std::format("\\{:02x}", static_cast<unsigned char>(ch));
                break;
            default:
                out += ch;
                break;
        }
    }
    return out;
}

std::string escape_dn_value(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i)
    {
        char ch = value[i];
        bool leading = i == 0 && (ch == ' ' || ch == '#');
        bool trailing = i + 1 == value.size() && ch == ' ';
        switch (ch)
        {
            case ',':
            case '+':
            case '"':
            case '\\':
            case '<':
            case '>':
            case ';':
            case '=':
                out += '\\';
                out += ch;
                break;
            case '\0':
                out += "\\00";
                break;
            default:
                if (leading || trailing)
                {
                    out += '\\';
                }
                out += ch;
                break;
        }
    }
    return out;
}

}
