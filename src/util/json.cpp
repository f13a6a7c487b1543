#include "ftmcpp/util/json.hpp"

#include <algorithm>
#include <cctype>

namespace ftmcpp::util::json
{

Json ensure_list(const Json& value)
{
    if (value.is_null())
        return Json::array();
    if (value.is_array())
        return value;
    return Json::array({value});
}

std::optional<bool> to_bool(const Json& value)
{
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number())
        return value.get<double>() != 0.0;
    if (!value.is_string())
        return std::nullopt;

    std::string s = value.get<std::string>();
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "yes" || s == "on" || s == "1" || s == "t" || s == "y")
        return true;
    if (s == "false" || s == "no" || s == "off" || s == "0" || s == "f" || s == "n")
        return false;
    return std::nullopt;
}

} // namespace ftmcpp::util::json
