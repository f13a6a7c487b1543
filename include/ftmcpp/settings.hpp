#pragma once
#include "ftmcpp/types.hpp"

#include <string>

namespace ftmcpp
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string locale{"en"};
    /// Optional path to a JSON message catalog ({msgid: msgstr}).
    std::string catalog_path;

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace ftmcpp
