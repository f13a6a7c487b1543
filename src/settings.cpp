#include "ftmcpp/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace ftmcpp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("FTMCPP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.locale = getenv_str("FTMCPP_LOCALE", s.locale);
    s.catalog_path = getenv_str("FTMCPP_CATALOG", s.catalog_path);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("locale"))
        s.locale = j.at("locale").get<std::string>();
    if (j.contains("catalog_path"))
        s.catalog_path = j.at("catalog_path").get<std::string>();
    return s;
}

} // namespace ftmcpp
