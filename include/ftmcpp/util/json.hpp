#pragma once
#include "ftmcpp/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace ftmcpp::util::json
{

inline Json parse(const std::string& s)
{
    return Json::parse(s);
}
inline std::string dump(const Json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const Json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Wrap a scalar into a one-element array; null becomes an empty array.
Json ensure_list(const Json& value);

/// Interpret booleans, numbers and the usual string spellings
/// ("true", "yes", "on", "1" and their negations). Anything else is nullopt.
std::optional<bool> to_bool(const Json& value);

/// Sorted copy of a string collection as a JSON array.
template <typename Container>
Json sorted_array(const Container& items)
{
    std::vector<std::string> out(items.begin(), items.end());
    std::sort(out.begin(), out.end());
    return Json(out);
}

} // namespace ftmcpp::util::json
