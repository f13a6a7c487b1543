#pragma once

namespace ftmcpp
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

} // namespace ftmcpp
