#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace ftmcpp
{

using Json = nlohmann::json;

/// RDF namespace used for schema and property URIs unless a definition overrides it.
constexpr const char* RDF_NAMESPACE = "https://w3id.org/ftm#";

/// Interned identity of a schema inside one model.
/// Comparison and hashing use only the index, never the schema contents.
struct SchemaId
{
    std::uint32_t value{0};

    bool operator==(const SchemaId& other) const
    {
        return value == other.value;
    }
    bool operator!=(const SchemaId& other) const
    {
        return value != other.value;
    }
    bool operator<(const SchemaId& other) const
    {
        return value < other.value;
    }
};

} // namespace ftmcpp

namespace std
{
template <>
struct hash<ftmcpp::SchemaId>
{
    size_t operator()(const ftmcpp::SchemaId& id) const noexcept
    {
        return std::hash<std::uint32_t>()(id.value);
    }
};
} // namespace std
