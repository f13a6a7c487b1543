#include "ftmcpp/schema_spec.hpp"

#include "ftmcpp/exceptions.hpp"
#include "ftmcpp/util/json.hpp"

#include <limits>

namespace ftmcpp
{
namespace
{

const Json* field(const Json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return nullptr;
    return &*it;
}

std::optional<std::string> get_string(const Json& j, const char* key, const std::string& context)
{
    const Json* v = field(j, key);
    if (v == nullptr)
        return std::nullopt;
    if (!v->is_string())
        throw InvalidModel("Invalid " + std::string(key) + " in " + context + ": expected string");
    return v->get<std::string>();
}

std::vector<std::string> get_string_list(const Json& j, const char* key, const std::string& context)
{
    std::vector<std::string> out;
    const Json* v = field(j, key);
    if (v == nullptr)
        return out;
    for (const auto& item : util::json::ensure_list(*v))
    {
        if (!item.is_string())
            throw InvalidModel("Invalid " + std::string(key) + " in " + context +
                               ": expected list of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::optional<bool> get_bool(const Json& j, const char* key, const std::string& context)
{
    const Json* v = field(j, key);
    if (v == nullptr)
        return std::nullopt;
    auto b = util::json::to_bool(*v);
    if (!b)
        throw InvalidModel("Invalid " + std::string(key) + " in " + context + ": expected boolean");
    return b;
}

void expect_object(const Json& j, const std::string& context)
{
    if (!j.is_object())
        throw InvalidModel("Invalid definition of " + context + ": expected object");
}

} // namespace

ReverseSpec ReverseSpec::from_json(const Json& j, const std::string& context)
{
    if (!j.is_object())
        throw InvalidModel("Invalid reverse: " + context);
    ReverseSpec spec;
    spec.name = get_string(j, "name", context);
    spec.label = get_string(j, "label", context);
    spec.hidden = get_bool(j, "hidden", context);
    return spec;
}

PropertySpec PropertySpec::from_json(const Json& j, const std::string& context)
{
    PropertySpec spec;
    if (j.is_null())
        return spec;
    expect_object(j, context);
    spec.label = get_string(j, "label", context);
    spec.description = get_string(j, "description", context);
    if (auto type = get_string(j, "type", context))
        spec.type = *type;
    spec.hidden = get_bool(j, "hidden", context).value_or(false);
    spec.matchable = get_bool(j, "matchable", context);
    spec.deprecated = get_bool(j, "deprecated", context).value_or(false);
    if (const Json* v = field(j, "maxLength"))
    {
        if (!v->is_number_integer())
            throw InvalidModel("Invalid maxLength in " + context + ": expected integer");
        if (*v < 0 || *v > std::numeric_limits<int>::max())
            throw InvalidModel("Invalid maxLength in " + context + ": out of range");
        spec.max_length = v->get<int>();
    }
    spec.range = get_string(j, "range", context);
    spec.format = get_string(j, "format", context);
    spec.rdf = get_string(j, "rdf", context);
    if (const Json* v = field(j, "reverse"))
        spec.reverse = ReverseSpec::from_json(*v, context);
    return spec;
}

EdgeSpec EdgeSpec::from_json(const Json& j, const std::string& context)
{
    EdgeSpec spec;
    if (j.is_null())
        return spec;
    expect_object(j, context + " edge");
    spec.source = get_string(j, "source", context);
    spec.target = get_string(j, "target", context);
    spec.caption = get_string_list(j, "caption", context);
    spec.label = get_string(j, "label", context);
    spec.directed = get_bool(j, "directed", context).value_or(true);
    return spec;
}

SchemaSpec SchemaSpec::from_json(const Json& j, const std::string& name)
{
    expect_object(j, name);
    SchemaSpec spec;
    spec.label = get_string(j, "label", name);
    spec.plural = get_string(j, "plural", name);
    spec.description = get_string(j, "description", name);
    spec.extends = get_string_list(j, "extends", name);
    if (const Json* props = field(j, "properties"))
    {
        expect_object(*props, name + " properties");
        for (const auto& [prop_name, prop] : props->items())
            spec.properties.emplace_back(prop_name,
                                         PropertySpec::from_json(prop, name + ":" + prop_name));
    }
    spec.featured = get_string_list(j, "featured", name);
    spec.required = get_string_list(j, "required", name);
    spec.caption = get_string_list(j, "caption", name);
    if (const Json* edge = field(j, "edge"))
        spec.edge = EdgeSpec::from_json(*edge, name);
    spec.rdf = get_string(j, "rdf", name);
    spec.abstract = get_bool(j, "abstract", name).value_or(false);
    spec.hidden = get_bool(j, "hidden", name).value_or(false);
    spec.generated = get_bool(j, "generated", name).value_or(false);
    spec.matchable = get_bool(j, "matchable", name).value_or(true);
    return spec;
}

} // namespace ftmcpp
