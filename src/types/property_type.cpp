#include "ftmcpp/types/property_type.hpp"

#include "ftmcpp/exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace ftmcpp::types
{
namespace
{

bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

PropertyType::Options options(const char* label, const char* plural, std::optional<std::string> group,
                              bool matchable, bool pivot, int max_length)
{
    PropertyType::Options o;
    o.label = label;
    o.plural = plural;
    o.group = std::move(group);
    o.matchable = matchable;
    o.pivot = pivot;
    o.max_length = max_length;
    return o;
}

} // namespace

bool PropertyType::validate(const Json& value) const
{
    if (value.is_string())
        return !is_blank(value.get_ref<const std::string&>());
    return value.is_number();
}

Json PropertyType::to_dict() const
{
    Json data = {{"label", label()},
                 {"plural", plural()},
                 {"maxLength", max_length()}};
    if (group())
        data["group"] = *group();
    if (matchable())
        data["matchable"] = true;
    if (pivot())
        data["pivot"] = true;
    return data;
}

bool EntityType::validate(const Json& value) const
{
    if (!value.is_string())
        return false;
    return !is_blank(value.get_ref<const std::string&>());
}

bool JsonType::validate(const Json& value) const
{
    return !value.is_null();
}

std::shared_ptr<Registry> Registry::defaults()
{
    auto registry = std::make_shared<Registry>();
    auto add = [&](const char* name, PropertyType::Options o)
    { registry->add(std::make_unique<PropertyType>(name, std::move(o))); };

    add("string", options("Label", "Labels", std::nullopt, false, false, 1024));
    add("text", options("Text", "Texts", std::nullopt, false, false, 65000));
    add("html", options("HTML", "HTMLs", std::nullopt, false, false, 65000));
    add("name", options("Name", "Names", "names", true, false, 384));
    add("date", options("Date", "Dates", "dates", true, false, 32));
    add("number", options("Number", "Numbers", std::nullopt, false, false, 250));
    registry->add(std::make_unique<EntityType>(
        ENTITY, options("Entity", "Entities", "entities", true, true, 200)));
    add("country", options("Country", "Countries", "countries", true, false, 16));
    add("language", options("Language", "Languages", "languages", false, false, 16));
    add("email", options("E-Mail Address", "E-Mail Addresses", "emails", true, true, 250));
    add("url", options("URL", "URLs", "urls", true, true, 4096));
    add("ip", options("IP Address", "IP Addresses", "ips", true, true, 64));
    add("iban", options("IBAN", "IBANs", "ibans", true, true, 64));
    add("address", options("Address", "Addresses", "addresses", true, true, 250));
    add("phone", options("Phone number", "Phone numbers", "phones", true, true, 64));
    add("identifier", options("Identifier", "Identifiers", "identifiers", true, true, 64));
    add("checksum", options("Checksum", "Checksums", "checksums", true, true, 40));
    add("gender", options("Gender", "Genders", "genders", false, false, 16));
    add("topic", options("Topic", "Topics", "topics", false, false, 64));
    add("mimetype", options("MIME-Type", "MIME-Types", "mimetypes", false, false, 250));
    registry->add(std::make_unique<JsonType>(
        "json", options("Nested data", "Nested data", std::nullopt, false, false, 65000)));
    return registry;
}

void Registry::add(std::unique_ptr<PropertyType> type)
{
    if (!type)
        throw Error("cannot register a null property type");
    const std::string name = type->name();
    if (index_.count(name) > 0)
        throw Error("property type already registered: " + name);
    index_[name] = type.get();
    types_.push_back(std::move(type));
}

const PropertyType* Registry::get(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return it->second;
}

const PropertyType& Registry::entity() const
{
    const auto* type = get(ENTITY);
    if (type == nullptr)
        throw NotFoundError("property type not registered: entity");
    return *type;
}

std::vector<std::string> Registry::names() const
{
    std::vector<std::string> out;
    out.reserve(types_.size());
    for (const auto& type : types_)
        out.push_back(type->name());
    return out;
}

Json Registry::to_dict() const
{
    Json data = Json::object();
    for (const auto& type : types_)
        data[type->name()] = type->to_dict();
    return data;
}

} // namespace ftmcpp::types
