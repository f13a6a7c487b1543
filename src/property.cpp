#include "ftmcpp/property.hpp"

#include "ftmcpp/exceptions.hpp"
#include "ftmcpp/model.hpp"
#include "ftmcpp/schema.hpp"

namespace ftmcpp
{
namespace
{

// Entity references may be given as the referenced entity itself.
Json entity_id(const types::PropertyType& type, const Json& value)
{
    if (type.name() != types::ENTITY || !value.is_object())
        return value;
    auto it = value.find("id");
    if (it == value.end())
        return Json();
    return *it;
}

} // namespace

Property::Property(Schema& schema, std::string name, PropertySpec spec)
    : schema_(&schema), name_(std::move(name)), spec_(std::move(spec))
{
    qname_ = schema.name() + ":" + name_;
    type_ = schema.model().types().get(spec_.type);
    if (type_ == nullptr)
        throw InvalidModel("Invalid type: " + spec_.type + " (" + qname_ + ")");
    matchable_ = spec_.matchable.value_or(type_->matchable());
    max_length_ = spec_.max_length.value_or(type_->max_length());
    uri_ = spec_.rdf.value_or(std::string(RDF_NAMESPACE) + qname_);
}

std::string Property::label() const
{
    return schema_->model().gettext(spec_.label.value_or(name_));
}

std::optional<std::string> Property::description() const
{
    return schema_->model().catalog().gettext_opt(spec_.description);
}

void Property::generate()
{
    if (range_ != nullptr || !spec_.range)
        return;
    range_ = schema_->model().get(*spec_.range);
    if (range_ == nullptr)
        throw InvalidModel("Invalid range: " + *spec_.range + " (" + qname_ + ")");
}

std::optional<std::string> Property::validate(const Json& values) const
{
    for (const auto& value : values)
    {
        if (stub_)
            return schema_->model().gettext("Property cannot be written");
        if (!type_->validate(entity_id(*type_, value)))
            return schema_->model().gettext("Invalid value");
    }
    return std::nullopt;
}

Json Property::to_dict() const
{
    Json data = {{"name", name_},
                 {"qname", qname_},
                 {"label", label()},
                 {"type", type_->name()},
                 {"maxLength", max_length_}};
    if (auto desc = description(); desc && !desc->empty())
        data["description"] = *desc;
    if (stub_)
        data["stub"] = true;
    if (matchable_)
        data["matchable"] = true;
    if (spec_.hidden)
        data["hidden"] = true;
    if (spec_.deprecated)
        data["deprecated"] = true;
    if (range_ != nullptr)
        data["range"] = range_->name();
    if (reverse_ != nullptr)
        data["reverse"] = reverse_->name();
    if (spec_.format)
        data["format"] = *spec_.format;
    return data;
}

} // namespace ftmcpp
