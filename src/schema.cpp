#include "ftmcpp/schema.hpp"

#include "ftmcpp/exceptions.hpp"
#include "ftmcpp/model.hpp"
#include "ftmcpp/util/json.hpp"

#include <algorithm>
#include <tuple>

namespace ftmcpp
{

Schema::Schema(Model& model, SchemaId id, std::string name, SchemaSpec spec)
    : model_(&model), id_(id), name_(std::move(name)), spec_(std::move(spec))
{
    label_ = spec_.label.value_or(name_);
    plural_ = spec_.plural.value_or(label_);
    edge_label_ = spec_.edge.label.value_or(label_);
    uri_ = spec_.rdf.value_or(std::string(RDF_NAMESPACE) + name_);
    hidden_ = spec_.hidden && !spec_.abstract;

    schemata_.insert(id_);
    names_.insert(name_);

    for (auto& [prop_name, prop_spec] : spec_.properties)
    {
        if (properties_.count(prop_name) > 0)
            throw InvalidModel("Duplicate property: " + prop_name + " (" + name_ + ")");
        auto prop = std::make_unique<Property>(*this, prop_name, std::move(prop_spec));
        properties_[prop_name] = prop.get();
        own_.push_back(std::move(prop));
    }
    spec_.properties.clear();
}

std::string Schema::label() const
{
    return model_->gettext(label_);
}

std::string Schema::plural() const
{
    return model_->gettext(plural_);
}

std::optional<std::string> Schema::description() const
{
    return model_->catalog().gettext_opt(spec_.description);
}

std::string Schema::edge_label() const
{
    return model_->gettext(edge_label_);
}

const Property* Schema::get(const std::string& name) const
{
    auto it = properties_.find(name);
    if (it == properties_.end())
        return nullptr;
    return it->second;
}

void Schema::generate()
{
    if (state_ == State::Done)
        return;
    if (state_ == State::InProgress)
        throw InvalidModel("Cyclic extends: " + name_);
    state_ = State::InProgress;
    try
    {
        resolve();
    }
    catch (...)
    {
        // Leave the schema retryable once the caller fixes the definitions.
        state_ = State::Pending;
        throw;
    }
    state_ = State::Done;
}

void Schema::resolve()
{
    for (const auto& parent_name : spec_.extends)
    {
        Schema* parent = model_->find(parent_name);
        if (parent == nullptr)
            throw InvalidModel("Invalid extends: " + parent_name);
        parent->generate();

        // First parent in declaration order wins for names not declared here.
        for (const auto& [prop_name, prop] : parent->properties_)
        {
            auto [it, inserted] = properties_.emplace(prop_name, prop);
            if (!inserted && it->second != prop && &it->second->schema() != this)
                model_->logger().debug(name_ + ": " + prop_name + " inherited from " +
                                       it->second->schema().name() + ", ignoring " +
                                       prop->qname());
        }

        if (std::find(extends_.begin(), extends_.end(), parent->id_) == extends_.end())
            extends_.push_back(parent->id_);
        for (SchemaId ancestor_id : parent->schemata_)
        {
            Schema& ancestor = model_->at(ancestor_id);
            schemata_.insert(ancestor_id);
            names_.insert(ancestor.name_);
            ancestor.descendants_.insert(id_);
        }
    }

    // Inherited properties were generated by their declaring schema already.
    for (auto& prop : own_)
        prop->generate();

    check_property_list(spec_.featured, "featured");
    check_property_list(spec_.caption, "caption");
    check_property_list(spec_.required, "required");

    if (edge())
    {
        if (source_prop() == nullptr)
            throw InvalidModel("Missing edge source: " + *spec_.edge.source);
        if (target_prop() == nullptr)
            throw InvalidModel("Missing edge target: " + *spec_.edge.target);
    }
}

void Schema::check_property_list(const std::vector<std::string>& names, const char* kind) const
{
    for (const auto& name : names)
        if (get(name) == nullptr)
            throw InvalidModel("Missing " + std::string(kind) + " property: " + name + " (" +
                               name_ + ")");
}

const Property& Schema::add_reverse(const ReverseSpec& spec, const Property& other)
{
    if (!spec.name)
        throw InvalidModel("Unnamed reverse: " + other.qname());

    if (const Property* existing = get(*spec.name))
        return *existing;

    PropertySpec stub_spec;
    stub_spec.label = spec.label;
    stub_spec.type = types::ENTITY;
    stub_spec.range = other.schema().name();
    stub_spec.hidden = spec.hidden.value_or(other.hidden());

    auto prop = std::make_unique<Property>(*this, *spec.name, std::move(stub_spec));
    prop->stub_ = true;
    prop->reverse_ = &other;
    prop->generate();

    const Property& added = *prop;
    properties_[added.name()] = prop.get();
    own_.push_back(std::move(prop));
    return added;
}

void Schema::compute_matchable()
{
    matchable_schemata_.clear();
    if (!spec_.matchable)
        return;
    auto consider = [this](SchemaId candidate)
    {
        if (model_->at(candidate).matchable())
            matchable_schemata_.insert(candidate);
    };
    for (SchemaId id : schemata_)
        consider(id);
    for (SchemaId id : descendants_)
        consider(id);
}

std::vector<const Property*> Schema::sorted_properties() const
{
    auto listed = [](const std::vector<std::string>& names, const std::string& name)
    { return std::find(names.begin(), names.end(), name) != names.end(); };

    std::vector<std::pair<std::tuple<bool, bool, std::string>, const Property*>> keyed;
    keyed.reserve(properties_.size());
    for (const auto& [name, prop] : properties_)
        keyed.push_back({std::make_tuple(!listed(spec_.caption, name),
                                         !listed(spec_.featured, name), prop->label()),
                         prop});
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<const Property*> out;
    out.reserve(keyed.size());
    for (const auto& entry : keyed)
        out.push_back(entry.second);
    return out;
}

void Schema::validate(Json& data) const
{
    if (!data.is_object())
        data = Json::object();

    Json errors = Json::object();
    for (const auto& [name, prop] : properties_)
    {
        Json values = Json::array();
        auto it = data.find(name);
        if (it != data.end())
            values = util::json::ensure_list(*it);

        auto error = prop->validate(values);
        if (!error && values.empty() &&
            std::find(spec_.required.begin(), spec_.required.end(), name) != spec_.required.end())
            error = model_->gettext("Required");
        if (error)
            errors[name] = *error;
    }

    std::vector<std::string> unknown;
    for (const auto& item : data.items())
        if (properties_.count(item.key()) == 0)
            unknown.push_back(item.key());
    for (const auto& key : unknown)
        data.erase(key);

    if (!errors.empty())
        throw InvalidData(model_->gettext("Entity validation failed"), std::move(errors));
}

Json Schema::to_dict() const
{
    Json extends = Json::array();
    {
        std::vector<std::string> parents;
        for (SchemaId id : extends_)
            parents.push_back(model_->get(id).name());
        extends = util::json::sorted_array(parents);
    }

    Json data = {{"label", label()},
                 {"plural", plural()},
                 {"schemata", util::json::sorted_array(names_)},
                 {"extends", extends}};

    if (spec_.edge.source && spec_.edge.target)
    {
        auto edge_text = edge_label();
        if (!edge_text.empty())
            data["edge"] = {{"source", *spec_.edge.source},
                            {"target", *spec_.edge.target},
                            {"caption", spec_.edge.caption},
                            {"label", edge_text},
                            {"directed", spec_.edge.directed}};
    }
    if (!spec_.featured.empty())
        data["featured"] = spec_.featured;
    if (!spec_.required.empty())
        data["required"] = spec_.required;
    if (!spec_.caption.empty())
        data["caption"] = spec_.caption;
    if (auto desc = description(); desc && !desc->empty())
        data["description"] = *desc;
    if (spec_.abstract)
        data["abstract"] = true;
    if (hidden_)
        data["hidden"] = true;
    if (spec_.generated)
        data["generated"] = true;
    if (!spec_.matchable)
        data["matchable"] = false;

    Json properties = Json::object();
    for (const auto& prop : own_)
        properties[prop->name()] = prop->to_dict();
    data["properties"] = properties;
    return data;
}

} // namespace ftmcpp
