#include "ftmcpp/model.hpp"

#include "ftmcpp/exceptions.hpp"

#include <limits>

namespace ftmcpp
{

Model::Model(Key, std::shared_ptr<const types::Registry> types,
             std::shared_ptr<const i18n::Catalog> catalog, util::log::Logger logger)
    : types_(std::move(types)), catalog_(std::move(catalog)), logger_(std::move(logger))
{
    if (!types_)
        throw Error("model requires a property type registry");
    if (!catalog_)
        throw Error("model requires a message catalog");
}

const Schema* Model::get(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return schemata_[it->second.value].get();
}

const Schema& Model::get(SchemaId id) const
{
    if (id.value >= schemata_.size())
        throw NotFoundError("schema id out of range: " + std::to_string(id.value));
    return *schemata_[id.value];
}

const Schema& Model::schema(const std::string& name) const
{
    const Schema* s = get(name);
    if (s == nullptr)
        throw NotFoundError("schema not found: " + name);
    return *s;
}

Schema* Model::find(const std::string& name)
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return schemata_[it->second.value].get();
}

Schema& Model::at(SchemaId id)
{
    return *schemata_.at(id.value);
}

std::vector<const Schema*> Model::schemata() const
{
    std::vector<const Schema*> out;
    out.reserve(schemata_.size());
    for (const auto& s : schemata_)
        out.push_back(s.get());
    return out;
}

const Property* Model::get_qname(const std::string& qname) const
{
    auto it = qnames_.find(qname);
    if (it == qnames_.end())
        return nullptr;
    return it->second;
}

std::vector<const Property*> Model::properties() const
{
    std::vector<const Property*> out;
    out.reserve(qnames_.size());
    for (const auto& kv : qnames_)
        out.push_back(kv.second);
    return out;
}

const Schema& Model::common_schema(const Schema& left, const Schema& right) const
{
    if (left.is_a(right))
        return left;
    if (right.is_a(left))
        return right;
    throw InvalidData(gettext("No common schema") + ": " + left.name() + " and " + right.name());
}

const Schema& Model::common_schema(const std::string& left, const std::string& right) const
{
    const Schema* l = get(left);
    const Schema* r = get(right);
    if (l == nullptr)
        l = r;
    if (r == nullptr)
        r = l;
    if (l == nullptr)
        throw InvalidData(gettext("Invalid schema") + ": " + left);
    return common_schema(*l, *r);
}

Json Model::to_dict() const
{
    Json schemata = Json::object();
    for (const auto& s : schemata_)
        schemata[s->name()] = s->to_dict();
    return Json{{"schemata", schemata}, {"types", types_->to_dict()}};
}

ModelBuilder::ModelBuilder(std::shared_ptr<const types::Registry> types,
                           std::shared_ptr<const i18n::Catalog> catalog, util::log::Logger logger)
    : model_(std::make_unique<Model>(Model::Key(), std::move(types), std::move(catalog),
                                     std::move(logger)))
{
}

Model& ModelBuilder::model()
{
    if (!model_)
        throw Error("model builder already consumed by build()");
    return *model_;
}

ModelBuilder& ModelBuilder::add(const std::string& name, SchemaSpec spec)
{
    Model& m = model();
    if (m.index_.count(name) > 0)
        throw InvalidModel("Duplicate schema: " + name);
    for (const auto& entry : pending_)
        if (entry.first == name)
            throw InvalidModel("Duplicate schema: " + name);
    pending_.emplace_back(name, std::move(spec));
    return *this;
}

ModelBuilder& ModelBuilder::add(const std::string& name, const Json& spec)
{
    return add(name, SchemaSpec::from_json(spec, name));
}

ModelBuilder& ModelBuilder::load(const Json& document)
{
    if (!document.is_object())
        throw InvalidModel("Invalid model document: expected object");
    const Json& schemata = document.contains("schemata") ? document.at("schemata") : document;
    if (!schemata.is_object())
        throw InvalidModel("Invalid model document: schemata must be an object");
    for (const auto& [name, spec] : schemata.items())
        add(name, spec);
    return *this;
}

void ModelBuilder::construct_pending()
{
    Model& m = model();
    for (auto& [name, spec] : pending_)
    {
        if (m.schemata_.size() >= std::numeric_limits<std::uint32_t>::max())
            throw InvalidModel("Too many schemata");
        SchemaId id{static_cast<std::uint32_t>(m.schemata_.size())};
        m.schemata_.push_back(std::make_unique<Schema>(m, id, name, std::move(spec)));
        m.index_[name] = id;
    }
    pending_.clear();
}

Schema& ModelBuilder::generate(const std::string& name)
{
    construct_pending();
    Schema* schema = model().find(name);
    if (schema == nullptr)
        throw NotFoundError("schema not found: " + name);
    schema->generate();
    return *schema;
}

void ModelBuilder::synthesize_reverses()
{
    Model& m = model();
    for (auto& schema : m.schemata_)
    {
        // Stubs may be appended to this very schema while iterating.
        for (size_t i = 0; i < schema->own_.size(); ++i)
        {
            Property& prop = *schema->own_[i];
            if (!prop.spec_.reverse || prop.range_ == nullptr || prop.reverse_ != nullptr)
                continue;
            Schema& target = m.at(prop.range_->id());
            prop.reverse_ = &target.add_reverse(*prop.spec_.reverse, prop);
        }
    }
}

void ModelBuilder::propagate_properties()
{
    Model& m = model();
    for (auto& schema : m.schemata_)
    {
        for (const auto& prop : schema->own_)
        {
            for (SchemaId id : schema->descendants_)
                m.at(id).properties_.emplace(prop->name(), prop.get());
        }
    }
}

void ModelBuilder::freeze()
{
    Model& m = model();
    for (auto& schema : m.schemata_)
    {
        schema->compute_matchable();
        for (const auto& prop : schema->own_)
            m.qnames_[prop->qname()] = prop.get();
    }
}

std::shared_ptr<const Model> ModelBuilder::build()
{
    construct_pending();
    Model& m = model();
    m.logger().debug("generating " + std::to_string(m.size()) + " schemata");
    for (auto& schema : m.schemata_)
        schema->generate();

    m.logger().debug("synthesizing reverse properties");
    synthesize_reverses();
    propagate_properties();
    freeze();

    m.logger().info("loaded " + std::to_string(m.size()) + " schemata, " +
                    std::to_string(m.qnames_.size()) + " properties");
    return std::shared_ptr<const Model>(std::move(model_));
}

} // namespace ftmcpp
