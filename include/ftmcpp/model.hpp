#pragma once
#include "ftmcpp/i18n/catalog.hpp"
#include "ftmcpp/schema.hpp"
#include "ftmcpp/types/property_type.hpp"
#include "ftmcpp/util/log.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ftmcpp
{

/// All schemata of one load, fully resolved. A Model only leaves its
/// ModelBuilder once every hierarchy, reverse relation and matchable set has
/// been computed; from then on it is read-only.
class Model
{
  public:
    /// Only a ModelBuilder can create models.
    class Key
    {
        friend class ModelBuilder;
        Key() {}
    };

    Model(Key, std::shared_ptr<const types::Registry> types,
          std::shared_ptr<const i18n::Catalog> catalog, util::log::Logger logger);

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    /// nullptr when no schema has this name.
    const Schema* get(const std::string& name) const;
    const Schema& get(SchemaId id) const;
    /// Raises NotFoundError when no schema has this name.
    const Schema& schema(const std::string& name) const;

    /// Every schema in load order.
    std::vector<const Schema*> schemata() const;
    size_t size() const
    {
        return schemata_.size();
    }

    /// Look up "Schema:property". nullptr when either part is unknown.
    const Property* get_qname(const std::string& qname) const;
    /// Every distinct property object, ordered by qname.
    std::vector<const Property*> properties() const;

    /// The more specific of two schemata, e.g. Person for (LegalEntity, Person).
    /// Raises InvalidData when neither is a subtype of the other.
    const Schema& common_schema(const Schema& left, const Schema& right) const;
    const Schema& common_schema(const std::string& left, const std::string& right) const;

    const types::Registry& types() const
    {
        return *types_;
    }
    const i18n::Catalog& catalog() const
    {
        return *catalog_;
    }
    std::string gettext(const std::string& msgid) const
    {
        return catalog_->gettext(msgid);
    }
    const util::log::Logger& logger() const
    {
        return logger_;
    }

    Json to_dict() const;

  private:
    friend class ModelBuilder;
    friend class Schema;

    Schema* find(const std::string& name);
    Schema& at(SchemaId id);

    std::shared_ptr<const types::Registry> types_;
    std::shared_ptr<const i18n::Catalog> catalog_;
    util::log::Logger logger_;
    std::vector<std::unique_ptr<Schema>> schemata_;
    std::unordered_map<std::string, SchemaId> index_;
    std::map<std::string, const Property*> qnames_;
};

/// Construction-time side of a Model.
///
/// Loading runs in explicit phases: every schema is constructed from its spec,
/// then generated (hierarchy and property merge), then reverse relations are
/// synthesized and propagated to descendants, and finally matchable sets are
/// computed and the model is frozen by build().
class ModelBuilder
{
  public:
    explicit ModelBuilder(std::shared_ptr<const types::Registry> types = types::Registry::defaults(),
                          std::shared_ptr<const i18n::Catalog> catalog =
                              std::make_shared<i18n::Catalog>(),
                          util::log::Logger logger = util::log::Logger());

    ModelBuilder& add(const std::string& name, SchemaSpec spec);
    ModelBuilder& add(const std::string& name, const Json& spec);
    /// Accepts {name: spec, ...} or {"schemata": {name: spec, ...}}.
    ModelBuilder& load(const Json& document);

    /// Construct any pending schemata and generate one of them.
    /// Raises NotFoundError for unknown names.
    Schema& generate(const std::string& name);

    /// Run the remaining load phases and hand over the frozen model.
    /// The builder cannot be used afterwards.
    std::shared_ptr<const Model> build();

  private:
    Model& model();
    void construct_pending();
    void synthesize_reverses();
    void propagate_properties();
    void freeze();

    std::unique_ptr<Model> model_;
    std::vector<std::pair<std::string, SchemaSpec>> pending_;
};

} // namespace ftmcpp
