#pragma once
#include "ftmcpp/property.hpp"
#include "ftmcpp/schema_spec.hpp"
#include "ftmcpp/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ftmcpp
{

class Model;

/// A type definition for a class of entities.
///
/// Schemata form a multi-rooted hierarchy: a schema inherits every property of
/// each schema it extends, and its descendants add further properties. Identity
/// is the SchemaId handed out by the owning model; two schemata compare equal
/// only when they are the same node.
///
/// Non-const members are only reachable while a ModelBuilder owns the model.
class Schema
{
  public:
    Schema(Model& model, SchemaId id, std::string name, SchemaSpec spec);

    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    SchemaId id() const
    {
        return id_;
    }
    const std::string& name() const
    {
        return name_;
    }
    const Model& model() const
    {
        return *model_;
    }

    std::string label() const;
    std::string plural() const;
    std::optional<std::string> description() const;
    std::string edge_label() const;

    /// RDF identifier.
    const std::string& uri() const
    {
        return uri_;
    }

    /// Used only for inheritance, never instantiated.
    bool abstract() const
    {
        return spec_.abstract;
    }
    /// Hidden from listings. Always false for abstract schemata.
    bool hidden() const
    {
        return hidden_;
    }
    /// Created by the system; users are not offered to create these.
    bool generated() const
    {
        return spec_.generated;
    }
    /// Eligible for fuzzy cross-entity comparison.
    bool matchable() const
    {
        return spec_.matchable;
    }

    const std::vector<std::string>& featured() const
    {
        return spec_.featured;
    }
    const std::vector<std::string>& required() const
    {
        return spec_.required;
    }
    /// Checked in order; the first property with a value titles the entity.
    const std::vector<std::string>& caption() const
    {
        return spec_.caption;
    }

    /// Rendered as an edge between two entities in a property graph.
    bool edge() const
    {
        return spec_.edge.source.has_value() && spec_.edge.target.has_value();
    }
    const std::optional<std::string>& edge_source() const
    {
        return spec_.edge.source;
    }
    const std::optional<std::string>& edge_target() const
    {
        return spec_.edge.target;
    }
    const std::vector<std::string>& edge_caption() const
    {
        return spec_.edge.caption;
    }
    bool edge_directed() const
    {
        return spec_.edge.directed;
    }
    const Property* source_prop() const
    {
        return get(spec_.edge.source);
    }
    const Property* target_prop() const
    {
        return get(spec_.edge.target);
    }

    /// Direct parents, in declaration order.
    const std::vector<SchemaId>& extends() const
    {
        return extends_;
    }
    /// All ancestors including the schema itself.
    const std::set<SchemaId>& schemata() const
    {
        return schemata_;
    }
    /// Names of schemata().
    const std::set<std::string>& names() const
    {
        return names_;
    }
    /// Every schema that has this one among its ancestors.
    const std::set<SchemaId>& descendants() const
    {
        return descendants_;
    }
    /// Own and inherited properties.
    const std::map<std::string, const Property*>& properties() const
    {
        return properties_;
    }

    /// Schemata an entity of this type can sensibly be compared with:
    /// matchable ancestors and descendants. Empty unless this schema is matchable.
    const std::set<SchemaId>& matchable_schemata() const
    {
        return matchable_schemata_;
    }
    bool can_match(const Schema& other) const
    {
        return matchable_schemata_.count(other.id_) > 0;
    }

    bool is_a(const Schema& other) const
    {
        return schemata_.count(other.id_) > 0;
    }
    bool is_a(const std::string& name) const
    {
        return names_.count(name) > 0;
    }

    const Property* get(const std::string& name) const;
    const Property* get(const char* name) const
    {
        return get(std::string(name));
    }
    const Property* get(const std::optional<std::string>& name) const
    {
        return name ? get(*name) : nullptr;
    }

    /// Caption properties first, then featured ones, the rest by label.
    std::vector<const Property*> sorted_properties() const;

    /// Validate a bag of property name -> value(s). Keys that are not
    /// properties of this schema are removed from `data`. Every failing
    /// property is reported in one InvalidData.
    void validate(Json& data) const;

    Json to_dict() const;

    /// Resolve parents, merge inherited properties and check the property
    /// lists. Safe to call repeatedly and in any order across schemata.
    void generate();

    /// Make the inverse of `other` visible on this schema, creating a stub
    /// property when the name is not taken yet.
    const Property& add_reverse(const ReverseSpec& spec, const Property& other);

    bool operator==(const Schema& other) const
    {
        return id_ == other.id_;
    }
    bool operator!=(const Schema& other) const
    {
        return id_ != other.id_;
    }
    bool operator<(const Schema& other) const
    {
        return name_ < other.name_;
    }

  private:
    friend class ModelBuilder;

    enum class State
    {
        Pending,
        InProgress,
        Done
    };

    void resolve();
    void check_property_list(const std::vector<std::string>& names, const char* kind) const;
    void compute_matchable();

    Model* model_;
    SchemaId id_;
    std::string name_;
    SchemaSpec spec_;
    std::string label_;
    std::string plural_;
    std::string edge_label_;
    std::string uri_;
    bool hidden_{false};
    State state_{State::Pending};

    std::vector<std::unique_ptr<Property>> own_;
    std::vector<SchemaId> extends_;
    std::set<SchemaId> schemata_;
    std::set<std::string> names_;
    std::set<SchemaId> descendants_;
    std::map<std::string, const Property*> properties_;
    std::set<SchemaId> matchable_schemata_;
};

} // namespace ftmcpp
