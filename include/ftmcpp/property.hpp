#pragma once
#include "ftmcpp/schema_spec.hpp"
#include "ftmcpp/types.hpp"
#include "ftmcpp/types/property_type.hpp"

#include <optional>
#include <string>

namespace ftmcpp
{

class Schema;

/// A named, typed attribute declared by one schema and shared (by reference)
/// with every schema that inherits it.
class Property
{
  public:
    /// Raises InvalidModel when the type name is not registered.
    Property(Schema& schema, std::string name, PropertySpec spec);

    Property(const Property&) = delete;
    Property& operator=(const Property&) = delete;

    const std::string& name() const
    {
        return name_;
    }
    /// "Schema:property"
    const std::string& qname() const
    {
        return qname_;
    }
    /// The declaring schema.
    const Schema& schema() const
    {
        return *schema_;
    }
    const types::PropertyType& type() const
    {
        return *type_;
    }

    std::string label() const;
    std::optional<std::string> description() const;

    bool hidden() const
    {
        return spec_.hidden;
    }
    bool matchable() const
    {
        return matchable_;
    }
    bool deprecated() const
    {
        return spec_.deprecated;
    }
    int max_length() const
    {
        return max_length_;
    }
    const std::optional<std::string>& format() const
    {
        return spec_.format;
    }
    const std::string& uri() const
    {
        return uri_;
    }

    /// Synthesized as the inverse of another schema's relation; never written directly.
    bool stub() const
    {
        return stub_;
    }

    /// Schema the values point at, once generated.
    const Schema* range() const
    {
        return range_;
    }
    /// Inverse property, once reverse relations have been synthesized.
    const Property* reverse() const
    {
        return reverse_;
    }
    const std::optional<ReverseSpec>& reverse_spec() const
    {
        return spec_.reverse;
    }

    /// Resolve the range name against the model. Idempotent.
    void generate();

    /// Check every value; the first failure is returned as a translated message.
    std::optional<std::string> validate(const Json& values) const;

    Json to_dict() const;

  private:
    friend class Schema;
    friend class ModelBuilder;

    Schema* schema_;
    std::string name_;
    std::string qname_;
    PropertySpec spec_;
    const types::PropertyType* type_ = nullptr;
    bool matchable_{false};
    int max_length_{0};
    std::string uri_;
    bool stub_{false};
    const Schema* range_ = nullptr;
    const Property* reverse_ = nullptr;
};

} // namespace ftmcpp
