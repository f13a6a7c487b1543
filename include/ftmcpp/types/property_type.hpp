#pragma once
#include "ftmcpp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ftmcpp::types
{

constexpr const char* ENTITY = "entity";
constexpr const char* STRING = "string";

/// Value type of a property. Validation here only checks the JSON shape of a
/// single value; format rules (dates, URLs, ...) belong to a richer registry.
class PropertyType
{
  public:
    struct Options
    {
        std::string label;
        std::string plural;
        std::optional<std::string> group;
        bool matchable{true};
        bool pivot{false};
        int max_length{250};
    };

    PropertyType(std::string name, Options options)
        : name_(std::move(name)), options_(std::move(options))
    {
    }
    virtual ~PropertyType() = default;

    const std::string& name() const
    {
        return name_;
    }
    const std::string& label() const
    {
        return options_.label;
    }
    const std::string& plural() const
    {
        return options_.plural;
    }
    const std::optional<std::string>& group() const
    {
        return options_.group;
    }
    bool matchable() const
    {
        return options_.matchable;
    }
    bool pivot() const
    {
        return options_.pivot;
    }
    int max_length() const
    {
        return options_.max_length;
    }

    /// True when a single value is acceptable. Accepts non-blank strings and numbers.
    virtual bool validate(const Json& value) const;

    Json to_dict() const;

  private:
    std::string name_;
    Options options_;
};

/// References to other entities, given as an id string.
class EntityType : public PropertyType
{
  public:
    using PropertyType::PropertyType;
    bool validate(const Json& value) const override;
};

/// Arbitrary JSON payloads; only null is rejected.
class JsonType : public PropertyType
{
  public:
    using PropertyType::PropertyType;
    bool validate(const Json& value) const override;
};

class Registry
{
  public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Registry pre-populated with the standard property types.
    static std::shared_ptr<Registry> defaults();

    void add(std::unique_ptr<PropertyType> type);

    /// nullptr when the name is unknown.
    const PropertyType* get(const std::string& name) const;
    bool has(const std::string& name) const
    {
        return get(name) != nullptr;
    }

    const PropertyType& entity() const;

    /// Registered names in registration order.
    std::vector<std::string> names() const;

    Json to_dict() const;

  private:
    std::vector<std::unique_ptr<PropertyType>> types_;
    std::unordered_map<std::string, const PropertyType*> index_;
};

} // namespace ftmcpp::types
