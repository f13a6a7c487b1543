#pragma once

/// @file ftmcpp.hpp
/// @brief Main header for ftmcpp - includes the schema model and its collaborators
///
/// Usage:
/// @code
/// #include <ftmcpp.hpp>
///
/// int main() {
///     ftmcpp::ModelBuilder builder;
///     builder.load(ftmcpp::Json::parse(R"({
///         "Thing": {"abstract": true, "properties": {"name": {"type": "name"}}},
///         "Person": {"extends": ["Thing"], "required": ["name"]}
///     })"));
///     auto model = builder.build();
///
///     ftmcpp::Json bag = {{"name", "Jane Doe"}};
///     model->schema("Person").validate(bag);
/// }
/// @endcode

// Core types and exceptions
#include "ftmcpp/types.hpp"
#include "ftmcpp/exceptions.hpp"
#include "ftmcpp/settings.hpp"
#include "ftmcpp/version.hpp"

// Collaborators
#include "ftmcpp/i18n/catalog.hpp"
#include "ftmcpp/types/property_type.hpp"
#include "ftmcpp/util/json.hpp"
#include "ftmcpp/util/log.hpp"

// Schema model
#include "ftmcpp/schema_spec.hpp"
#include "ftmcpp/property.hpp"
#include "ftmcpp/schema.hpp"
#include "ftmcpp/model.hpp"
