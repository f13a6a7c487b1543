#include <ftmcpp.hpp>
#include <iostream>

// Example: load a small schema hierarchy and validate entities against it.
//
// Usage:
//   ./ftmcpp_example_quick_start

int main()
{
    using ftmcpp::Json;

    // ============================================================================
    // Step 1: Describe the schemata
    // ============================================================================

    ftmcpp::ModelBuilder builder;
    builder.load(Json::parse(R"({
        "Thing": {"abstract": true, "caption": ["name"],
                  "properties": {"name": {"type": "name", "label": "Name"}}},
        "LegalEntity": {"extends": ["Thing"], "label": "Legal entity",
                        "properties": {"country": {"type": "country", "label": "Country"}}},
        "Company": {"extends": ["LegalEntity"], "required": ["name"]}
    })"));

    // ============================================================================
    // Step 2: Freeze the model
    // ============================================================================

    auto model = builder.build();
    const auto& company = model->schema("Company");

    std::cout << company.name() << " is a:";
    for (const auto& name : company.names())
        std::cout << " " << name;
    std::cout << "\n";

    // ============================================================================
    // Step 3: Validate property bags
    // ============================================================================

    Json good = {{"name", "ACME Inc."}, {"country", "us"}, {"color", "red"}};
    company.validate(good);
    std::cout << "valid, kept: " << good.dump() << "\n";

    Json bad = Json::object();
    try
    {
        company.validate(bad);
    }
    catch (const ftmcpp::InvalidData& e)
    {
        std::cout << e.what() << ": " << e.errors().dump() << "\n";
    }
    return 0;
}
