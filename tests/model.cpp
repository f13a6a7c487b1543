/// @file model.cpp
/// @brief Model lookups, common_schema and property ordering

#include "schema/model_fixture.hpp"

#include <set>

using namespace ftmcpp;

void test_lookup()
{
    std::cout << "test_lookup...\n";
    auto model = build_sample_model();
    assert(model->size() == 8);
    assert(model->get("Person") != nullptr);
    assert(model->get("Nobody") == nullptr);
    assert(raises<NotFoundError>([&] { model->schema("Nobody"); }));

    const auto& person = model->schema("Person");
    assert(&model->get(person.id()) == &person);
    assert(model->schemata().front()->name() == "Asset"); // JSON objects load in key order
    std::cout << "  [PASS]\n";
}

void test_qnames()
{
    std::cout << "test_qnames...\n";
    auto model = build_sample_model();
    const Property* name = model->get_qname("Thing:name");
    assert(name != nullptr);
    assert(name == model->schema("Person").get("name"));
    // Inherited properties keep the declaring schema in their qname.
    assert(model->get_qname("Person:name") == nullptr);
    assert(model->get_qname("Asset:ownershipAsset") != nullptr);

    std::set<std::string> qnames;
    for (const auto* prop : model->properties())
        qnames.insert(prop->qname());
    assert(qnames.size() == model->properties().size());
    assert(qnames.count("LegalEntity:ownershipOwner") == 1);
    std::cout << "  [PASS]\n";
}

void test_is_a()
{
    std::cout << "test_is_a...\n";
    auto model = build_sample_model();
    const auto& company = model->schema("Company");
    assert(company.is_a("Thing"));
    assert(company.is_a("Asset"));
    assert(company.is_a(model->schema("LegalEntity")));
    assert(company.is_a(company));
    assert(!company.is_a("Person"));
    assert(!model->schema("Thing").is_a(company));
    assert(company == model->schema("Company"));
    assert(company != model->schema("Person"));
    assert(model->schema("Asset") < company);
    std::cout << "  [PASS]\n";
}

void test_common_schema()
{
    std::cout << "test_common_schema...\n";
    auto model = build_sample_model();
    assert(model->common_schema("LegalEntity", "Person").name() == "Person");
    assert(model->common_schema("Person", "LegalEntity").name() == "Person");
    assert(model->common_schema("Company", "Company").name() == "Company");
    assert(model->common_schema("Nobody", "Person").name() == "Person");
    assert(raises<InvalidData>([&] { model->common_schema("Person", "Company"); }));
    assert(raises<InvalidData>([&] { model->common_schema("Nobody", "Nothing"); }));
    std::cout << "  [PASS]\n";
}

void test_sorted_properties()
{
    std::cout << "test_sorted_properties...\n";
    auto model = build_sample_model();
    auto sorted = model->schema("LegalEntity").sorted_properties();
    assert(sorted.size() == model->schema("LegalEntity").properties().size());
    // LegalEntity has no caption of its own: featured first, each group by label.
    assert(sorted[0]->name() == "country");
    assert(sorted[1]->name() == "name");
    assert(sorted[2]->name() == "ownershipOwner"); // "Assets and shares"
    assert(sorted[3]->name() == "email");

    auto ownership = model->schema("Ownership").sorted_properties();
    assert(ownership[0]->name() == "percentage");
    std::cout << "  [PASS]\n";
}

void test_uris()
{
    std::cout << "test_uris...\n";
    auto model = build_model(Json::parse(R"({
        "Person": {"properties": {"name": {}, "nationality": {"rdf": "http://example.org/nat"}}},
        "Vessel": {"rdf": "http://example.org/Vessel"}
    })"));
    assert(model->schema("Person").uri() == "https://w3id.org/ftm#Person");
    assert(model->schema("Vessel").uri() == "http://example.org/Vessel");
    assert(model->schema("Person").get("name")->uri() == "https://w3id.org/ftm#Person:name");
    assert(model->schema("Person").get("nationality")->uri() == "http://example.org/nat");
    std::cout << "  [PASS]\n";
}

void test_wrapped_document_and_types()
{
    std::cout << "test_wrapped_document_and_types...\n";
    auto model = build_model(Json::parse(R"({"schemata": {
        "Document": {"properties": {"title": {"type": "string"}, "body": {"type": "text", "matchable": true}}}
    }})"));
    const auto& doc = model->schema("Document");
    assert(doc.get("title")->type().name() == "string");
    assert(doc.get("title")->max_length() == 1024);
    assert(doc.get("body")->matchable());

    std::string what;
    assert(raises<InvalidModel>(
        [] { build_model(Json::parse(R"({"Doc": {"properties": {"x": {"type": "blob"}}}})")); },
        &what));
    assert(what == "Invalid type: blob (Doc:x)");
    std::cout << "  [PASS]\n";
}

int main()
{
    test_lookup();
    test_qnames();
    test_is_a();
    test_common_schema();
    test_sorted_properties();
    test_uris();
    test_wrapped_document_and_types();
    std::cout << "All model tests passed\n";
    return 0;
}
