/// @file util.cpp
/// @brief JSON helpers, message catalog and logger

#include "ftmcpp/exceptions.hpp"
#include "ftmcpp/i18n/catalog.hpp"
#include "ftmcpp/types/property_type.hpp"
#include "ftmcpp/util/json.hpp"
#include "ftmcpp/util/log.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

using namespace ftmcpp;

void test_ensure_list()
{
    std::cout << "test_ensure_list...\n";
    assert(util::json::ensure_list(Json()) == Json::array());
    assert(util::json::ensure_list("a") == Json::array({"a"}));
    assert(util::json::ensure_list(Json::array({1, 2})) == Json::array({1, 2}));
    assert(util::json::ensure_list(Json{{"id", "x"}}).size() == 1);
    std::cout << "  [PASS]\n";
}

void test_to_bool()
{
    std::cout << "test_to_bool...\n";
    assert(util::json::to_bool(true) == true);
    assert(util::json::to_bool(0) == false);
    assert(util::json::to_bool("Yes") == true);
    assert(util::json::to_bool("off") == false);
    assert(!util::json::to_bool("perhaps").has_value());
    assert(!util::json::to_bool(Json::array()).has_value());
    std::cout << "  [PASS]\n";
}

void test_catalog()
{
    std::cout << "test_catalog...\n";
    auto catalog = i18n::Catalog::from_json(Json{{"Required", "Obligatoire"}, {"Empty", ""}}, "fr");
    assert(catalog.locale() == "fr");
    assert(catalog.size() == 2);
    assert(catalog.gettext("Required") == "Obligatoire");
    assert(catalog.gettext("Missing") == "Missing");
    assert(catalog.gettext("Empty") == "Empty");
    assert(!catalog.gettext_opt(std::nullopt).has_value());
    assert(*catalog.gettext_opt(std::string("Required")) == "Obligatoire");

    bool failed = false;
    try
    {
        i18n::Catalog::from_json(Json{{"Required", 1}});
    }
    catch (const Error&)
    {
        failed = true;
    }
    assert(failed);
    std::cout << "  [PASS]\n";
}

void test_logger_threshold()
{
    std::cout << "test_logger_threshold...\n";
    std::ostringstream out;
    util::log::Logger logger(&out, util::log::level_from_string("warning"));
    logger.debug("hidden");
    logger.info("hidden");
    logger.warning("shown");
    logger.error("also shown");
    const auto text = out.str();
    assert(text.find("hidden") == std::string::npos);
    assert(text.find("[ftmcpp] WARNING: shown") != std::string::npos);
    assert(text.find("[ftmcpp] ERROR: also shown") != std::string::npos);

    logger.set_threshold(util::log::Level::Off);
    logger.error("silenced");
    assert(out.str().find("silenced") == std::string::npos);

    assert(util::log::level_from_string("DEBUG") == util::log::Level::Debug);
    assert(util::log::level_from_string("warn") == util::log::Level::Warning);
    assert(util::log::level_from_string("verbose") == util::log::Level::Info);
    std::cout << "  [PASS]\n";
}

void test_type_registry()
{
    std::cout << "test_type_registry...\n";
    auto registry = types::Registry::defaults();
    assert(registry->has("string"));
    assert(registry->has("entity"));
    assert(!registry->has("blob"));
    assert(registry->names().front() == "string");

    const auto& entity = registry->entity();
    assert(entity.validate("abc"));
    assert(!entity.validate(""));
    assert(!entity.validate(12));

    const auto* number = registry->get("number");
    assert(number->validate(12.5));
    assert(number->validate("12.5"));
    assert(!number->validate(Json()));
    assert(!number->validate(Json::array()));

    assert(registry->get("json")->validate(Json{{"a", 1}}));

    bool failed = false;
    try
    {
        registry->add(std::make_unique<types::PropertyType>("string", types::PropertyType::Options{}));
    }
    catch (const Error&)
    {
        failed = true;
    }
    assert(failed);
    std::cout << "  [PASS]\n";
}

int main()
{
    test_ensure_list();
    test_to_bool();
    test_catalog();
    test_logger_threshold();
    test_type_registry();
    std::cout << "All util tests passed\n";
    return 0;
}
