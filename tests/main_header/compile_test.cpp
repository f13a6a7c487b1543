/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main ftmcpp.hpp header
///
/// This test verifies that including just <ftmcpp.hpp> gives access to
/// the builder, the frozen model and the collaborators it is wired with.

#include "ftmcpp.hpp"

#include <cassert>
#include <iostream>

using namespace ftmcpp;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_builder_accessible..." << std::endl;
    {
        ModelBuilder builder;
        builder.add("Thing", Json{{"properties", {{"name", {{"type", "name"}}}}}});
        auto model = builder.build();
        assert(model->schema("Thing").get("name") != nullptr);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_collaborators_accessible..." << std::endl;
    {
        auto types = types::Registry::defaults();
        assert(types->has("entity"));
        i18n::Catalog catalog("en");
        assert(catalog.gettext("Required") == "Required");
        util::log::Logger logger;
        (void)logger;
        Settings settings;
        assert(settings.locale == "en");
        static_assert(VERSION_MAJOR == 0, "unexpected major version");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "=== All main header tests passed ===" << std::endl;
    return 0;
}
