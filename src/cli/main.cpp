#include "ftmcpp/exceptions.hpp"
#include "ftmcpp/i18n/catalog.hpp"
#include "ftmcpp/model.hpp"
#include "ftmcpp/settings.hpp"
#include "ftmcpp/util/json.hpp"
#include "ftmcpp/util/log.hpp"
#include "ftmcpp/version.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 2)
{
    std::cout << "ftmcpp " << ftmcpp::VERSION_MAJOR << "." << ftmcpp::VERSION_MINOR << "."
              << ftmcpp::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  ftmcpp --help\n";
    std::cout << "  ftmcpp dump     <model.json> [--pretty]\n";
    std::cout << "  ftmcpp describe <model.json> <schema> [--pretty]\n";
    std::cout << "  ftmcpp validate <model.json> <schema> <properties.json> [--pretty]\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  FTMCPP_LOG_LEVEL   DEBUG, INFO, WARNING, ERROR or OFF (default INFO)\n";
    std::cout << "  FTMCPP_CATALOG     JSON message catalog used for labels and messages\n";
    std::cout << "  FTMCPP_LOCALE      locale name reported for the catalog\n";
    return exit_code;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static ftmcpp::Json read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ftmcpp::Error("cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return ftmcpp::util::json::parse(buffer.str());
}

static void dump_json(const ftmcpp::Json& j, bool pretty)
{
    if (pretty)
        std::cout << ftmcpp::util::json::dump_pretty(j) << "\n";
    else
        std::cout << ftmcpp::util::json::dump(j) << "\n";
}

static std::shared_ptr<const ftmcpp::Model> load_model(const std::string& path,
                                                       const ftmcpp::Settings& settings)
{
    auto catalog = std::make_shared<ftmcpp::i18n::Catalog>(settings.locale);
    if (!settings.catalog_path.empty())
        *catalog = ftmcpp::i18n::Catalog::from_json(read_json_file(settings.catalog_path),
                                                    settings.locale);

    ftmcpp::util::log::Logger logger(&std::cerr,
                                     ftmcpp::util::log::level_from_string(settings.log_level));
    ftmcpp::ModelBuilder builder(ftmcpp::types::Registry::defaults(), catalog, logger);
    builder.load(read_json_file(path));
    return builder.build();
}

static ftmcpp::Json describe(const ftmcpp::Model& model, const ftmcpp::Schema& schema)
{
    auto names = [&model](const std::set<ftmcpp::SchemaId>& ids)
    {
        std::vector<std::string> out;
        for (auto id : ids)
            out.push_back(model.get(id).name());
        return ftmcpp::util::json::sorted_array(out);
    };

    ftmcpp::Json props = ftmcpp::Json::array();
    for (const auto* prop : schema.sorted_properties())
        props.push_back(prop->qname());

    return ftmcpp::Json{{"name", schema.name()},
                        {"label", schema.label()},
                        {"schemata", names(schema.schemata())},
                        {"descendants", names(schema.descendants())},
                        {"matchable_schemata", names(schema.matchable_schemata())},
                        {"edge", schema.edge()},
                        {"properties", props}};
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);

    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);
    const bool pretty = consume_flag(args, "--pretty");

    auto settings = ftmcpp::Settings::from_env();
    try
    {
        if (cmd == "dump")
        {
            if (args.size() != 1)
                return usage(2);
            auto model = load_model(args[0], settings);
            dump_json(model->to_dict(), pretty);
            return 0;
        }

        if (cmd == "describe")
        {
            if (args.size() != 2)
                return usage(2);
            auto model = load_model(args[0], settings);
            dump_json(describe(*model, model->schema(args[1])), pretty);
            return 0;
        }

        if (cmd == "validate")
        {
            if (args.size() != 3)
                return usage(2);
            auto model = load_model(args[0], settings);
            const auto& schema = model->schema(args[1]);
            auto bag = read_json_file(args[2]);
            try
            {
                schema.validate(bag);
            }
            catch (const ftmcpp::InvalidData& e)
            {
                std::cerr << e.what() << "\n";
                dump_json(ftmcpp::Json{{"properties", e.errors()}}, pretty);
                return 3;
            }
            dump_json(bag, pretty);
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return usage(2);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
