#include <boost/test/unit_test.hpp>

#include <explorer_config.hpp>
#include <json_config.hpp>

#include <cstdio>
#include <fstream>

namespace iam_explorer {
namespace test {

BOOST_AUTO_TEST_SUITE(explorer_config)

BOOST_AUTO_TEST_CASE(valid_config)
{
    ExplorerConfig config;
    config.setJson(nlohmann::json::parse(R"({ "GraphFile": "g.cbor", "LogLevel": "info", "Format": "json" })"));
    BOOST_TEST(config.isValid());
    BOOST_TEST(config.getGraphFile() == "g.cbor");
    BOOST_TEST(config.getSnapshotFile() == "");
    BOOST_TEST(config.getLogLevel() == "info");
    BOOST_TEST(config.getFormat() == "json");
}

BOOST_AUTO_TEST_CASE(empty_config_is_valid)
{
    ExplorerConfig config;
    BOOST_TEST(config.isValid());
    BOOST_TEST(config.getFormat() == "");
}

BOOST_AUTO_TEST_CASE(invalid_configs)
{
    ExplorerConfig config;
    config.setJson(nlohmann::json::parse(R"({ "GraphFile": 42 })"));
    BOOST_TEST(!config.isValid());
    config.setJson(nlohmann::json::parse(R"({ "Format": "xml" })"));
    BOOST_TEST(!config.isValid());
    config.setJson(nlohmann::json::parse(R"([ "GraphFile" ])"));
    BOOST_TEST(!config.isValid());
}

BOOST_AUTO_TEST_CASE(example_is_valid)
{
    ExplorerConfig config;
    config.setJson(nlohmann::json::parse(ExplorerConfig::example()));
    BOOST_TEST(config.isValid());
}

BOOST_AUTO_TEST_CASE(load_from_file)
{
    std::string filename = "explorer_config_test.json";
    {
        std::ofstream out(filename);
        out << R"({ "SnapshotFile": "snapshot.json" })";
    }

    ExplorerConfig config(filename);
    BOOST_REQUIRE(config.load());
    BOOST_TEST(config.isValid());
    BOOST_TEST(config.getSnapshotFile() == "snapshot.json");
    std::remove(filename.c_str());

    BOOST_TEST(!ExplorerConfig("does_not_exist.json").load());
}

BOOST_AUTO_TEST_CASE(malformed_file)
{
    std::string filename = "explorer_config_malformed_test.json";
    {
        std::ofstream out(filename);
        out << "{ \"SnapshotFile\": ";
    }
    nlohmann::json json;
    BOOST_TEST(!json_config_load(filename, json));
    BOOST_TEST(!ExplorerConfig(filename).load());
    std::remove(filename.c_str());
}

BOOST_AUTO_TEST_SUITE_END()

} } // namespace
