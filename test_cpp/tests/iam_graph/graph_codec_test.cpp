#include <boost/test/unit_test.hpp>

#include <modules/iam_graph/graph_codec.hpp>
#include <modules/iam_query/query_engine.hpp>
#include <modules/iam_query/query_result_json.hpp>

#include "../../util/graph_fixture.hpp"

#include <cstdio>
#include <initializer_list>

namespace iam_explorer {
namespace test {

namespace {

std::vector<std::string> identityIds(const Graph& graph)
{
    std::vector<std::string> ids;
    for (const auto& i : graph.allIdentities()) {
        ids.push_back(i->getId());
    }
    return ids;
}

std::vector<std::string> edgeStrings(const Graph& graph)
{
    std::vector<std::string> edges;
    for (const auto& e : graph.getEdges()) {
        edges.push_back(edgeKindToString(e.kind) + " " + e.source + " " + e.target);
    }
    return edges;
}

std::vector<std::string> policyIds(const Graph& graph)
{
    std::vector<std::string> ids;
    for (const auto& p : graph.getPolicies()) {
        ids.push_back(p->getId());
    }
    return ids;
}

void checkSameGraph(const Graph& a, const Graph& b)
{
    BOOST_TEST(identityIds(a) == identityIds(b), boost::test_tools::per_element());
    BOOST_TEST(edgeStrings(a) == edgeStrings(b), boost::test_tools::per_element());
    BOOST_TEST(policyIds(a) == policyIds(b), boost::test_tools::per_element());

    QueryEngine qa(a);
    QueryEngine qb(b);
    for (auto action : { "s3:GetObject", "*:Delete*", "iam:*", "lambda:InvokeFunction", "*" }) {
        WhoCanDoResult ra;
        WhoCanDoResult rb;
        BOOST_TEST(!qa.whoCanDo(action, ra));
        BOOST_TEST(!qb.whoCanDo(action, rb));
        BOOST_TEST(QueryResultJson::whoCanDoToJson(ra).dump() == QueryResultJson::whoCanDoToJson(rb).dump());
    }
    for (const auto& id : identityIds(a)) {
        WhatCanDoResult ra;
        WhatCanDoResult rb;
        BOOST_TEST(!qa.whatCanDo(id, ra));
        BOOST_TEST(!qb.whatCanDo(id, rb));
        BOOST_TEST(QueryResultJson::whatCanDoToJson(ra).dump() == QueryResultJson::whatCanDoToJson(rb).dump());
    }
}

} // namespace

BOOST_AUTO_TEST_SUITE(graph_codec)

BOOST_AUTO_TEST_CASE(serialize_deserialize)
{
    auto graph = buildGraph(sampleSnapshot);
    std::vector<uint8_t> bytes = GraphCodec::serialize(*graph);
    BOOST_TEST(!bytes.empty());

    lib::error_code ec;
    auto again = GraphCodec::deserialize(bytes, ec);
    BOOST_REQUIRE_MESSAGE(again, ec.message());
    BOOST_TEST(!ec);
    checkSameGraph(*graph, *again);

    // serialization is deterministic
    BOOST_TEST((GraphCodec::serialize(*again) == bytes));
}

BOOST_AUTO_TEST_CASE(undecodable_bytes)
{
    std::vector<uint8_t> bytes = { 0xff, 0x00, 0x13 };
    lib::error_code ec;
    BOOST_TEST(!GraphCodec::deserialize(bytes, ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::invalid_format));

    BOOST_TEST(!GraphCodec::deserialize(std::vector<uint8_t>(), ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::invalid_format));
}

BOOST_AUTO_TEST_CASE(unsupported_version)
{
    nlohmann::json root;
    root["Version"] = 2;
    root["Snapshot"] = nlohmann::json::parse(sampleSnapshot);
    lib::error_code ec;
    BOOST_TEST(!GraphCodec::deserialize(nlohmann::json::to_cbor(root), ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::invalid_format));

    root.erase("Version");
    BOOST_TEST(!GraphCodec::deserialize(nlohmann::json::to_cbor(root), ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::invalid_format));
}

BOOST_AUTO_TEST_CASE(malformed_snapshot)
{
    nlohmann::json root;
    root["Version"] = GraphCodec::VERSION;
    root["Snapshot"] = nlohmann::json::parse(R"({ "users": [ { "name": "x" } ] })");
    lib::error_code ec;
    BOOST_TEST(!GraphCodec::deserialize(nlohmann::json::to_cbor(root), ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::invalid_format));
}

BOOST_AUTO_TEST_CASE(inconsistent_snapshot)
{
    nlohmann::json root;
    root["Version"] = GraphCodec::VERSION;
    root["Snapshot"] = nlohmann::json::parse(R"({ "users": [ { "arn": "arn:aws:iam::1:user/x", "name": "x", "attached_policies": ["nope"] } ] })");
    lib::error_code ec;
    BOOST_TEST(!GraphCodec::deserialize(nlohmann::json::to_cbor(root), ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::inconsistent_snapshot));
}

BOOST_AUTO_TEST_CASE(save_and_load_file)
{
    std::string filename = "graph_codec_test.cbor";
    auto graph = buildGraph(sampleSnapshot);
    BOOST_REQUIRE(GraphCodec::saveFile(filename, *graph));

    lib::error_code ec;
    auto again = GraphCodec::loadFile(filename, ec);
    BOOST_REQUIRE_MESSAGE(again, ec.message());
    checkSameGraph(*graph, *again);
    std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(load_missing_file)
{
    lib::error_code ec;
    BOOST_TEST(!GraphCodec::loadFile("does_not_exist.cbor", ec));
    BOOST_TEST(ec == make_error_code(IamExplorerError::invalid_format));
}

BOOST_AUTO_TEST_SUITE_END()

} } // namespace
