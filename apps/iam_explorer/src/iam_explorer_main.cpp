#include "explorer_config.hpp"
#include "json_config.hpp"

#include <iam_explorer/iam_explorer.hpp>

#include <cxxopts.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace iam_explorer;

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_LOAD = 2,
    EXIT_QUERY = 3
};

static const char* LOG_MODULE = "main";

struct Settings {
    std::string graphFile;
    std::string snapshotFile;
    std::string format;
    std::string logLevel;
};

void print_invalid_config_help(const std::string& filename)
{
    std::cout << "The config file is invalid (" << filename << "). Provide a file with the following format" << std::endl;
    std::cout << ExplorerConfig::example() << std::endl;
}

std::string join(const std::vector<std::string>& items, const std::string& separator)
{
    std::string out;
    for (const auto& i : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += i;
    }
    return out;
}

/**
 * Print rows as left aligned columns.
 */
void print_table(const std::vector<std::string>& header, const std::vector<std::vector<std::string> >& rows)
{
    std::vector<size_t> widths;
    for (const auto& h : header) {
        widths.push_back(h.size());
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); i++) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    auto printRow = [&](const std::vector<std::string>& row) {
        for (size_t i = 0; i < row.size(); i++) {
            std::cout << std::left << std::setw(static_cast<int>(widths[i]) + 2) << row[i];
        }
        std::cout << std::endl;
    };
    printRow(header);
    for (const auto& row : rows) {
        printRow(row);
    }
}

void print_warnings(const std::vector<std::string>& warnings)
{
    for (const auto& w : warnings) {
        std::cout << "warning: " << w << std::endl;
    }
}

std::unique_ptr<Graph> build_from_snapshot_file(const std::string& filename, std::shared_ptr<Logger> logger)
{
    nlohmann::json json;
    if (!json_config_load(filename, json)) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Cannot read the snapshot " << filename);
        return nullptr;
    }
    Snapshot snapshot;
    std::string errorRecord;
    if (!SnapshotJson::snapshotFromJson(json, snapshot, errorRecord)) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Malformed record in the snapshot: " << errorRecord);
        return nullptr;
    }
    GraphBuilder builder(logger);
    lib::error_code ec;
    auto graph = builder.build(snapshot, ec);
    if (!graph) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Cannot build the graph (" << ec.message() << "): " << builder.getErrorRecord()
                               << " " << builder.getErrorMessage());
    }
    return graph;
}

std::unique_ptr<Graph> load_graph(const Settings& settings, std::shared_ptr<Logger> logger)
{
    if (!settings.graphFile.empty()) {
        lib::error_code ec;
        auto graph = GraphCodec::loadFile(settings.graphFile, ec, logger);
        if (!graph) {
            IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Cannot load the graph " << settings.graphFile << " (" << ec.message() << ")");
        }
        return graph;
    }
    if (!settings.snapshotFile.empty()) {
        return build_from_snapshot_file(settings.snapshotFile, logger);
    }
    IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Missing --graph or --input");
    return nullptr;
}

void print_who_can_do(const WhoCanDoResult& result, const std::string& format)
{
    if (format == "json") {
        std::cout << QueryResultJson::whoCanDoToJson(result).dump(2) << std::endl;
        return;
    }
    std::vector<std::vector<std::string> > rows;
    for (const auto& e : result.entries) {
        rows.push_back({ e.identityName, identityTypeToString(e.identityType), e.via.empty() ? "-" : e.viaString(),
                         join(e.actions, ","), join(e.resources, ","), join(e.policies, ","), e.conditional ? "yes" : "no" });
    }
    print_table({ "Identity", "Type", "Via", "Actions", "Resources", "Policies", "Conditional" }, rows);
    print_warnings(result.warnings);
}

void print_what_can_do(const WhatCanDoResult& result, const std::string& format)
{
    if (format == "json") {
        std::cout << QueryResultJson::whatCanDoToJson(result).dump(2) << std::endl;
        return;
    }
    std::cout << identityTypeToString(result.identityType) << " " << result.identityName << " (" << result.identityId << ")" << std::endl;
    std::vector<std::vector<std::string> > rows;
    for (const auto& p : result.permissions) {
        rows.push_back({ effectToString(p.effect), p.action, p.resource, p.policyId, p.attribution, p.conditional ? "yes" : "no" });
    }
    print_table({ "Effect", "Action", "Resource", "Policy", "Attribution", "Conditional" }, rows);
    if (!result.assumableRoles.empty()) {
        std::cout << "Assumable roles:" << std::endl;
        for (const auto& r : result.assumableRoles) {
            std::cout << "  " << r << std::endl;
        }
    }
    print_warnings(result.warnings);
}

std::string dot_escape(const std::string& in)
{
    std::string out;
    for (char c : in) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string dot_shape(const std::string& variant)
{
    if (variant == "User") {
        return "ellipse";
    } else if (variant == "Group") {
        return "box";
    } else if (variant == "Role") {
        return "diamond";
    } else if (variant == "Policy") {
        return "note";
    }
    return "plaintext";
}

std::string to_dot(const GraphExport& exp)
{
    std::stringstream ss;
    ss << "digraph iam {" << std::endl;
    for (const auto& n : exp.getNodes()) {
        ss << "  \"" << dot_escape(n.id) << "\" [label=\"" << dot_escape(n.label) << "\", shape=" << dot_shape(n.variant) << "];" << std::endl;
    }
    for (const auto& e : exp.getEdges()) {
        ss << "  \"" << dot_escape(e.source) << "\" -> \"" << dot_escape(e.target) << "\" [label=\"" << e.kind << "\"];" << std::endl;
    }
    ss << "}" << std::endl;
    return ss.str();
}

int run_build_graph(const Settings& settings, const std::string& output, std::shared_ptr<Logger> logger)
{
    if (settings.snapshotFile.empty() || output.empty()) {
        std::cerr << "build-graph requires --input and --output" << std::endl;
        return EXIT_USAGE;
    }
    auto graph = build_from_snapshot_file(settings.snapshotFile, logger);
    if (!graph) {
        return EXIT_LOAD;
    }
    if (!GraphCodec::saveFile(output, *graph)) {
        std::cerr << "Cannot write the graph to " << output << std::endl;
        return EXIT_LOAD;
    }
    std::cout << "Wrote graph with " << graph->allIdentities().size() << " identities and " << graph->getEdges().size()
              << " edges to " << output << std::endl;
    return EXIT_OK;
}

int run_query(const std::string& command, const std::vector<std::string>& args, const cxxopts::ParseResult& result,
              const Settings& settings, std::shared_ptr<Logger> logger)
{
    static const std::vector<std::string> commands = { "who-can-do", "what-can-do", "batch", "visualize", "stats" };
    if (std::find(commands.begin(), commands.end(), command) == commands.end()) {
        std::cerr << "Unknown command " << command << std::endl;
        return EXIT_USAGE;
    }

    auto graph = load_graph(settings, logger);
    if (!graph) {
        return EXIT_LOAD;
    }
    QueryEngine engine(*graph, logger);
    std::string resource = result["resource"].as<std::string>();

    if (command == "who-can-do") {
        if (args.size() != 1) {
            std::cerr << "who-can-do requires exactly one action pattern" << std::endl;
            return EXIT_USAGE;
        }
        WhoCanDoResult r;
        lib::error_code ec = engine.whoCanDo(args[0], resource, r);
        if (ec) {
            std::cerr << "who-can-do failed: " << ec.message() << std::endl;
            return EXIT_QUERY;
        }
        print_who_can_do(r, settings.format);
        return EXIT_OK;
    }

    if (command == "what-can-do") {
        if (args.size() != 1) {
            std::cerr << "what-can-do requires exactly one identity" << std::endl;
            return EXIT_USAGE;
        }
        WhatCanDoResult r;
        lib::error_code ec = engine.whatCanDo(args[0], r);
        if (ec) {
            std::cerr << "what-can-do failed: " << ec.message() << std::endl;
            return EXIT_QUERY;
        }
        print_what_can_do(r, settings.format);
        return EXIT_OK;
    }

    if (command == "batch") {
        if (args.empty()) {
            std::cerr << "batch requires at least one action pattern" << std::endl;
            return EXIT_USAGE;
        }
        BatchRunner runner(engine, result["workers"].as<size_t>());
        std::vector<BatchResult> results = runner.whoCanDo(args, resource);
        int status = EXIT_OK;
        if (settings.format == "json") {
            std::cout << QueryResultJson::batchToJson(results).dump(2) << std::endl;
        }
        for (const auto& r : results) {
            if (r.ec) {
                status = EXIT_QUERY;
            }
            if (settings.format == "json") {
                continue;
            }
            std::cout << "== " << r.actionPattern << std::endl;
            if (r.ec) {
                std::cout << "error: " << r.ec.message() << std::endl;
            } else {
                print_who_can_do(r.result, settings.format);
            }
        }
        return status;
    }

    if (command == "visualize") {
        std::string output = result.count("output") ? result["output"].as<std::string>() : "";
        GraphExport exp(*graph);
        if (result.count("filter")) {
            exp = exp.filter(result["filter"].as<std::vector<std::string> >());
        }
        if (result.count("no-policies")) {
            exp = exp.withoutPolicies();
        }
        std::string dot = to_dot(exp);
        if (output.empty()) {
            std::cout << dot;
            return EXIT_OK;
        }
        std::ofstream out(output);
        out << dot;
        if (!out.good()) {
            std::cerr << "Cannot write " << output << std::endl;
            return EXIT_LOAD;
        }
        std::cout << "Wrote " << exp.getNodes().size() << " nodes and " << exp.getEdges().size() << " edges to " << output << std::endl;
        return EXIT_OK;
    }

    if (command == "stats") {
        GraphStats stats = GraphExport(*graph).getStats();
        if (settings.format == "json") {
            nlohmann::json json;
            json["Nodes"] = stats.totalNodes;
            json["Edges"] = stats.totalEdges;
            json["Users"] = stats.users;
            json["Groups"] = stats.groups;
            json["Roles"] = stats.roles;
            json["Policies"] = stats.policies;
            std::cout << json.dump(2) << std::endl;
        } else {
            std::cout << "Nodes:    " << stats.totalNodes << std::endl;
            std::cout << "Edges:    " << stats.totalEdges << std::endl;
            std::cout << "Users:    " << stats.users << std::endl;
            std::cout << "Groups:   " << stats.groups << std::endl;
            std::cout << "Roles:    " << stats.roles << std::endl;
            std::cout << "Policies: " << stats.policies << std::endl;
        }
        return EXIT_OK;
    }

    std::cerr << "Unknown command " << command << std::endl;
    return EXIT_USAGE;
}

int main(int argc, char** argv)
{
    cxxopts::Options options("iam_explorer", "Explore who can do what in a cloud IAM account snapshot.");
    options.positional_help("<build-graph|who-can-do|what-can-do|batch|visualize|stats> [args]");

    options.add_options("General")
        ("h,help", "Show help")
        ("version", "Show version")
        ("c,config", "JSON config file with the keys GraphFile, SnapshotFile, LogLevel and Format", cxxopts::value<std::string>())
        ("log-level", "Log level to log (error|warn|info|trace)", cxxopts::value<std::string>())
        ("command", "Command", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string> >())
        ;

    options.add_options("Input")
        ("g,graph", "Serialized graph created with build-graph", cxxopts::value<std::string>())
        ("i,input", "Account snapshot JSON", cxxopts::value<std::string>())
        ;

    options.add_options("Query")
        ("r,resource", "Resource pattern for who-can-do and batch", cxxopts::value<std::string>()->default_value("*"))
        ("f,format", "Output format (table|json)", cxxopts::value<std::string>())
        ("workers", "Concurrent queries in batch", cxxopts::value<size_t>()->default_value("4"))
        ;

    options.add_options("Output")
        ("o,output", "Output file for build-graph and visualize", cxxopts::value<std::string>())
        ("filter", "Keep only the named nodes and their neighbours, may be repeated", cxxopts::value<std::vector<std::string> >())
        ("no-policies", "Leave policy nodes out of the visualization")
        ;

    options.parse_positional({ "command", "args" });

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help({ "General", "Input", "Query", "Output" }) << std::endl;
            return EXIT_OK;
        }

        if (result.count("version")) {
            std::cout << "iam_explorer: " << IAM_EXPLORER_VERSION << std::endl;
            return EXIT_OK;
        }

        Settings settings;
        settings.format = "table";
        settings.logLevel = "error";

        if (result.count("config")) {
            std::string configFile = result["config"].as<std::string>();
            ExplorerConfig config(configFile);
            if (!config.load() || !config.isValid()) {
                print_invalid_config_help(configFile);
                return EXIT_USAGE;
            }
            settings.graphFile = config.getGraphFile();
            settings.snapshotFile = config.getSnapshotFile();
            if (!config.getLogLevel().empty()) {
                settings.logLevel = config.getLogLevel();
            }
            if (!config.getFormat().empty()) {
                settings.format = config.getFormat();
            }
        }

        if (result.count("graph")) {
            settings.graphFile = result["graph"].as<std::string>();
            settings.snapshotFile = "";
        }
        if (result.count("input")) {
            settings.snapshotFile = result["input"].as<std::string>();
            if (!result.count("graph")) {
                settings.graphFile = "";
            }
        }
        if (result.count("log-level")) {
            settings.logLevel = result["log-level"].as<std::string>();
        }
        if (result.count("format")) {
            settings.format = result["format"].as<std::string>();
        }
        if (settings.format != "table" && settings.format != "json") {
            std::cerr << "Invalid format " << settings.format << ", use table or json" << std::endl;
            return EXIT_USAGE;
        }

        if (!result.count("command")) {
            std::cout << options.help({ "General", "Input", "Query", "Output" }) << std::endl;
            return EXIT_USAGE;
        }

        std::shared_ptr<Logger> logger = Logger::create(settings.logLevel);
        std::string command = result["command"].as<std::string>();
        std::vector<std::string> args;
        if (result.count("args")) {
            args = result["args"].as<std::vector<std::string> >();
        }

        if (command == "build-graph") {
            std::string output = result.count("output") ? result["output"].as<std::string>() : "";
            return run_build_graph(settings, output, logger);
        }
        return run_query(command, args, result, settings, logger);
    } catch (const cxxopts::OptionException& e) {
        std::cout << "Error parsing options: " << e.what() << std::endl;
        std::cout << options.help({ "General", "Input", "Query", "Output" }) << std::endl;
        return EXIT_USAGE;
    } catch (const std::domain_error& e) {
        std::cout << "Error parsing options: " << e.what() << std::endl;
        std::cout << options.help({ "General", "Input", "Query", "Output" }) << std::endl;
        return EXIT_USAGE;
    }
}
