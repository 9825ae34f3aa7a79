#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "treedict/Combine.hpp"
#include "treedict/Errors.hpp"
#include "treedict/Loader.hpp"
#include "treedict/Path.hpp"
#include "treedict/Tree.hpp"
#include "treedict/Util.hpp"

using namespace treedict;

namespace {

struct Command {
    std::vector<std::string> args;  // args[0] is the command name
    Depth depth;
    bool asymmetric = false;
    bool prune = false;
};

template <typename BasicJsonType>
int run(const Command& cmd) {
    const std::string& name = cmd.args[0];

    auto expect_args = [&](size_t want) {
        if (cmd.args.size() < want) {
            throw TreeDictError("insufficient arguments for command '" + name + "'");
        }
    };

    auto require_json_target = [&](const std::string& file) {
        if (get_file_extension(file) != ".json") {
            throw TreeDictError("'" + name + "' writes JSON files only: " + file);
        }
    };

    // MERGE
    if (name == "merge") {
        expect_args(2);
        std::vector<BasicJsonType> sources;
        for (size_t i = 1; i < cmd.args.size(); ++i) {
            sources.push_back(load_document<BasicJsonType>(cmd.args[i]));
        }
        std::cout << merge(sources, cmd.depth).dump(2) << "\n";
        return 0;
    }

    // DIFF
    if (name == "diff") {
        expect_args(3);
        auto lhs = load_document<BasicJsonType>(cmd.args[1]);
        auto rhs = load_document<BasicJsonType>(cmd.args[2]);
        auto result = diff(lhs, rhs, cmd.depth, !cmd.asymmetric);
        std::cout << result.dump(2) << "\n";
        return result.empty() ? 0 : 1;
    }

    // GET
    if (name == "get") {
        expect_args(3);
        auto doc = load_document<BasicJsonType>(cmd.args[1]);
        const auto& v = get(doc, split_path(cmd.args[2]));
        std::cout << v.dump(2) << "\n";
        return 0;
    }

    // HAS
    if (name == "has") {
        expect_args(3);
        auto doc = load_document<BasicJsonType>(cmd.args[1]);
        bool ok = has(doc, split_path(cmd.args[2]));
        std::cout << (ok ? "true" : "false") << "\n";
        return ok ? 0 : 1;
    }

    // SET (JSON files only)
    if (name == "set") {
        expect_args(4);
        const std::string& file = cmd.args[1];
        require_json_target(file);
        auto doc = load_document<BasicJsonType>(file);
        auto parsed = parse_value<BasicJsonType>(cmd.args[3]);
        set(doc, split_path(cmd.args[2]), parsed);
        write_json_file(file, doc);
        std::cout << "Set " << cmd.args[2] << " = " << parsed.dump() << " in " << file << "\n";
        return 0;
    }

    // POP (JSON files only)
    if (name == "pop") {
        expect_args(3);
        const std::string& file = cmd.args[1];
        require_json_target(file);
        auto doc = load_document<BasicJsonType>(file);
        const Path path = split_path(cmd.args[2]);
        auto removed = cmd.prune ? pop_path(doc, path) : pop(doc, path);
        write_json_file(file, doc);
        std::cout << removed.dump(2) << "\n";
        return 0;
    }

    // ITEMS
    if (name == "items") {
        expect_args(2);
        auto doc = load_document<BasicJsonType>(cmd.args[1]);
        for (const auto& item : items(doc, cmd.depth)) {
            std::cout << join_path(item.path) << " = " << item.value.dump() << "\n";
        }
        return 0;
    }

    std::cerr << "Unknown command: " << name << "\n";
    return 1;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("treedict", "Merge, diff and edit nested JSON/TOML documents by key path");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("d,depth", "Recursion depth limit (default: unbounded)", cxxopts::value<std::size_t>())
            ("ordered", "Preserve document key order")
            ("asymmetric", "diff: report left-hand values only")
            ("prune", "pop: also remove parents left empty")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: merge FILE... | diff FILE_A FILE_B | get FILE PATH | has FILE PATH"
                         " | set FILE PATH VALUE | pop FILE PATH | items FILE\n";
            return 0;
        }

        Command cmd;
        cmd.args = result["command"].as<std::vector<std::string>>();
        if (cmd.args.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        if (result.count("depth")) cmd.depth = result["depth"].as<std::size_t>();
        cmd.asymmetric = result.count("asymmetric") > 0;
        cmd.prune = result.count("prune") > 0;

        if (result.count("ordered")) {
            return run<OrderedValue>(cmd);
        }
        return run<Value>(cmd);

    } catch (const KeyError& ke) {
        std::cerr << "Key not found: " << ke.segment() << " (in " << ke.path() << ")\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
