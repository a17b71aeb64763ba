#include "config.hpp"
#include "memory.hpp"
#include "tool.hpp"
#include "util.hpp"
#include "memory/sqlite_store.hpp"
#include "memory/consolidation.hpp"
#include "memory/extraction.hpp"
#include "memory/surface.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

static void print_usage() {
    std::cout << "Usage: mnemon [--db PATH] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  tool NAME [JSON]     Run a memory tool with JSON arguments (default: {})\n"
              << "  tools                List available tools and their parameter schemas\n"
              << "  consolidate          Run one maintenance sweep (decay, retire, dedup)\n"
              << "  surface              Regenerate the session-start memory summary\n"
              << "      --cwd DIR        Working directory (default: current directory)\n"
              << "      --output PATH    Output file (default: DIR/.claude/rules/mnemon-memories.md)\n"
              << "      --hook           Read {\"cwd\": ...} hook JSON from stdin\n"
              << "  extract              Store extractor output (a JSON array) read from stdin\n"
              << "      --input FILE     Read candidates from FILE instead\n"
              << "      --cwd DIR        Working directory used for project detection\n"
              << "      --session ID     Session id recorded on each memory\n"
              << "  export [FILE]        Write a JSON snapshot of every memory (default: stdout)\n"
              << "\n"
              << "Options:\n"
              << "  --db PATH            Database path (overrides config and MNEMON_DB_PATH)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  MNEMON_DB_PATH       Database path\n"
              << "  SESSION_ID           Session id recorded on new memories\n";
}

static std::string read_stream(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::string current_dir() {
    std::error_code ec;
    auto p = std::filesystem::current_path(ec);
    return ec ? std::string() : p.string();
}

static int run_tool(const mnemon::Config& config, const std::string& name,
                    const std::string& args_json) {
    mnemon::SqliteStore store(config.db_path());
    auto tool = mnemon::create_memory_tool(name, &store, &config);
    if (!tool) {
        std::cerr << "Unknown tool: " << name << "\n";
        return 1;
    }

    mnemon::ToolResult result = tool->execute(args_json);
    (result.success ? std::cout : std::cerr) << result.output << "\n";
    return result.success ? 0 : 1;
}

static int list_tools() {
    auto tools = mnemon::create_memory_tools(nullptr, nullptr);
    for (const auto& tool : tools) {
        auto spec = tool->spec();
        std::cout << spec.name << "  " << spec.description << "\n"
                  << "    " << spec.parameters_json << "\n";
    }
    return 0;
}

static int run_surface(const mnemon::Config& config, int argc, char* argv[], int i) {
    std::string cwd;
    std::string output;
    bool hook = false;

    for (; i < argc; i++) {
        if (std::strcmp(argv[i], "--cwd") == 0 && i + 1 < argc) {
            cwd = argv[++i];
        } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--hook") == 0) {
            hook = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (hook) {
        try {
            auto j = nlohmann::json::parse(read_stream(std::cin));
            if (cwd.empty() && j.contains("cwd") && j["cwd"].is_string()) {
                cwd = j["cwd"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[surface] Ignoring malformed hook input: " << e.what() << "\n";
        }
    }
    if (cwd.empty()) cwd = current_dir();
    if (output.empty()) output = mnemon::surface_output_path(cwd);

    // A skipped summary is not an error for the session hook
    mnemon::write_surface(config, cwd, output);
    return 0;
}

static int run_extract(const mnemon::Config& config, int argc, char* argv[], int i) {
    std::string input;
    std::string cwd;
    std::string session_id = config.session_id;

    for (; i < argc; i++) {
        if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input = argv[++i];
        } else if (std::strcmp(argv[i], "--cwd") == 0 && i + 1 < argc) {
            cwd = argv[++i];
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_id = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    std::string raw;
    if (input.empty()) {
        raw = read_stream(std::cin);
    } else {
        std::ifstream file(input);
        if (!file) {
            std::cerr << "[extract] Cannot read " << input << "\n";
            return 0;
        }
        raw = read_stream(file);
    }
    if (cwd.empty()) cwd = current_dir();

    try {
        mnemon::SqliteStore store(config.db_path());
        uint32_t stored = mnemon::ingest_candidates(store, raw, mnemon::detect_project(cwd),
                                                    session_id, config.extraction);
        std::cerr << "[extract] Stored " << stored << " memories\n";
    } catch (const mnemon::StoreError& e) {
        std::cerr << "[extract] Store unavailable, skipping: " << e.what() << "\n";
    }
    return 0;
}

static int run_export(const mnemon::Config& config, const std::string& path) {
    mnemon::SqliteStore store(config.db_path());
    std::string snapshot = mnemon::snapshot_export(store);
    if (path.empty()) {
        std::cout << snapshot << "\n";
        return 0;
    }
    if (!mnemon::atomic_write_file(path, snapshot + "\n")) {
        std::cerr << "Error: failed to write " << path << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string db_override;
    int i = 1;

    // Global options precede the command
    for (; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_override = argv[++i];
        } else {
            break;
        }
    }

    if (i >= argc) {
        print_usage();
        return 1;
    }

    std::string command = argv[i++];
    auto config = mnemon::Config::load();
    if (!db_override.empty()) {
        config.memory.path = db_override;
    }

    if (command == "tool") {
        if (i >= argc) {
            std::cerr << "Usage: mnemon tool NAME [JSON]\n";
            return 1;
        }
        std::string name = argv[i++];
        std::string args_json = i < argc ? argv[i] : "{}";
        return run_tool(config, name, args_json);
    }
    if (command == "tools") {
        return list_tools();
    }
    if (command == "consolidate") {
        mnemon::run_maintenance(config);
        return 0;
    }
    if (command == "surface") {
        return run_surface(config, argc, argv, i);
    }
    if (command == "extract") {
        return run_extract(config, argc, argv, i);
    }
    if (command == "export") {
        return run_export(config, i < argc ? argv[i] : "");
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
