#pragma once
#include <string>
#include <memory>
#include <vector>

namespace mnemon {

class MemoryStore;
struct Config;

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Base class for tools that operate on the record store.
// The caller wires the store (and optionally the config) after construction.
class MemoryAwareTool : public Tool {
public:
    void set_store(MemoryStore* store) { store_ = store; }
    void set_config(const Config* config) { config_ = config; }

protected:
    MemoryStore* store_ = nullptr;
    const Config* config_ = nullptr;
};

// Instantiate every registered tool and wire store/config into the memory tools.
std::vector<std::unique_ptr<Tool>> create_memory_tools(MemoryStore* store,
                                                       const Config* config);

// Instantiate one registered tool by name, wired like create_memory_tools.
// nullptr if no tool of that name is registered.
std::unique_ptr<Tool> create_memory_tool(const std::string& name, MemoryStore* store,
                                         const Config* config);

} // namespace mnemon
