//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Tool catalog and invocation contract (lookup under a shared lock, execution outside of it)
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Protocol.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {

//==========================================================================================================
// ToolOutcome
// Purpose: What an executor produced.
//   Text: plain text, becomes a single text content block.
//   Structured: a JSON value; {content:[...]} objects pass through, anything else is rendered as text.
//   Failure: the executor could not produce a result; reason is reported as ToolExecutionError.
//==========================================================================================================
struct ToolOutcome {
    enum class Kind { Text, Structured, Failure };

    Kind kind{Kind::Text};
    std::string text;
    JSONValue value;

    static ToolOutcome FromText(std::string text);
    static ToolOutcome FromValue(JSONValue value);
    static ToolOutcome Failed(std::string reason);

    bool IsFailure() const { return kind == Kind::Failure; }
};

//==========================================================================================================
// IToolExecutor
// Purpose: Uniform executor interface. Implementations must be safe to call concurrently.
//==========================================================================================================
class IToolExecutor {
public:
    virtual ~IToolExecutor() = default;
    virtual ToolOutcome Execute(const JSONValue& arguments) = 0;
};

// Adapts a callable into an IToolExecutor.
class FunctionToolExecutor : public IToolExecutor {
public:
    using Function = std::function<ToolOutcome(const JSONValue&)>;
    explicit FunctionToolExecutor(Function fn) : fn(std::move(fn)) {}
    ToolOutcome Execute(const JSONValue& arguments) override { return fn(arguments); }
private:
    Function fn;
};

//==========================================================================================================
// ToolCallResult
// Purpose: Either the normalised result object {content:[...]} or a typed error, never both.
//==========================================================================================================
struct ToolCallResult {
    std::optional<JSONValue> result;
    std::optional<errors::McpError> error;

    bool Ok() const { return result.has_value(); }
};

//==========================================================================================================
// ToolRegistry
// Purpose: Thread-safe catalog of tools keyed by name.
// Notes:
//   Register replaces an existing tool of the same name.
//   Execute resolves the executor under a shared lock and runs it after releasing the lock, so a slow
//   tool never blocks Register/Remove or other calls.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void Register(const Tool& tool, std::shared_ptr<IToolExecutor> executor);
    void Register(const Tool& tool, FunctionToolExecutor::Function fn);
    bool Remove(const std::string& name);
    std::optional<Tool> Get(const std::string& name) const;
    bool Has(const std::string& name) const;

    // Tools sorted by name.
    std::vector<Tool> List() const;
    std::vector<std::string> Names() const;
    std::size_t Count() const;
    void Clear();

    // { total_tools, tool_names }
    JSONValue Stats() const;

    //==========================================================================================================
    // Execute
    // Returns:
    //   MethodNotFound (data.available_tools) when the tool is unknown.
    //   ToolExecutionError "Tool execution failed: <reason>" when the executor fails or throws.
    //   Otherwise the normalised result object.
    //==========================================================================================================
    ToolCallResult Execute(const std::string& name, const JSONValue& arguments) const;

    // Normalises an outcome into {content:[...]}.
    static JSONValue NormalizeOutcome(const ToolOutcome& outcome);

private:
    struct Entry {
        Tool tool;
        std::shared_ptr<IToolExecutor> executor;
    };

    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, Entry> tools;
};

} // namespace mcplease
