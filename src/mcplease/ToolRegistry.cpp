//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool catalog, execution and result normalisation
//==========================================================================================================

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcplease/ToolRegistry.h"

namespace mcplease {

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object to;
    to["name"] = std::make_shared<JSONValue>(tool.name);
    to["description"] = std::make_shared<JSONValue>(tool.description);
    if (tool.inputSchema.IsNull()) {
        JSONValue::Object emptySchema;
        emptySchema["type"] = std::make_shared<JSONValue>(std::string("object"));
        emptySchema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
        to["inputSchema"] = std::make_shared<JSONValue>(std::move(emptySchema));
    } else {
        to["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    }
    return JSONValue{to};
}

ToolOutcome ToolOutcome::FromText(std::string text) {
    ToolOutcome o;
    o.kind = Kind::Text;
    o.text = std::move(text);
    return o;
}

ToolOutcome ToolOutcome::FromValue(JSONValue value) {
    ToolOutcome o;
    o.kind = Kind::Structured;
    o.value = std::move(value);
    return o;
}

ToolOutcome ToolOutcome::Failed(std::string reason) {
    ToolOutcome o;
    o.kind = Kind::Failure;
    o.text = std::move(reason);
    return o;
}

void ToolRegistry::Register(const Tool& tool, std::shared_ptr<IToolExecutor> executor) {
    if (!executor) {
        throw std::invalid_argument("ToolRegistry: executor for '" + tool.name + "' is null");
    }
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = tools.find(tool.name);
    if (it != tools.end()) {
        LOG_INFO("Replacing tool: {}", tool.name);
        it->second = Entry{tool, std::move(executor)};
    } else {
        LOG_DEBUG("Registering tool: {}", tool.name);
        tools.emplace(tool.name, Entry{tool, std::move(executor)});
    }
}

void ToolRegistry::Register(const Tool& tool, FunctionToolExecutor::Function fn) {
    Register(tool, std::make_shared<FunctionToolExecutor>(std::move(fn)));
}

bool ToolRegistry::Remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    if (tools.erase(name) == 0) {
        return false;
    }
    LOG_DEBUG("Removed tool: {}", name);
    return true;
}

std::optional<Tool> ToolRegistry::Get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = tools.find(name);
    if (it == tools.end()) return std::nullopt;
    return it->second.tool;
}

bool ToolRegistry::Has(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return tools.find(name) != tools.end();
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        out.reserve(tools.size());
        for (const auto& kv : tools) out.push_back(kv.second.tool);
    }
    std::sort(out.begin(), out.end(), [](const Tool& a, const Tool& b) { return a.name < b.name; });
    return out;
}

std::vector<std::string> ToolRegistry::Names() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        out.reserve(tools.size());
        for (const auto& kv : tools) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t ToolRegistry::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return tools.size();
}

void ToolRegistry::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    tools.clear();
}

JSONValue ToolRegistry::Stats() const {
    JSONValue::Array names;
    for (const auto& n : Names()) names.push_back(std::make_shared<JSONValue>(n));
    JSONValue::Object o;
    o["total_tools"] = std::make_shared<JSONValue>(static_cast<int64_t>(names.size()));
    o["tool_names"] = std::make_shared<JSONValue>(std::move(names));
    return JSONValue{o};
}

JSONValue ToolRegistry::NormalizeOutcome(const ToolOutcome& outcome) {
    if (outcome.kind == ToolOutcome::Kind::Structured && outcome.value.IsObject()) {
        const JSONValue* content = FindMember(outcome.value, "content");
        if (content && content->IsArray()) {
            return outcome.value;
        }
    }
    std::string text;
    if (outcome.kind == ToolOutcome::Kind::Structured) {
        text = outcome.value.IsString() ? std::get<std::string>(outcome.value.value)
                                        : SerializeJSONValue(outcome.value);
    } else {
        text = outcome.text;
    }
    JSONValue::Object block;
    block["type"] = std::make_shared<JSONValue>(std::string("text"));
    block["text"] = std::make_shared<JSONValue>(std::move(text));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(block)));
    JSONValue::Object result;
    result["content"] = std::make_shared<JSONValue>(std::move(content));
    return JSONValue{result};
}

ToolCallResult ToolRegistry::Execute(const std::string& name, const JSONValue& arguments) const {
    ToolCallResult out;
    std::shared_ptr<IToolExecutor> executor;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = tools.find(name);
        if (it != tools.end()) executor = it->second.executor;
    }
    if (!executor) {
        JSONValue::Array available;
        for (const auto& n : Names()) available.push_back(std::make_shared<JSONValue>(n));
        JSONValue::Object data;
        data["available_tools"] = std::make_shared<JSONValue>(std::move(available));
        out.error = errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Tool '" + name + "' not found",
                                      JSONValue{data});
        return out;
    }

    ToolOutcome outcome;
    try {
        outcome = executor->Execute(arguments);
    } catch (const std::exception& e) {
        LOG_ERROR("Tool {} threw: {}", name, e.what());
        outcome = ToolOutcome::Failed(e.what());
    }
    if (outcome.IsFailure()) {
        LOG_WARN("Tool {} failed: {}", name, outcome.text);
        out.error = errors::makeError(JSONRPCErrorCodes::ToolExecutionError,
                                      "Tool execution failed: " + outcome.text);
        return out;
    }
    out.result = NormalizeOutcome(outcome);
    return out;
}

} // namespace mcplease
