//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DefaultTools.cpp
// Purpose: Prompt construction, fallback templates and schemas for the built-in tools
//==========================================================================================================

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "mcplease/DefaultTools.h"

namespace mcplease {

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) { return std::make_shared<JSONValue>(s); }

std::shared_ptr<JSONValue> stringProp(const std::string& description) {
    JSONValue::Object p;
    p["type"] = str("string");
    p["description"] = str(description);
    return std::make_shared<JSONValue>(std::move(p));
}

std::shared_ptr<JSONValue> enumProp(const std::string& description, std::initializer_list<const char*> values,
                                    const char* def = nullptr) {
    JSONValue::Object p;
    p["type"] = str("string");
    p["description"] = str(description);
    JSONValue::Array e;
    for (const char* v : values) e.push_back(str(v));
    p["enum"] = std::make_shared<JSONValue>(std::move(e));
    if (def) p["default"] = str(def);
    return std::make_shared<JSONValue>(std::move(p));
}

std::shared_ptr<JSONValue> intProp(const std::string& description, int64_t minimum,
                                   std::optional<int64_t> maximum = std::nullopt,
                                   std::optional<int64_t> def = std::nullopt) {
    JSONValue::Object p;
    p["type"] = str("integer");
    p["description"] = str(description);
    p["minimum"] = std::make_shared<JSONValue>(minimum);
    if (maximum) p["maximum"] = std::make_shared<JSONValue>(*maximum);
    if (def) p["default"] = std::make_shared<JSONValue>(*def);
    return std::make_shared<JSONValue>(std::move(p));
}

JSONValue objectSchema(JSONValue::Object properties, std::initializer_list<const char*> required) {
    JSONValue::Object s;
    s["type"] = str("object");
    s["properties"] = std::make_shared<JSONValue>(std::move(properties));
    JSONValue::Array req;
    for (const char* r : required) req.push_back(str(r));
    s["required"] = std::make_shared<JSONValue>(std::move(req));
    return JSONValue{s};
}

std::string fenced(const std::string& language, const std::string& code) {
    return "```" + language + "\n" + code + "\n```";
}

} // namespace

/////////////////////////////////////////// CodeAssistTool ///////////////////////////////////////////

CodeAssistTool::CodeAssistTool(std::shared_ptr<IGenerationProvider> provider)
    : provider(provider ? std::move(provider) : std::make_shared<NullGenerationProvider>()) {}

std::string CodeAssistTool::Input::Arg(const std::string& key, const std::string& def) const {
    if (!args) return def;
    auto v = GetStringMember(*args, key);
    return (v.has_value() && !v->empty()) ? *v : def;
}

ToolOutcome CodeAssistTool::Execute(const JSONValue& arguments) {
    const std::string toolName = Descriptor().name;
    Input in;
    in.args = &arguments;
    auto code = GetStringMember(arguments, "code");
    auto language = GetStringMember(arguments, "language");
    if (!code.has_value()) {
        return ToolOutcome::Failed("missing required argument 'code'");
    }
    if (!language.has_value() || language->empty()) {
        return ToolOutcome::Failed("missing required argument 'language'");
    }
    in.code = std::move(*code);
    in.language = std::move(*language);
    LOG_INFO("{} requested for {} code", toolName, in.language);

    if (!provider->IsAvailable()) {
        LOG_DEBUG("{}: generation backend unavailable, using fallback", toolName);
        return ToolOutcome::FromText(Fallback(in));
    }
    GenerationResult gen = provider->Generate(BuildRequest(in));
    if (!gen.ok) {
        LOG_WARN("{}: generation failed ({}), using fallback", toolName, gen.error);
        return ToolOutcome::FromText(Fallback(in));
    }
    std::string text = PostProcess(gen.text);
    if (text.empty()) {
        LOG_WARN("{}: generation returned empty text, using fallback", toolName);
        return ToolOutcome::FromText(Fallback(in));
    }
    return ToolOutcome::FromText(std::move(text));
}

/////////////////////////////////////////// code_completion ///////////////////////////////////////////

Tool CodeCompletionTool::Descriptor() const {
    JSONValue::Object props;
    props["code"] = stringProp("Current code context around cursor position");
    props["language"] = stringProp("Programming language (e.g., python, javascript, java)");
    props["cursor_position"] = intProp("Cursor position in the code (optional)", 0);
    props["max_completions"] = intProp("Maximum number of completion suggestions", 1, 10, 3);
    return Tool{"code_completion", "Provides intelligent code completion suggestions based on context",
                objectSchema(std::move(props), {"code", "language"})};
}

GenerationRequest CodeCompletionTool::BuildRequest(const Input& in) const {
    std::string code = in.code;
    if (auto cursor = GetIntMember(*in.args, "cursor_position")) {
        if (*cursor >= 0) {
            code = Utf8Prefix(code, static_cast<std::size_t>(*cursor));
        }
    }
    std::ostringstream p;
    p << "You are an expert " << in.language
      << " programmer. Complete the following code with proper syntax and best practices.\n\n"
      << "Code to complete:\n" << fenced(in.language, code) << "\n\n"
      << "Complete the code naturally and concisely:";
    GenerationRequest req;
    req.prompt = p.str();
    req.maxTokens = 150;
    req.temperature = 0.3;
    return req;
}

std::string CodeCompletionTool::Fallback(const Input& in) const {
    return "# AI model not available - completion for " + in.language + " code\n# Original: " +
           Utf8Prefix(in.code, 50) + "...";
}

std::string Utf8Prefix(const std::string& text, std::size_t maxChars) {
    std::size_t i = 0;
    std::size_t chars = 0;
    while (i < text.size() && chars < maxChars) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        // A sequence cut off by the end of the input is not copied.
        if (i + len > text.size()) break;
        i += len;
        ++chars;
    }
    return text.substr(0, i);
}

std::string CodeCompletionTool::StripCodeFence(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string cleaned = text.substr(first, last - first + 1);
    if (cleaned.rfind("```", 0) != 0) return cleaned;

    std::vector<std::string> lines;
    std::istringstream is(cleaned);
    for (std::string line; std::getline(is, line);) lines.push_back(line);
    if (lines.size() <= 2) return cleaned;
    std::string out;
    for (std::size_t i = 1; i + 1 < lines.size(); ++i) {
        if (!out.empty()) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string CodeCompletionTool::PostProcess(const std::string& generated) const {
    return StripCodeFence(generated);
}

/////////////////////////////////////////// code_explanation ///////////////////////////////////////////

Tool CodeExplanationTool::Descriptor() const {
    JSONValue::Object props;
    props["code"] = stringProp("Code to explain and analyze");
    props["language"] = stringProp("Programming language of the code");
    props["detail_level"] = enumProp("Level of detail for the explanation", {"brief", "detailed", "comprehensive"}, "detailed");
    props["focus"] = enumProp("Specific aspect to focus on (optional)",
                              {"functionality", "performance", "security", "best_practices"});
    return Tool{"code_explanation", "Explains code functionality, purpose, and provides technical analysis",
                objectSchema(std::move(props), {"code", "language"})};
}

GenerationRequest CodeExplanationTool::BuildRequest(const Input& in) const {
    const std::string detail = in.Arg("detail_level", "detailed");
    const std::string focus = in.Arg("focus");
    std::ostringstream p;
    if (!focus.empty()) {
        p << "You are an expert " << in.language << " programmer. Explain this code and answer the specific question.\n\n"
          << "Code:\n" << fenced(in.language, in.code) << "\n\n"
          << "Question: Focus on " << focus << "\n\n"
          << "Provide a " << detail << " technical explanation:";
    } else {
        p << "You are an expert " << in.language << " programmer. Explain what this code does.\n\n"
          << "Code:\n" << fenced(in.language, in.code) << "\n\n"
          << "Provide a " << detail << " technical explanation covering:\n"
          << "- What the code does\n- How it works\n- Key concepts used\n- Any notable patterns or techniques";
    }
    GenerationRequest req;
    req.prompt = p.str();
    req.maxTokens = 300;
    req.temperature = 0.5;
    return req;
}

std::string CodeExplanationTool::Fallback(const Input& in) const {
    const std::string detail = in.Arg("detail_level", "detailed");
    const std::string focus = in.Arg("focus");
    std::string out = "# Code Explanation (" + detail + ")\n\n";
    out += "This " + in.language + " code:\n" + fenced(in.language, in.code) + "\n\n";
    out += "AI model not available for detailed explanation.";
    if (!focus.empty()) {
        out += "\n\nRegarding your question: Focus on " + focus + "\n";
        out += "AI model not available to answer specific questions.";
    }
    return out;
}

/////////////////////////////////////////// debug_assistance ///////////////////////////////////////////

Tool DebugAssistanceTool::Descriptor() const {
    JSONValue::Object props;
    props["code"] = stringProp("Code that has issues or needs debugging");
    props["error_message"] = stringProp("Error message or stack trace (if available)");
    props["language"] = stringProp("Programming language of the code");
    props["expected_behavior"] = stringProp("What the code should do (optional)");
    props["actual_behavior"] = stringProp("What the code actually does (optional)");
    return Tool{"debug_assistance", "Provides debugging help, error analysis, and troubleshooting suggestions",
                objectSchema(std::move(props), {"code", "language"})};
}

GenerationRequest DebugAssistanceTool::BuildRequest(const Input& in) const {
    std::ostringstream p;
    p << "You are an expert " << in.language
      << " programmer and debugger. Analyze this code and provide debugging assistance.\n\n"
      << "Code:\n" << fenced(in.language, in.code) << "\n";
    if (auto v = in.Arg("error_message"); !v.empty()) p << "\nError message: " << v;
    if (auto v = in.Arg("expected_behavior"); !v.empty()) p << "\nExpected behavior: " << v;
    if (auto v = in.Arg("actual_behavior"); !v.empty()) p << "\nActual behavior: " << v;
    p << "\n\nPlease provide:\n"
      << "1. Analysis of the issue\n"
      << "2. Explanation of what's causing the problem\n"
      << "3. Specific suggestions to fix it\n"
      << "4. Best practices to prevent similar issues";
    GenerationRequest req;
    req.prompt = p.str();
    req.maxTokens = 400;
    req.temperature = 0.4;
    return req;
}

std::string DebugAssistanceTool::Fallback(const Input& in) const {
    std::string out = "# Debug Analysis for " + in.language + "\n\n";
    out += "**Code:**\n" + fenced(in.language, in.code) + "\n\n";
    if (auto v = in.Arg("error_message"); !v.empty()) out += "**Error:** " + v + "\n\n";
    if (auto v = in.Arg("expected_behavior"); !v.empty()) out += "**Expected:** " + v + "\n\n";
    if (auto v = in.Arg("actual_behavior"); !v.empty()) out += "**Actual:** " + v + "\n\n";
    out += "AI model not available for detailed debugging analysis.";
    return out;
}

void RegisterDefaultTools(ToolRegistry& registry, std::shared_ptr<IGenerationProvider> provider) {
    std::shared_ptr<CodeAssistTool> tools[] = {
        std::make_shared<CodeCompletionTool>(provider),
        std::make_shared<CodeExplanationTool>(provider),
        std::make_shared<DebugAssistanceTool>(provider),
    };
    for (auto& t : tools) {
        registry.Register(t->Descriptor(), t);
    }
    LOG_INFO("Registered {} default tools", registry.Count());
}

} // namespace mcplease
