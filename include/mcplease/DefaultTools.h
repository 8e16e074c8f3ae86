//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DefaultTools.h
// Purpose: The built-in code-assistance tools (completion, explanation, debugging)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcplease/GenerationProvider.h"
#include "mcplease/ToolRegistry.h"

namespace mcplease {

//==========================================================================================================
// CodeAssistTool
// Purpose: Shared plumbing for tools that build a prompt, ask the generation provider and fall back to a
//          deterministic template when the provider is unavailable or fails. Provider errors are logged,
//          never returned to the caller.
//==========================================================================================================
class CodeAssistTool : public IToolExecutor {
public:
    explicit CodeAssistTool(std::shared_ptr<IGenerationProvider> provider);

    ToolOutcome Execute(const JSONValue& arguments) override;

    virtual Tool Descriptor() const = 0;

protected:
    struct Input {
        std::string code;
        std::string language;
        const JSONValue* args{nullptr};

        std::string Arg(const std::string& key, const std::string& def = {}) const;
    };

    virtual GenerationRequest BuildRequest(const Input& in) const = 0;
    virtual std::string Fallback(const Input& in) const = 0;
    virtual std::string PostProcess(const std::string& generated) const { return generated; }

private:
    std::shared_ptr<IGenerationProvider> provider;
};

// First maxChars UTF-8 characters of text; never splits a multi-byte sequence. Invalid bytes count as one
// character each.
std::string Utf8Prefix(const std::string& text, std::size_t maxChars);

class CodeCompletionTool : public CodeAssistTool {
public:
    using CodeAssistTool::CodeAssistTool;
    Tool Descriptor() const override;

    // Removes a surrounding ``` fence from generated code.
    static std::string StripCodeFence(const std::string& text);

protected:
    GenerationRequest BuildRequest(const Input& in) const override;
    std::string Fallback(const Input& in) const override;
    std::string PostProcess(const std::string& generated) const override;
};

class CodeExplanationTool : public CodeAssistTool {
public:
    using CodeAssistTool::CodeAssistTool;
    Tool Descriptor() const override;

protected:
    GenerationRequest BuildRequest(const Input& in) const override;
    std::string Fallback(const Input& in) const override;
};

class DebugAssistanceTool : public CodeAssistTool {
public:
    using CodeAssistTool::CodeAssistTool;
    Tool Descriptor() const override;

protected:
    GenerationRequest BuildRequest(const Input& in) const override;
    std::string Fallback(const Input& in) const override;
};

// Registers code_completion, code_explanation and debug_assistance.
void RegisterDefaultTools(ToolRegistry& registry, std::shared_ptr<IGenerationProvider> provider);

} // namespace mcplease
