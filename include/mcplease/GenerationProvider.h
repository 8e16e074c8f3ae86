//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GenerationProvider.h
// Purpose: Narrow interface to the external text-generation backend used by the code-assistance tools
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

namespace mcplease {

struct GenerationRequest {
    std::string prompt;
    int maxTokens{150};
    double temperature{0.3};
};

//==========================================================================================================
// GenerationResult
// Purpose: Explicit result instead of exceptions. ok=false means "use the fallback"; error says why.
//==========================================================================================================
struct GenerationResult {
    bool ok{false};
    std::string text;
    std::string error;

    static GenerationResult Success(std::string text) { return GenerationResult{true, std::move(text), {}}; }
    static GenerationResult Failure(std::string error) { return GenerationResult{false, {}, std::move(error)}; }
};

class IGenerationProvider {
public:
    virtual ~IGenerationProvider() = default;

    // Must be callable from several threads at once.
    virtual GenerationResult Generate(const GenerationRequest& request) = 0;
    virtual bool IsAvailable() const = 0;
    virtual std::string Name() const = 0;
};

// Always unavailable; every tool answers with its deterministic fallback.
class NullGenerationProvider : public IGenerationProvider {
public:
    GenerationResult Generate(const GenerationRequest& request) override;
    bool IsAvailable() const override { return false; }
    std::string Name() const override { return "none"; }
};

//==========================================================================================================
// HttpGenerationProvider
// Purpose: Blocking client for a llama.cpp-style completion server.
//          POST <url> {"prompt","n_predict","temperature","stream":false}; the reply's "content" is the text.
// Notes:
//   url: "http://host:port[/path]" or "https://..." (TLS 1.3, peer verified). Path defaults to /completion.
//==========================================================================================================
class HttpGenerationProvider : public IGenerationProvider {
public:
    struct Options {
        std::string url;
        std::string caFile;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
    };

    explicit HttpGenerationProvider(const Options& opts);
    ~HttpGenerationProvider() override;

    GenerationResult Generate(const GenerationRequest& request) override;
    bool IsAvailable() const override;
    std::string Name() const override { return "http"; }

    // Body sent for a request (exposed for tests).
    static std::string BuildRequestBody(const GenerationRequest& request);
    // Extracts "content" from a completion reply.
    static GenerationResult ParseResponseBody(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// TimeoutGenerationProvider
// Purpose: Bounds any provider by a deadline. On timeout the call returns ok=false immediately; the inner
//          call keeps running on its own thread and its result is discarded.
//==========================================================================================================
class TimeoutGenerationProvider : public IGenerationProvider {
public:
    TimeoutGenerationProvider(std::shared_ptr<IGenerationProvider> inner, unsigned int timeoutMs);

    GenerationResult Generate(const GenerationRequest& request) override;
    bool IsAvailable() const override;
    std::string Name() const override;

private:
    std::shared_ptr<IGenerationProvider> inner;
    unsigned int timeoutMs;
};

// Provider selected from configuration: empty url -> NullGenerationProvider, otherwise HTTP wrapped in a timeout.
std::shared_ptr<IGenerationProvider> MakeGenerationProvider(const std::string& url, unsigned int timeoutMs);

} // namespace mcplease
