//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include "mcplease/Transport.h"
#include <memory>
#include <cstdint>

namespace mcplease {

//==========================================================================================================
// StdioTransport
// Purpose: Single-client transport for local IDE integrations. One JSON document per line in each
//          direction. Requests are handled concurrently; responses go through one serialized writer.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   inFd/outFd: Descriptors to read requests from and write responses to.
    //   maxLineBytes: Lines longer than this are discarded.
    //   writeQueueMaxBytes: Backpressure cap for queued outbound bytes; overflow stops the transport.
    //   idleReadTimeoutMs: When > 0, stop after this long without input.
    //   writeTimeoutMs: When > 0, stop when a single write stalls this long.
    //==========================================================================================================
    struct Options {
        int inFd{0};
        int outFd{1};
        std::size_t maxLineBytes{4 * 1024 * 1024};
        std::size_t writeQueueMaxBytes{2 * 1024 * 1024};
        uint64_t idleReadTimeoutMs{0};
        uint64_t writeTimeoutMs{0};
    };

    StdioTransport();
    explicit StdioTransport(const Options& opts);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader and writer threads.
    // Returns:
    //   Future that completes when loops are running.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops reading, waits for in-flight requests to finish, flushes queued output and joins threads.
    // Returns:
    //   Future that completes when stopped.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsRunning() const override;
    std::string Name() const override;
    std::size_t ConnectedClients() const override;
    std::size_t SendMessage(const std::string& json) override;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // WaitUntilStopped
    // Purpose: Blocks until the reader loop exits (EOF, error, idle timeout or Stop()).
    //==========================================================================================================
    void WaitUntilStopped();

    void SetIdleReadTimeoutMs(uint64_t timeoutMs);
    void SetWriteQueueMaxBytes(std::size_t maxBytes);
    void SetWriteTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates a StdioTransport from "key=value" settings separated by ';' or whitespace:
//   idle_read_timeout_ms, write_timeout_ms, write_queue_max_bytes, max_line_bytes.
//   A leading "stdio" token (as in a transport URI) is ignored; unknown keys are ignored.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcplease
