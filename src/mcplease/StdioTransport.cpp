//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport (epoll reader, queued writer, concurrent request handling)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/StdioTransport.hpp"

namespace mcplease {

class StdioTransport::Impl {
public:
    StdioTransport::Options opts;

    std::atomic<bool> running{false};
    std::atomic<bool> acceptingWrites{false};
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;

    std::thread readerThread;
    std::thread writerThread;
    int wakeEventFd{-1};

    // Reader exit signalling for WaitUntilStopped
    std::mutex readerMutex;
    std::condition_variable cvReader;
    // true until Start() so WaitUntilStopped() on an idle transport returns at once
    bool readerExited{true};

    // In-flight request workers
    std::mutex inflightMutex;
    std::condition_variable cvInflight;
    std::size_t inflight{0};

    // Write queue/backpressure
    std::mutex writeMutex; // protects writeQueue, queuedBytes, stopWriter
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    bool stopWriter{false};

    explicit Impl(const StdioTransport::Options& o) : opts(o) {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void wakeReader() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    bool enqueueLine(const std::string& payload) {
        if (!acceptingWrites.load()) {
            LOG_DEBUG("StdioTransport: dropping outbound message, writer not accepting");
            return false;
        }
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > opts.writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})",
                          queuedBytes, frame.size(), opts.writeQueueMaxBytes);
                lk.unlock();
                setError("StdioTransport: write queue overflow");
                running = false;
                wakeReader();
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    void startReader() {
        readerThread = std::thread([this]() {
            readLoop();
            running = false;
            {
                std::lock_guard<std::mutex> lk(readerMutex);
                readerExited = true;
            }
            cvReader.notify_all();
        });
    }

    void readLoop() {
        const int fd = opts.inFd;
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) { (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK); }

        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            setError("StdioTransport: epoll_create1 failed");
            return;
        }
        epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = fd;
        if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) != 0) {
            LOG_ERROR("StdioTransport: cannot watch input fd {} (errno={} msg={})", fd, errno, ::strerror(errno));
            setError("StdioTransport: input not pollable");
            ::close(ep);
            return;
        }
        if (wakeEventFd >= 0) {
            epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
        }

        constexpr int waitTimeoutMs = 100;
        std::string buffer;
        std::vector<char> tmp(8192);
        auto lastReadTs = std::chrono::steady_clock::now();
        bool eof = false;

        while (running && !eof) {
            epoll_event events[2];
            int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                setError("StdioTransport: epoll_wait failed");
                break;
            }
            bool readable = false;
            for (int i = 0; i < rc; ++i) {
                if (events[i].data.fd == fd) {
                    // HUP can arrive together with buffered data, so drain via read() until it returns 0
                    readable = true;
                } else {
                    uint64_t v = 0;
                    ssize_t r;
                    do { r = ::read(events[i].data.fd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                }
            }
            if (!running) break;

            while (readable) {
                ssize_t n = ::read(fd, tmp.data(), tmp.size());
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                    lastReadTs = std::chrono::steady_clock::now();
                    continue;
                }
                if (n == 0) {
                    LOG_INFO("StdioTransport: EOF on input");
                    eof = true;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                    setError("StdioTransport: read error");
                    eof = true;
                }
                break;
            }

            std::size_t pos;
            while (running && (pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                processLine(line);
            }
            if (buffer.size() > opts.maxLineBytes) {
                LOG_WARN("StdioTransport: discarding oversized line ({} bytes)", buffer.size());
                buffer.clear();
            }
            if (eof && !buffer.empty()) {
                processLine(buffer);
                buffer.clear();
            }

            if (opts.idleReadTimeoutMs > 0 &&
                std::chrono::steady_clock::now() - lastReadTs >= std::chrono::milliseconds(opts.idleReadTimeoutMs)) {
                LOG_ERROR("StdioTransport: idle read timeout ({} ms)", opts.idleReadTimeoutMs);
                setError("StdioTransport: idle read timeout");
                break;
            }
        }
        ::close(ep);
    }

    void processLine(std::string line) {
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
        auto first = std::find_if(line.begin(), line.end(), [](unsigned char c) { return !std::isspace(c); });
        line.erase(line.begin(), first);
        if (line.empty()) return;

        auto doc = ParseJSONValue(line);
        if (!doc) {
            LOG_WARN("StdioTransport: dropping malformed JSON line ({} bytes)", line.size());
            return;
        }
        RequestContext ctx;
        ctx.transport = "stdio";
        ctx.receivedAt = std::chrono::steady_clock::now();

        switch (ClassifyMessage(*doc)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromValue(*doc)) {
                    LOG_WARN("StdioTransport: request with unusable id or method");
                    (void)enqueueLine(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize());
                    return;
                }
                dispatchRequest(std::move(request), std::move(ctx));
                return;
            }
            case MessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (note->FromValue(*doc) && notificationHandler) {
                    try {
                        notificationHandler(std::move(note), ctx);
                    } catch (const std::exception& e) {
                        LOG_ERROR("StdioTransport: notification handler error: {}", e.what());
                    }
                }
                return;
            }
            case MessageKind::Response:
                LOG_DEBUG("StdioTransport: ignoring unsolicited response");
                return;
            case MessageKind::Invalid:
                break;
        }
        // An object with a usable id but no method still deserves an answer
        JSONRPCId id = nullptr;
        if (const JSONValue* idv = FindMember(*doc, "id")) {
            if (auto s = std::get_if<std::string>(&idv->value)) id = *s;
            else if (auto n = std::get_if<int64_t>(&idv->value)) id = *n;
            auto resp = CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
            (void)enqueueLine(resp->Serialize());
            return;
        }
        LOG_WARN("StdioTransport: dropping message that is not a JSON-RPC request");
    }

    void dispatchRequest(JSONRPCRequest request, RequestContext ctx) {
        if (!requestHandler) {
            auto resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No request handler");
            (void)enqueueLine(resp->Serialize());
            return;
        }
        {
            std::lock_guard<std::mutex> lk(inflightMutex);
            ++inflight;
        }
        // Off-thread so a slow tool does not stall reading of later lines
        std::thread([this, req = std::move(request), ctx = std::move(ctx)]() {
            std::unique_ptr<JSONRPCResponse> resp;
            try {
                resp = requestHandler(req, ctx);
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: request handler exception: {}", e.what());
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
            }
            if (!resp) {
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
            }
            resp->id = req.id;
            (void)enqueueLine(resp->Serialize());
            // Notify before unlocking: once inflight reaches zero, shutdown() may destroy this object.
            std::lock_guard<std::mutex> lk(inflightMutex);
            --inflight;
            cvInflight.notify_all();
        }).detach();
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            const int fd = opts.outFd;
            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK); }
            bool failed = false;
            while (true) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&]{ return stopWriter || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        break; // stopWriter with nothing left to flush
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                    queuedBytes -= std::min(queuedBytes, frame.size());
                }
                if (failed) continue;
                failed = !writeAll(fd, frame);
                if (failed) {
                    acceptingWrites = false;
                    running = false;
                    wakeReader();
                }
            }
        });
    }

    bool writeAll(int fd, const std::string& frame) {
        std::size_t total = 0;
        auto start = std::chrono::steady_clock::now();
        while (total < frame.size()) {
            ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (opts.writeTimeoutMs > 0 &&
                    std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(opts.writeTimeoutMs)) {
                    LOG_ERROR("StdioTransport: write timeout ({} ms)", opts.writeTimeoutMs);
                    setError("StdioTransport: write timeout");
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else {
                LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                setError("StdioTransport: write error");
                return false;
            }
        }
        return true;
    }

    void shutdown() {
        running = false;
        wakeReader();
        if (readerThread.joinable()) {
            readerThread.join();
        }
        {
            std::unique_lock<std::mutex> lk(inflightMutex);
            cvInflight.wait(lk, [&]{ return inflight == 0; });
        }
        acceptingWrites = false;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            stopWriter = true;
        }
        cvWrite.notify_all();
        if (writerThread.joinable()) {
            writerThread.join();
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) { FUNC_SCOPE(); }

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    pImpl->shutdown();
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport (in fd={}, out fd={})", pImpl->opts.inFd, pImpl->opts.outFd);
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        pImpl->stopWriter = false;
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->readerMutex);
        pImpl->readerExited = false;
    }
    pImpl->running = true;
    pImpl->acceptingWrites = true;
    pImpl->startWriter();
    pImpl->startReader();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Stop() {
    FUNC_SCOPE();
    LOG_INFO("Stopping StdioTransport");
    pImpl->shutdown();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void StdioTransport::WaitUntilStopped() {
    std::unique_lock<std::mutex> lk(pImpl->readerMutex);
    pImpl->cvReader.wait(lk, [&]{ return pImpl->readerExited; });
}

bool StdioTransport::IsRunning() const { return pImpl->running.load(); }
std::string StdioTransport::Name() const { return "stdio"; }
std::size_t StdioTransport::ConnectedClients() const { return pImpl->running.load() ? 1u : 0u; }

std::size_t StdioTransport::SendMessage(const std::string& json) {
    return pImpl->enqueueLine(json) ? 1u : 0u;
}

void StdioTransport::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void StdioTransport::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetIdleReadTimeoutMs(uint64_t timeoutMs) { pImpl->opts.idleReadTimeoutMs = timeoutMs; }

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->opts.writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) { pImpl->opts.writeTimeoutMs = timeoutMs; }

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    StdioTransport::Options opts;
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
            return false;
        }
        try { out = static_cast<uint64_t>(std::stoull(s)); return true; }
        catch (const std::out_of_range&) { return false; }
    };
    std::size_t i = 0;
    while (i < config.size()) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t' || config[i] == '?')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t' && config[i] != '?') ++i;
        const std::string token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            continue; // "stdio" scheme token or a bare flag
        }
        const auto key = token.substr(0, eq);
        const auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (!parseUint(val, v)) {
            LOG_WARN("StdioTransportFactory: ignoring non-numeric value for {}: {}", key, val);
            continue;
        }
        if (key == "idle_read_timeout_ms") opts.idleReadTimeoutMs = v;
        else if (key == "write_timeout_ms") opts.writeTimeoutMs = v;
        else if (key == "write_queue_max_bytes") opts.writeQueueMaxBytes = static_cast<std::size_t>(std::max<uint64_t>(v, 1));
        else if (key == "max_line_bytes") opts.maxLineBytes = static_cast<std::size_t>(std::max<uint64_t>(v, 1));
    }
    return std::make_unique<StdioTransport>(opts);
}

} // namespace mcplease
