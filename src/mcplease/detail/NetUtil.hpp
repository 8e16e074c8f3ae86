//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: detail/NetUtil.hpp
// Purpose: Small helpers shared by the Beast-based transports (ids, targets, stream teardown).
//==========================================================================================================
#pragma once

#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/auth/ServerAuth.h"

namespace mcplease {
namespace detail {

// prefix + 8 lowercase hex digits
inline std::string MakeClientId(const std::string& prefix) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dis;
    std::ostringstream oss;
    oss << prefix << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}

inline std::string ToString(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// Splits "/path?query" into ("/path", "query").
inline std::pair<std::string, std::string> SplitTarget(boost::beast::string_view target) {
    std::string t = ToString(target);
    auto q = t.find('?');
    if (q == std::string::npos) return {t, std::string()};
    return {t.substr(0, q), t.substr(q + 1)};
}

// Value of key in an a=b&c=d query string; empty when absent.
inline std::string QueryParam(const std::string& query, const std::string& key) {
    std::size_t pos = 0;
    while (pos <= query.size()) {
        std::size_t amp = query.find('&', pos);
        std::string kv = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = kv.find('=');
        if (kv.substr(0, eq) == key) {
            return eq == std::string::npos ? std::string() : kv.substr(eq + 1);
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return std::string();
}

// Authorization header, or a bearer built from ?access_token= for clients that cannot set headers.
inline std::string AuthorizationOf(const boost::beast::http::request<boost::beast::http::string_body>& req,
                                   const std::string& query) {
    std::string header = ToString(req[boost::beast::http::field::authorization]);
    if (header.empty()) {
        const std::string token = QueryParam(query, "access_token");
        if (!token.empty()) header = "Bearer " + token;
    }
    return header;
}

// Peer IP used as the rate-limit key.
template <class Stream>
std::string RemoteAddress(Stream& stream) {
    boost::system::error_code ec;
    auto ep = boost::beast::get_lowest_layer(stream).remote_endpoint(ec);
    return ec ? std::string("unknown") : ep.address().to_string();
}

// 401 carrying an AuthenticationError body and a Bearer challenge.
inline boost::beast::http::response<boost::beast::http::string_body> UnauthorizedResponse(unsigned version,
                                                                                         const std::string& reason) {
    namespace http = boost::beast::http;
    http::response<http::string_body> res{http::status::unauthorized, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::www_authenticate, "Bearer realm=\"mcplease\", error=\"invalid_token\"");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);
    res.body() = auth::ErrorReply(JSONRPCErrorCodes::AuthenticationError, "Authentication required", reason);
    res.prepare_payload();
    return res;
}

inline void CloseStream(boost::asio::ip::tcp::socket& s) {
    boost::system::error_code ec;
    s.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    s.close(ec);
}

// No TLS close_notify exchange here; it would block the I/O thread on an unresponsive peer.
inline void CloseStream(boost::asio::ssl::stream<boost::asio::ip::tcp::socket>& s) {
    CloseStream(s.next_layer());
}

} // namespace detail
} // namespace mcplease
