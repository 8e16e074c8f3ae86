//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkEndpoint.cpp
// Purpose: URI parsing for network transport endpoints.
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "mcplease/NetworkEndpoint.hpp"

namespace mcplease {

namespace {
void trim(std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}
} // namespace

bool IsValidPort(const std::string& port) {
    if (port.empty() || port.size() > 5) return false;
    if (!std::all_of(port.begin(), port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
        return false;
    }
    return std::stoul(port) <= 65535ul;
}

NetworkEndpoint ParseEndpointUri(const std::string& config,
                                 const std::string& plainScheme,
                                 const std::string& tlsScheme,
                                 const std::string& defaultPort) {
    NetworkEndpoint ep;
    std::string cfg = config;
    trim(cfg);

    auto schemeEnd = cfg.find("://");
    if (schemeEnd != std::string::npos) {
        std::string scheme = cfg.substr(0, schemeEnd);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (scheme == plainScheme || scheme == "http") {
            ep.tls = false;
        } else if (scheme == tlsScheme || scheme == "https") {
            ep.tls = true;
        } else {
            throw std::invalid_argument("Unsupported scheme '" + scheme + "' (expected " + plainScheme +
                                        " or " + tlsScheme + ")");
        }
        cfg = cfg.substr(schemeEnd + 3);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }
    std::string hostPort = hostPortPath.substr(0, hostPortPath.find('/'));
    trim(hostPort);

    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb == std::string::npos) {
                throw std::invalid_argument("Unterminated IPv6 address in '" + config + "'");
            }
            ep.address = hostPort.substr(1, rb - 1);
            if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                ep.port = hostPort.substr(rb + 2);
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                ep.address = hostPort.substr(0, colon);
                ep.port = hostPort.substr(colon + 1);
            } else {
                ep.address = hostPort;
            }
        }
        trim(ep.address);
        trim(ep.port);
        if (ep.address.empty()) ep.address = "0.0.0.0";
    }
    if (ep.port.empty()) ep.port = defaultPort;
    if (!IsValidPort(ep.port)) {
        throw std::invalid_argument("Invalid port '" + ep.port + "' in '" + config + "'");
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            if (kv.empty()) continue;
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") ep.certFile = val;
            else if (key == "key") ep.keyFile = val;
            else ep.params[key] = val;
        }
    }
    if (ep.tls && (ep.certFile.empty() || ep.keyFile.empty())) {
        throw std::invalid_argument("TLS endpoint requires cert= and key= parameters");
    }
    return ep;
}

} // namespace mcplease
