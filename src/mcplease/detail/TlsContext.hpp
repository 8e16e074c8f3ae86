//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: detail/TlsContext.hpp
// Purpose: TLS 1.3-only server context construction shared by the network transports.
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include <boost/asio/ssl.hpp>
#include <openssl/ssl.h>

#include "logging/Logger.h"

namespace mcplease {
namespace detail {

// Throws boost::system::system_error when the certificate or key cannot be loaded.
inline std::unique_ptr<boost::asio::ssl::context> MakeServerTlsContext(const std::string& certFile,
                                                                      const std::string& keyFile) {
    namespace ssl = boost::asio::ssl;
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_server);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    try {
        ctx->use_certificate_chain_file(certFile);
        ctx->use_private_key_file(keyFile, ssl::context::file_format::pem);
    } catch (const std::exception& e) {
        LOG_ERROR("TLS: failed to load certificate/key ({} / {}): {}", certFile, keyFile, e.what());
        throw;
    }
    ctx->set_options(
        ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    return ctx;
}

} // namespace detail
} // namespace mcplease
