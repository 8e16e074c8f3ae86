//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transport_factories.cpp
// Purpose: Transport URI dispatch and endpoint parsing
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

#include "mcplease/NetworkEndpoint.hpp"
#include "mcplease/SseServer.hpp"
#include "mcplease/StdioTransport.hpp"
#include "mcplease/Transport.h"
#include "mcplease/WebSocketServer.hpp"

using namespace mcplease;

TEST(TransportFactories, UriSelectsTransportKind) {
    auto stdio = CreateTransportFromUri("stdio");
    ASSERT_NE(stdio, nullptr);
    EXPECT_EQ(stdio->Name(), "stdio");

    auto stdioWithOptions = CreateTransportFromUri("stdio?write_timeout_ms=500");
    ASSERT_NE(stdioWithOptions, nullptr);
    EXPECT_EQ(stdioWithOptions->Name(), "stdio");

    auto sse = CreateTransportFromUri("sse://127.0.0.1:0");
    ASSERT_NE(sse, nullptr);
    EXPECT_EQ(sse->Name(), "sse");
    EXPECT_FALSE(sse->IsRunning());

    auto ws = CreateTransportFromUri("ws://127.0.0.1:0");
    ASSERT_NE(ws, nullptr);
    EXPECT_EQ(ws->Name(), "websocket");
}

TEST(TransportFactories, UnknownSchemeThrows) {
    EXPECT_THROW(CreateTransportFromUri("tcp://localhost:9000"), std::invalid_argument);
    EXPECT_THROW(CreateTransportFromUri(""), std::invalid_argument);
    EXPECT_THROW(CreateTransportFromUri("shm://channel"), std::invalid_argument);
}

TEST(TransportFactories, SecureSchemesRequireCertificates) {
    EXPECT_THROW(CreateTransportFromUri("sses://127.0.0.1:8443"), std::invalid_argument);
    EXPECT_THROW(CreateTransportFromUri("wss://127.0.0.1:8443?cert=server.pem"), std::invalid_argument);
}

TEST(TransportFactories, SseFromFactoryStartsOnEphemeralPort) {
    SseServerFactory factory;
    auto t = factory.CreateTransport("sse://127.0.0.1:0?keepalive_ms=1000&workers=1");
    auto* sse = dynamic_cast<SseServer*>(t.get());
    ASSERT_NE(sse, nullptr);
    EXPECT_EQ(sse->BoundPort(), 0);
    ASSERT_NO_THROW(t->Start().get());
    EXPECT_TRUE(t->IsRunning());
    EXPECT_NE(sse->BoundPort(), 0);
    EXPECT_EQ(t->ConnectedClients(), 0u);
    ASSERT_NO_THROW(t->Stop().get());
    EXPECT_FALSE(t->IsRunning());
}

TEST(TransportFactories, WebSocketFromFactoryStartsOnEphemeralPort) {
    WebSocketServerFactory factory;
    auto t = factory.CreateTransport("ws://127.0.0.1:0");
    auto* ws = dynamic_cast<WebSocketServer*>(t.get());
    ASSERT_NE(ws, nullptr);
    ASSERT_NO_THROW(t->Start().get());
    EXPECT_NE(ws->BoundPort(), 0);
    ASSERT_NO_THROW(t->Stop().get());
}

TEST(NetworkEndpoint, DefaultsAndExplicitPort) {
    NetworkEndpoint a = ParseEndpointUri("sse://0.0.0.0", "sse", "sses", "8000");
    EXPECT_FALSE(a.tls);
    EXPECT_EQ(a.address, "0.0.0.0");
    EXPECT_EQ(a.port, "8000");

    NetworkEndpoint b = ParseEndpointUri("ws://localhost:9001/mcp", "ws", "wss", "8001");
    EXPECT_EQ(b.address, "localhost");
    EXPECT_EQ(b.port, "9001");

    NetworkEndpoint c = ParseEndpointUri("127.0.0.1:7000", "sse", "sses", "8000");
    EXPECT_EQ(c.address, "127.0.0.1");
    EXPECT_EQ(c.port, "7000");
}

TEST(NetworkEndpoint, HttpAliasesAndIpv6) {
    NetworkEndpoint plain = ParseEndpointUri("http://[::1]:8080", "sse", "sses", "8000");
    EXPECT_FALSE(plain.tls);
    EXPECT_EQ(plain.address, "::1");
    EXPECT_EQ(plain.port, "8080");

    NetworkEndpoint secure = ParseEndpointUri("https://[::]?cert=c.pem&key=k.pem", "sse", "sses", "8443");
    EXPECT_TRUE(secure.tls);
    EXPECT_EQ(secure.address, "::");
    EXPECT_EQ(secure.port, "8443");
    EXPECT_EQ(secure.certFile, "c.pem");
    EXPECT_EQ(secure.keyFile, "k.pem");
}

TEST(NetworkEndpoint, QueryParametersAreKept) {
    NetworkEndpoint ep = ParseEndpointUri("sse://127.0.0.1:0?keepalive_ms=50&workers=3&flag", "sse", "sses", "8000");
    EXPECT_EQ(ep.params.at("keepalive_ms"), "50");
    EXPECT_EQ(ep.params.at("workers"), "3");
    EXPECT_EQ(ep.params.at("flag"), "");
    EXPECT_TRUE(ep.certFile.empty());
}

TEST(NetworkEndpoint, RejectsBadInput) {
    EXPECT_THROW(ParseEndpointUri("ws://host:notaport", "ws", "wss", "8001"), std::invalid_argument);
    EXPECT_THROW(ParseEndpointUri("ws://host:70000", "ws", "wss", "8001"), std::invalid_argument);
    EXPECT_THROW(ParseEndpointUri("ftp://host:21", "ws", "wss", "8001"), std::invalid_argument);
    EXPECT_THROW(ParseEndpointUri("ws://[::1:8001", "ws", "wss", "8001"), std::invalid_argument);
    EXPECT_THROW(ParseEndpointUri("wss://host:443", "ws", "wss", "8001"), std::invalid_argument);
}

TEST(NetworkEndpoint, PortValidation) {
    EXPECT_TRUE(IsValidPort("0"));
    EXPECT_TRUE(IsValidPort("8000"));
    EXPECT_TRUE(IsValidPort("65535"));
    EXPECT_FALSE(IsValidPort("65536"));
    EXPECT_FALSE(IsValidPort(""));
    EXPECT_FALSE(IsValidPort("-1"));
    EXPECT_FALSE(IsValidPort("80a"));
    EXPECT_FALSE(IsValidPort("123456"));
}
