/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include "sotto/config.hpp"
#include "sotto/logger.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace sotto;

static void testEndpointParsing() {
    auto local = parseEndpoint("/tmp/sotto_test.sock");
    assert(local.isLocal());
    assert(local.path == "/tmp/sotto_test.sock");

    auto unixScheme = parseEndpoint("unix:///run/sotto.sock");
    assert(unixScheme.isLocal());
    assert(unixScheme.path == "/run/sotto.sock");

    auto tcp = parseEndpoint("localhost:9876");
    assert(!tcp.isLocal());
    assert(tcp.host == "127.0.0.1");
    assert(tcp.port == 9876);
    assert(tcp.describe() == "tcp://127.0.0.1:9876");

    auto explicitTcp = parseEndpoint("tcp://0.0.0.0:0");
    assert(!explicitTcp.isLocal());
    assert(explicitTcp.host == "0.0.0.0");
    assert(explicitTcp.port == 0);

    // Relative socket names are not mistaken for host:port
    assert(parseEndpoint("sotto.sock").isLocal());
}

static void testEndpointErrors() {
    bool threw = false;
    try {
        (void)parseEndpoint("tcp://127.0.0.1:99999");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)parseEndpoint("tcp://nohost");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void testDefaultPaths() {
    auto socket = defaultSocketPath();
    auto name = socket.filename().string();
    assert(name.rfind("sotto_", 0) == 0);
    assert(socket.extension() == ".sock");

    auto token = defaultTokenPath(Endpoint::local("/tmp/sotto_x.sock"));
    assert(token == "/tmp/sotto_x.sock.token");

    auto tcpToken = defaultTokenPath(Endpoint::tcp("127.0.0.1", 9876));
    assert(tcpToken.filename() == "sotto_9876.token");
}

static void testEnvironmentOverrides() {
    ::setenv("SOTTO_WORKERS", "3", 1);
    ::setenv("SOTTO_MAX_CONNECTIONS", "not-a-number", 1);
    ::setenv("SOTTO_MAX_QUEUED_JOBS", "0", 1);

    ServerConfig config;
    config.applyEnv();
    assert(config.workers == 3);
    assert(config.maxConnections == 64);
    assert(config.maxQueuedJobs == 256);

    ::unsetenv("SOTTO_WORKERS");
    ::unsetenv("SOTTO_MAX_CONNECTIONS");
    ::unsetenv("SOTTO_MAX_QUEUED_JOBS");

    assert(envString("SOTTO_UNSET_FOR_TEST", "fallback") == "fallback");
    assert(envInt("SOTTO_UNSET_FOR_TEST", 7) == 7);
}

static void testModelsDir() {
    ::setenv("SOTTO_MODELS_DIR", "/opt/sotto/models", 1);
    assert(resolveModelsDir("sottod") == "/opt/sotto/models");
    ::unsetenv("SOTTO_MODELS_DIR");
    assert(resolveModelsDir(nullptr).filename() == "models");
}

static void testLogLevels() {
    assert(parseLogLevel("DEBUG") == LogLevel::DEBUG);
    assert(parseLogLevel("Warning") == LogLevel::WARN);
    assert(parseLogLevel("warn") == LogLevel::WARN);
    assert(!parseLogLevel("verbose"));

    Logger::setLevel(LogLevel::WARN);
    assert(Logger::enabled(LogLevel::ERROR));
    assert(!Logger::enabled(LogLevel::INFO));

    int evaluated = 0;
    auto message = [&] { ++evaluated; return std::string("skipped"); };
    LOG_DEBUG(message());
    assert(evaluated == 0);
    LOG_WARN(message());
    assert(evaluated == 1);

    ::setenv("SOTTO_LOG_LEVEL", "trace", 1);
    Logger::initFromEnv();
    assert(Logger::level() == LogLevel::TRACE);
    ::unsetenv("SOTTO_LOG_LEVEL");
    Logger::initFromEnv();
    assert(Logger::level() == LogLevel::INFO);

    setThreadName("Worker-7");
    assert(threadName() == "Worker-7");
    assert(workerThreadName(3) == "Worker-3");
}

int main() {
    testEndpointParsing();
    testEndpointErrors();
    testDefaultPaths();
    testEnvironmentOverrides();
    testModelsDir();
    testLogLevels();
    std::cout << "config_test: all tests passed\n";
    return 0;
}
