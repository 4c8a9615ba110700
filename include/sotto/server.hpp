/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "sotto/config.hpp"
#include "sotto/socket.hpp"

namespace sotto {

class Handler;
class JobRegistry;
class ModelService;
class Pool;
class Processor;
class Work;

// The daemon listener: binds the endpoint, accepts connections and serves one
// request per connection. Jobs run on a bounded worker pool.
class Server final {
public:
    Server(ServerConfig config, std::shared_ptr<ModelService> service);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    // Returns once the endpoint accepts connections. Throws TransportError.
    void start();
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool shutdownRequested() const noexcept { return shutdownRequested_.load(); }
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] JobRegistry& registry() noexcept { return *registry_; }

private:
    struct Connection {
        Socket socket;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void acceptLoop();
    void serveConnection(Connection& connection, int connectionId);
    void reapConnections(bool all);

    ServerConfig config_;
    Endpoint endpoint_;
    std::shared_ptr<ModelService> service_;

    std::unique_ptr<JobRegistry> registry_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Work> work_;
    std::unique_ptr<Handler> handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};

    Socket listener_;
    std::thread acceptThread_;

    std::mutex connectionsMutex_;
    std::list<Connection> connections_;
};

}
