/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/server.hpp"
#include "sotto/errors.hpp"
#include "sotto/handler.hpp"
#include "sotto/logger.hpp"
#include "sotto/model_service.hpp"
#include "sotto/pool.hpp"
#include "sotto/processor.hpp"
#include "sotto/protocol.hpp"
#include "sotto/registry.hpp"
#include "sotto/work.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>

namespace sotto {

namespace {
constexpr int kAcceptPollMs = 200;
constexpr int kListenBacklog = 64;
}

// Signal handling is done by the CLI (sottod.cpp), not by the Server class

Server::Server(ServerConfig config, std::shared_ptr<ModelService> service)
    : config_(std::move(config)), endpoint_(config_.endpoint), service_(std::move(service)) {
    if (!service_) {
        throw std::invalid_argument("Server requires a model service");
    }
    LOG_DEBUG("Server created - endpoint: " + endpoint_.describe() +
              ", workers: " + std::to_string(config_.workers) +
              ", max connections: " + std::to_string(config_.maxConnections));
}

Server::~Server() {
    shutdown();
}

void Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return;
    }

    registry_ = std::make_unique<JobRegistry>();
    processor_ = std::make_unique<Processor>(*registry_, *service_);
    pool_ = std::make_unique<Pool>(config_.workers, config_.maxQueuedJobs);
    work_ = std::make_unique<Work>(*registry_, *pool_);
    handler_ = std::make_unique<Handler>(*service_, *registry_, *work_, config_.token,
                                         [this] { shutdownRequested_.store(true); });

    listener_ = listenOn(config_.endpoint, kListenBacklog);
    if (!endpoint_.isLocal() && endpoint_.port == 0) {
        endpoint_.port = boundPort(listener_);
    }

    if (!pool_->start([this](const JobId& jobId, int workerId) {
            (void)processor_->process(jobId, workerId);
        })) {
        listener_.reset();
        throw TransportError("Failed to start worker pool");
    }

    running_.store(true);
    shutdownRequested_.store(false);
    try {
        acceptThread_ = std::thread(&Server::acceptLoop, this);
    } catch (const std::exception& e) {
        running_.store(false);
        pool_->stop();
        listener_.reset();
        throw TransportError(std::string("Failed to start accept thread: ") + e.what());
    }

    LOG_INFO("Listening on " + endpoint_.describe());
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");

    listener_.shutdown();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    reapConnections(true);

    std::size_t cancelled = registry_->cancelAll();
    if (cancelled > 0) {
        LOG_INFO("Cancelling " + std::to_string(cancelled) + " unfinished job(s)");
    }
    pool_->stop();

    listener_.reset();
    if (endpoint_.isLocal()) {
        std::error_code ec;
        std::filesystem::remove(endpoint_.path, ec);
    }

    handler_.reset();
    work_.reset();
    pool_.reset();
    processor_.reset();

    LOG_INFO("Server shutdown complete");
}

void Server::acceptLoop() {
    setThreadName("Accept");
    LOG_DEBUG("Accept loop started");
    int nextId = 0;

    while (running_.load()) {
        reapConnections(false);

        pollfd pfd{listener_.fd(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno != EINTR) {
                LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
            }
            continue;
        }
        if (ready == 0 || !running_.load()) {
            continue;
        }

        Socket client(::accept(listener_.fd(), nullptr, nullptr));
        if (!client) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED && running_.load()) {
                LOG_ERROR(std::string("accept failed: ") + std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
            }
            continue;
        }

        std::unique_lock<std::mutex> lock(connectionsMutex_);
        if (connections_.size() >= static_cast<std::size_t>(config_.maxConnections)) {
            std::size_t active = connections_.size();
            lock.unlock();
            LOG_WARN("Rejecting connection: " + std::to_string(active) + " active");
            setIoTimeout(client, 1000);
            try {
                writeAll(client, encodeFrame(errorResponse("Server busy: too many connections")));
            } catch (const std::exception& e) {
                LOG_DEBUG(std::string("Busy reply not delivered: ") + e.what());
            }
            continue;
        }

        int id = nextId++;
        connections_.emplace_back();
        Connection& connection = connections_.back();
        connection.socket = std::move(client);
        try {
            connection.thread = std::thread(&Server::serveConnection, this, std::ref(connection), id);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to spawn connection thread: " + std::string(e.what()));
            connections_.pop_back();
        }
    }

    LOG_DEBUG("Accept loop stopped");
}

void Server::serveConnection(Connection& connection, int connectionId) {
    setThreadName("Conn-" + std::to_string(connectionId));
    setIoTimeout(connection.socket, config_.readTimeoutMs);
    LineFramer framer(config_.maxRequestBytes);

    try {
        auto frame = readFrame(connection.socket, framer);
        if (frame) {
            auto response = handler_->handle(*frame);
            writeAll(connection.socket, encodeFrame(response));
        }
    } catch (const ProtocolError& e) {
        LOG_WARN(std::string("Bad request: ") + e.what());
        try {
            writeAll(connection.socket, encodeFrame(errorResponse(e.what())));
        } catch (const std::exception& inner) {
            LOG_DEBUG(std::string("Error reply not delivered: ") + inner.what());
        }
    } catch (const TransportError& e) {
        LOG_DEBUG(std::string("Connection closed: ") + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Connection error: ") + e.what());
    }

    // The owner closes the socket after joining
    connection.done.store(true);
}

void Server::reapConnections(bool all) {
    std::list<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            auto current = it++;
            if (all) {
                current->socket.shutdown();
            }
            if (all || current->done.load()) {
                finished.splice(finished.end(), connections_, current);
            }
        }
    }
    for (auto& connection : finished) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
}

}
