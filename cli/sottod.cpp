/*
 * sotto - Speech-to-text daemon (sottod)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/config.hpp"
#include "sotto/errors.hpp"
#include "sotto/logger.hpp"
#include "sotto/model_service.hpp"
#include "sotto/server.hpp"
#include "sotto/whisper_engine.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <optional>
#include <random>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using namespace sotto;

constexpr const char* VERSION = "0.1.0";
constexpr uint16_t kDefaultPort = 9876;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "sotto speech-to-text daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Endpoint:\n";
    std::cout << "  --socket <path>        Local socket path (default: <tmp>/sotto_<timestamp>.sock)\n";
    std::cout << "  --tcp <host:port>      Listen on TCP instead\n";
    std::cout << "  --use-tcp              Listen on TCP using --host/--port\n";
    std::cout << "  --host <host>          TCP host (default: 127.0.0.1)\n";
    std::cout << "  --port <port>          TCP port (default: " << kDefaultPort << ")\n\n";
    std::cout << "Model:\n";
    std::cout << "  --model <id|path>      Model to load at startup\n";
    std::cout << "  --device <name>        auto, cpu, gpu, cuda, metal, mps (default: auto)\n";
    std::cout << "  --compute-type <type>  float32, float16, int8, int8_float16, q8_0, q5_0, q5_1, q4_0\n";
    std::cout << "                         (default: float16)\n";
    std::cout << "  --cpu-threads <n>      Inference threads (default: min(4, cores))\n";
    std::cout << "  --models-dir <dir>     Directory with ggml-<id>.bin files\n";
    std::cout << "  --vad-model <path>     Silero VAD model used when vad_filter is set\n\n";
    std::cout << "Server:\n";
    std::cout << "  --workers <n>          Transcription workers (default: 2)\n";
    std::cout << "  --max-connections <n>  Concurrent connections (default: 64)\n";
    std::cout << "  --read-timeout <ms>    Request read timeout, 0 = none (default: 30000)\n";
    std::cout << "  --token-file <path>    Where to write the shutdown token\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SOTTO_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SOTTO_MODELS_DIR       Model directory\n";
    std::cout << "  SOTTO_WORKERS, SOTTO_MAX_CONNECTIONS, SOTTO_READ_TIMEOUT_MS,\n";
    std::cout << "  SOTTO_MAX_REQUEST_BYTES, SOTTO_MAX_QUEUED_JOBS\n";
    std::cout << "  SOTTO_GPU_DEVICE       GPU index\n";
    std::cout << "  SOTTO_FLASH_ATTN       Flash attention (0/1)\n";
    std::cout << "  SOTTO_VAD_MODEL        VAD model path\n";
    std::cout << "  WHISPER_LOG_LEVEL      whisper.cpp log level (error, warn, info, debug)\n";
}

std::string generateToken() {
    std::random_device rd;
    static const char* hex = "0123456789abcdef";
    std::string token;
    token.reserve(32);
    for (int i = 0; i < 32; ++i) {
        token.push_back(hex[rd() & 0xF]);
    }
    return token;
}

// Owner-only from the moment it exists.
bool writeTokenFile(const std::filesystem::path& path, const std::string& token) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        LOG_ERROR("Cannot write token file " + path.string() + ": " + std::strerror(errno));
        return false;
    }
    ::fchmod(fd, 0600);
    std::string content = token + "\n";
    bool ok = ::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size());
    ::close(fd);
    if (!ok) {
        LOG_ERROR("Short write to token file " + path.string());
    }
    return ok;
}

bool parseInt(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    setThreadName("Main");
    Logger::initFromEnv();

    ServiceConfig serviceConfig;
    serviceConfig.modelsDir = resolveModelsDir(argv[0]);
    serviceConfig.vadModel = envString("SOTTO_VAD_MODEL", "");

    ServerConfig serverConfig;
    serverConfig.applyEnv();

    std::optional<std::string> socketPath;
    std::optional<std::string> tcpArg;
    bool useTcp = false;
    std::string host = "127.0.0.1";
    int port = kDefaultPort;
    std::string initialModel;
    std::optional<std::filesystem::path> tokenFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto intValue = [&](const char* name, int& out) -> bool {
            auto v = value(name);
            if (!v) return false;
            if (!parseInt(*v, out)) {
                std::cerr << "Error: Invalid value for " << name << ": " << *v << "\n";
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "--socket") {
            if (!(socketPath = value("--socket"))) return 1;
        } else if (arg == "--tcp") {
            if (!(tcpArg = value("--tcp"))) return 1;
        } else if (arg == "--use-tcp") {
            useTcp = true;
        } else if (arg == "--host") {
            auto v = value("--host");
            if (!v) return 1;
            host = *v;
        } else if (arg == "--port") {
            if (!intValue("--port", port)) return 1;
        } else if (arg == "--model") {
            auto v = value("--model");
            if (!v) return 1;
            initialModel = *v;
        } else if (arg == "--device") {
            auto v = value("--device");
            if (!v) return 1;
            serviceConfig.compute.device = *v;
        } else if (arg == "--compute-type") {
            auto v = value("--compute-type");
            if (!v) return 1;
            serviceConfig.compute.computeType = *v;
        } else if (arg == "--cpu-threads") {
            if (!intValue("--cpu-threads", serviceConfig.compute.cpuThreads)) return 1;
        } else if (arg == "--models-dir") {
            auto v = value("--models-dir");
            if (!v) return 1;
            serviceConfig.modelsDir = *v;
        } else if (arg == "--vad-model") {
            auto v = value("--vad-model");
            if (!v) return 1;
            serviceConfig.vadModel = *v;
        } else if (arg == "--workers" || arg == "-w") {
            if (!intValue("--workers", serverConfig.workers)) return 1;
        } else if (arg == "--max-connections") {
            if (!intValue("--max-connections", serverConfig.maxConnections)) return 1;
        } else if (arg == "--read-timeout") {
            if (!intValue("--read-timeout", serverConfig.readTimeoutMs)) return 1;
        } else if (arg == "--token-file") {
            auto v = value("--token-file");
            if (!v) return 1;
            tokenFile = std::filesystem::path(*v);
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (serverConfig.workers < 1 || serverConfig.maxConnections < 1 || serverConfig.readTimeoutMs < 0) {
        std::cerr << "Error: --workers and --max-connections must be positive, --read-timeout non-negative\n";
        return 1;
    }

    try {
        if (tcpArg) {
            serverConfig.endpoint = parseEndpoint(*tcpArg);
            if (serverConfig.endpoint.isLocal()) {
                std::cerr << "Error: --tcp expects host:port\n";
                return 1;
            }
        } else if (useTcp) {
            if (port < 0 || port > 65535) {
                std::cerr << "Error: Invalid port: " << port << "\n";
                return 1;
            }
            serverConfig.endpoint = Endpoint::tcp(host == "localhost" ? "127.0.0.1" : host,
                                                  static_cast<uint16_t>(port));
        } else {
            serverConfig.endpoint = Endpoint::local(socketPath ? std::filesystem::path(*socketPath)
                                                               : defaultSocketPath());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    serverConfig.token = generateToken();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto service = std::make_shared<ModelService>(
            serviceConfig, std::make_unique<WhisperBackend>(serviceConfig.vadModel));

        Server server(serverConfig, service);
        server.start();

        std::filesystem::path tokenPath = tokenFile ? *tokenFile : defaultTokenPath(server.endpoint());
        bool tokenWritten = writeTokenFile(tokenPath, serverConfig.token);

        std::cout << "\n";
        std::cout << "  \033[1msotto\033[0m " << VERSION << "                        \033[90mresident · speech · to · text\033[0m\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Endpoint   " << server.endpoint().describe() << "\n";
        std::cout << "    Device     " << serviceConfig.compute.device << " / " << serviceConfig.compute.computeType << "\n";
        std::cout << "    Models     " << serviceConfig.modelsDir.string() << "\n";
        std::cout << "    Workers    " << serverConfig.workers << "\n";
        if (tokenWritten) {
            std::cout << "    Token      " << tokenPath.string() << "\n";
        }
        std::cout << "\n" << std::flush;

        if (!initialModel.empty()) {
            std::cout << "  Loading " << initialModel << "\n" << std::flush;
            try {
                auto outcome = service->load(initialModel);
                std::cout << "  \033[32mLoaded\033[0m " << outcome.modelId << " in "
                          << outcome.seconds << "s\n\n" << std::flush;
            } catch (const ModelLoadError& e) {
                // Keep serving; clients can load another model
                LOG_ERROR(std::string("Initial model load failed: ") + e.what());
                std::cout << "  \033[31mLoad failed\033[0m  running with no model loaded\n\n" << std::flush;
            }
        }

        while (!g_shutdown_requested && !server.shutdownRequested() && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        LOG_DEBUG("Shutdown requested, stopping server...");
        server.shutdown();

        if (tokenWritten) {
            std::error_code ec;
            std::filesystem::remove(tokenPath, ec);
        }

    } catch (const TransportError& e) {
        LOG_ERROR("Failed to start: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
