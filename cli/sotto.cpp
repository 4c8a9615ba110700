/*
 * sotto - Client tool (sotto)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/client.hpp"
#include "sotto/config.hpp"
#include "sotto/logger.hpp"
#include "sotto/protocol.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <vector>
#include <unistd.h>

using namespace sotto;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "sotto client v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--socket <path> | --tcp <host:port>] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  status                 Daemon, device and model information\n";
    std::cout << "  load <model>           Make a model resident\n";
    std::cout << "  transcribe <audio>     Submit a transcription job (prints the job id)\n";
    std::cout << "  job <id>               Result of a job (exit 2 if not finished)\n";
    std::cout << "  wait <id>              Wait for a job, print its result, then remove it\n";
    std::cout << "  cleanup <id>           Remove a job, cancelling it if unfinished\n";
    std::cout << "  stop                   Stop the daemon\n\n";
    std::cout << "Transcribe options:\n";
    std::cout << "  --model <id>           Switch to this model first\n";
    std::cout << "  --language <code>      Source language (default: auto)\n";
    std::cout << "  --translate            Translate to English\n";
    std::cout << "  --beam-size <n>        Beam size (default: 5)\n";
    std::cout << "  --temperature <t>      Sampling temperature (default: 0)\n";
    std::cout << "  --prompt <text>        Initial prompt\n";
    std::cout << "  --word-timestamps      Include per-word timings\n";
    std::cout << "  --no-vad               Disable voice activity filtering\n";
    std::cout << "  --wait                 Wait, print the transcript and remove the job\n";
    std::cout << "  --json                 Print the full JSON result\n\n";
    std::cout << "Other options:\n";
    std::cout << "  --token-file <path>    Shutdown token for 'stop'\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SOTTO_SOCKET       Daemon endpoint (path or host:port)\n";
    std::cout << "  SOTTO_TOKEN        Shutdown token\n";
    std::cout << "  SOTTO_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " load base.en\n";
    std::cout << "  " << progName << " transcribe meeting.wav --wait\n";
    std::cout << "  id=$(" << progName << " transcribe note.wav) && " << progName << " wait $id\n";
}

std::optional<Endpoint> resolveEndpoint(const std::optional<std::string>& explicitArg) {
    if (explicitArg) {
        return parseEndpoint(*explicitArg);
    }
    if (const char* env = std::getenv("SOTTO_SOCKET")) {
        if (*env) return parseEndpoint(env);
    }
    if (auto latest = findLatestSocket()) {
        return Endpoint::local(*latest);
    }
    return std::nullopt;
}

std::optional<std::string> readToken(const std::optional<std::string>& tokenFile, const Endpoint& endpoint) {
    if (const char* env = std::getenv("SOTTO_TOKEN")) {
        if (*env) return std::string(env);
    }
    std::filesystem::path path = tokenFile ? std::filesystem::path(*tokenFile) : defaultTokenPath(endpoint);
    std::ifstream file(path);
    std::string token;
    if (!file || !std::getline(file, token) || token.empty()) {
        std::cerr << "Error: Cannot read shutdown token from " << path.string() << "\n";
        return std::nullopt;
    }
    return token;
}

int reportError(const nlohmann::json& response) {
    std::cerr << "Error: " << response.value("error", std::string("unknown error")) << std::endl;
    return 1;
}

// Prints a finished job; 2 if it is still pending or running.
int printJob(const std::string& jobId, const nlohmann::json& response, bool asJson) {
    if (isError(response)) {
        return reportError(response);
    }
    std::string status = response.value("status", "");
    if (status == "completed") {
        auto result = response.value("result", nlohmann::json::object());
        if (asJson) {
            std::cout << result.dump(2) << std::endl;
        } else {
            std::cout << result.value("text", "") << std::endl;
        }
        return 0;
    }
    if (status == "failed") {
        std::cerr << "Job failed: " << jobId << std::endl;
        auto error = response.find("error");
        if (error != response.end() && error->is_string()) {
            std::cerr << "Error: " << error->get<std::string>() << std::endl;
        }
        return 1;
    }
    std::cerr << "Job not ready: " << jobId << " (status: " << status << ", "
              << response.value("progress", 0) << "%)" << std::endl;
    return 2;
}

nlohmann::json waitWithProgress(const Client& client, const std::string& jobId) {
    const bool showProgress = isatty(fileno(stderr));
    auto response = client.collectJob(jobId, std::chrono::milliseconds(500),
        [showProgress](const nlohmann::json& update) {
            if (showProgress && !isError(update)) {
                std::cerr << "\r  " << update.value("status", "") << " "
                          << update.value("progress", 0) << "%   " << std::flush;
            }
        });
    if (showProgress) {
        std::cerr << "\r                          \r" << std::flush;
    }
    return response;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; SOTTO_LOG_LEVEL overrides
    if (!std::getenv("SOTTO_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    std::optional<std::string> endpointArg;
    std::optional<std::string> tokenFile;
    nlohmann::json options = nlohmann::json::object();
    bool wait = false;
    bool asJson = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "--socket" || arg == "--tcp") {
            endpointArg = std::string(needValue());
        } else if (arg == "--token-file") {
            tokenFile = std::string(needValue());
        } else if (arg == "--model") {
            options["model_id"] = needValue();
        } else if (arg == "--language") {
            options["language"] = needValue();
        } else if (arg == "--translate") {
            options["task"] = "translate";
        } else if (arg == "--beam-size") {
            try {
                options["beam_size"] = std::stoi(needValue());
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid beam size\n";
                return 1;
            }
        } else if (arg == "--temperature") {
            try {
                options["temperature"] = std::stod(needValue());
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid temperature\n";
                return 1;
            }
        } else if (arg == "--prompt") {
            options["prompt"] = needValue();
        } else if (arg == "--word-timestamps") {
            options["word_timestamps"] = true;
        } else if (arg == "--no-vad") {
            options["vad_filter"] = false;
        } else if (arg == "--wait" || arg == "-w") {
            wait = true;
        } else if (arg == "--json") {
            asJson = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = positional[0];
    auto needArg = [&](const char* what) -> std::optional<std::string> {
        if (positional.size() < 2) {
            std::cerr << "Error: " << command << " requires " << what << "\n";
            return std::nullopt;
        }
        return positional[1];
    };

    std::optional<Endpoint> endpoint;
    try {
        endpoint = resolveEndpoint(endpointArg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (!endpoint) {
        std::cerr << "Error: No running daemon found (start sottod, or set SOTTO_SOCKET / --socket)\n";
        return 1;
    }
    Client client(*endpoint);

    if (command == "status") {
        auto response = client.status();
        if (isError(response)) return reportError(response);
        std::cout << response.dump(2) << std::endl;
        return 0;
    }

    if (command == "load") {
        auto model = needArg("a model id");
        if (!model) return 1;
        auto response = client.loadModel(*model);
        if (isError(response)) return reportError(response);
        if (response.value("already_loaded", false)) {
            std::cout << response.value("model_id", *model) << " already loaded" << std::endl;
        } else {
            std::cout << "Loaded " << response.value("model_id", *model) << " in "
                      << response.value("load_time", 0.0) << "s" << std::endl;
        }
        return 0;
    }

    if (command == "transcribe") {
        auto audio = needArg("an audio file");
        if (!audio) return 1;
        auto response = client.transcribe(*audio, options);
        if (isError(response)) return reportError(response);
        std::string jobId = response.value("job_id", "");
        if (!wait) {
            // Just the job ID - clean for piping
            std::cout << jobId << std::endl;
            return 0;
        }
        return printJob(jobId, waitWithProgress(client, jobId), asJson);
    }

    if (command == "job") {
        auto jobId = needArg("a job id");
        if (!jobId) return 1;
        return printJob(*jobId, client.jobStatus(*jobId), asJson);
    }

    if (command == "wait") {
        auto jobId = needArg("a job id");
        if (!jobId) return 1;
        return printJob(*jobId, waitWithProgress(client, *jobId), asJson);
    }

    if (command == "cleanup") {
        auto jobId = needArg("a job id");
        if (!jobId) return 1;
        auto response = client.cleanupJob(*jobId);
        if (isError(response)) return reportError(response);
        if (response.value("cancelled", false)) {
            std::cout << "Cancelled " << *jobId << std::endl;
        } else if (response.value("removed", false)) {
            std::cout << "Removed " << *jobId << std::endl;
        } else {
            std::cout << "No such job: " << *jobId << std::endl;
        }
        return 0;
    }

    if (command == "stop") {
        auto token = readToken(tokenFile, *endpoint);
        if (!token) return 1;
        auto response = client.shutdown(*token);
        if (isError(response)) return reportError(response);
        std::cout << "Daemon stopping" << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown command: " << command << "\n\n";
    printUsage(argv[0]);
    return 1;
}
