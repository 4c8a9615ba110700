/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace sotto {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed JSON, unknown command, missing or mistyped field.
class ProtocolError : public Error {
public:
    using Error::Error;
};

// Model could not be made resident. The service is left with no model loaded.
class ModelLoadError : public Error {
public:
    using Error::Error;
};

class NoModelLoaded : public Error {
public:
    NoModelLoaded() : Error("No model loaded. Load a model first.") {}
};

// Engine failure during inference; recorded on the job, never fatal.
class TranscriptionError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

// Bind/accept/connect failures and broken connections.
class TransportError : public Error {
public:
    using Error::Error;
};

} // namespace sotto
