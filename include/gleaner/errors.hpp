/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace gleaner {

// Page session could not be acquired. Terminal for the job.
class SessionInitError : public std::runtime_error {
public:
    explicit SessionInitError(const std::string& what) : std::runtime_error(what) {}
};

// Subject identity or item URLs could not be discovered. Terminal for the job.
class DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& what) : std::runtime_error(what) {}
};

}
