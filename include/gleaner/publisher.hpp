/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "gleaner/job.hpp"
#include "gleaner/types.hpp"

namespace gleaner {

// Push channel towards the submitting client.
class ProgressPublisher {
public:
    virtual ~ProgressPublisher() = default;

    // Best effort: false when the event could not be delivered.
    virtual bool publish(EventKind kind, const JobSnapshot& snapshot,
                         const std::string& clientId) noexcept = 0;
};

}
