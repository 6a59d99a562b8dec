/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/session.hpp"
#include "gleaner/logger.hpp"

namespace gleaner {

std::optional<Element> PageSession::findFirst(const std::vector<std::string>& candidates) {
    for (const auto& selector : candidates) {
        if (auto element = find(selector)) {
            LOG_TRACE("Selector matched: " + selector);
            return element;
        }
    }
    return std::nullopt;
}

std::vector<Element> PageSession::findAllFirst(const std::vector<std::string>& candidates) {
    for (const auto& selector : candidates) {
        auto elements = findAll(selector);
        if (!elements.empty()) {
            LOG_TRACE("Selector matched " + std::to_string(elements.size()) + " elements: " + selector);
            return elements;
        }
    }
    return {};
}

ScopedSession::ScopedSession(std::unique_ptr<PageSession> session) noexcept
    : session_(std::move(session)) {}

ScopedSession::~ScopedSession() {
    release();
}

void ScopedSession::release() noexcept {
    if (!session_) {
        return;
    }
    session_->close();
    session_.reset();
    LOG_DEBUG("Page session closed");
}

}
