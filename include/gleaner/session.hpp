/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gleaner {

// Element located by a session query. The handle is only meaningful to the
// session that produced it.
struct Element {
    std::string handle;
    std::string text;
};

/**
 * Browsing capability bound to one remote document at a time.
 *
 * Implementations are heavyweight (a browser process or remote driver) and are
 * used by a single worker thread for the whole run of one job. A selector that
 * matches nothing is not an error: find() returns std::nullopt and findAll()
 * an empty vector.
 */
class PageSession {
public:
    virtual ~PageSession() = default;

    [[nodiscard]] virtual bool navigate(const std::string& url) = 0;
    [[nodiscard]] virtual std::string title() = 0;

    [[nodiscard]] virtual std::optional<Element> find(const std::string& selector) = 0;
    [[nodiscard]] virtual std::vector<Element> findAll(const std::string& selector) = 0;
    [[nodiscard]] virtual std::optional<Element> findWithin(const Element& parent,
                                                            const std::string& selector) = 0;
    [[nodiscard]] virtual std::optional<std::string> attribute(const Element& element,
                                                               const std::string& name) = 0;

    virtual bool click(const Element& element) = 0;
    virtual bool waitUntil(const std::function<bool()>& predicate,
                           std::chrono::milliseconds timeout) = 0;

    // Idempotent teardown
    virtual void close() noexcept = 0;

    // First candidate that matches anything.
    [[nodiscard]] std::optional<Element> findFirst(const std::vector<std::string>& candidates);
    // Matches of the first candidate that yields a non-empty result.
    [[nodiscard]] std::vector<Element> findAllFirst(const std::vector<std::string>& candidates);
};

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    // Throws SessionInitError when no session can be acquired.
    [[nodiscard]] virtual std::unique_ptr<PageSession> open() = 0;
};

// Owns an open session and closes it on every exit path.
class ScopedSession final {
public:
    explicit ScopedSession(std::unique_ptr<PageSession> session) noexcept;
    ~ScopedSession();

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;
    ScopedSession(ScopedSession&&) = delete;
    ScopedSession& operator=(ScopedSession&&) = delete;

    [[nodiscard]] PageSession& operator*() const noexcept { return *session_; }
    [[nodiscard]] PageSession* operator->() const noexcept { return session_.get(); }

    void release() noexcept;

private:
    std::unique_ptr<PageSession> session_;
};

}
