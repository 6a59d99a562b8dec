/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "gleaner/errors.hpp"
#include "gleaner/publisher.hpp"
#include "gleaner/session.hpp"

namespace gleaner::fakes {

// Holds navigation to one URL until opened.
class Gate {
public:
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    void pass() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    // True once some session is blocked on (or went through) the gate.
    bool waitEntered(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    bool entered_ = false;
};

struct FakeNode {
    std::string text;
    std::map<std::string, std::string> attributes;
    std::map<std::string, std::string> children;   // selector -> handle
};

// Static document. Every session navigating here works on its own copy.
struct FakePage {
    std::string title;
    std::map<std::string, FakeNode> nodes;                       // handle -> node
    std::map<std::string, std::vector<std::string>> matches;     // selector -> handles
    std::vector<std::vector<std::string>> moreRows;              // revealed per show-more click
    std::string rowSelector = ".gsc_a_tr";
    bool throwOnQuery = false;

    std::string node(const std::string& text, std::map<std::string, std::string> attributes = {}) {
        std::string handle = "n" + std::to_string(nodes.size());
        nodes[handle] = FakeNode{text, std::move(attributes), {}};
        return handle;
    }

    std::string add(const std::string& selector, const std::string& text,
                    std::map<std::string, std::string> attributes = {}) {
        std::string handle = node(text, std::move(attributes));
        matches[selector].push_back(handle);
        return handle;
    }

    void addChild(const std::string& parent, const std::string& selector, const std::string& text,
                  std::map<std::string, std::string> attributes = {}) {
        std::string handle = node(text, std::move(attributes));
        nodes[parent].children[selector] = handle;
    }

    std::string linkRow(const std::string& href) {
        std::string row = node("row");
        addChild(row, "a.gsc_a_at", "item", {{"href", href}});
        return row;
    }
};

inline FakePage subjectPage(const std::string& name, const std::vector<std::string>& itemUrls) {
    FakePage page;
    page.title = name + " - Google Scholar";
    if (!name.empty()) {
        page.add("#gsc_prf_in", name);
    }
    for (const auto& url : itemUrls) {
        page.matches[page.rowSelector].push_back(page.linkRow(url));
    }
    return page;
}

inline FakePage itemPage(const std::string& title,
                         const std::string& byline = "A Smith, B Jones - Nature, 2019 - nature.com",
                         const std::string& citations = "Cited by 42") {
    FakePage page;
    page.title = title;
    page.add(".gs_rt a", title);
    if (!byline.empty()) {
        page.add(".gs_a", byline);
    }
    if (!citations.empty()) {
        page.add(".gs_fl a[href*='cites']", citations);
    }
    page.add("a[href*='.pdf']", "[PDF]", {{"href", "https://files.example.org/paper.pdf"}});
    page.add(".gs_rs", "A study of how scrape jobs behave when run by a bounded pool.");
    return page;
}

// Pages by URL, shared by every session a factory opens.
class FakeSite {
public:
    void put(const std::string& url, FakePage page) {
        std::lock_guard<std::mutex> lock(mutex_);
        pages_[url] = std::move(page);
    }

    std::shared_ptr<Gate> gate(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& gate = gates_[url];
        if (!gate) {
            gate = std::make_shared<Gate>();
        }
        return gate;
    }

    bool load(const std::string& url, FakePage& out) {
        std::shared_ptr<Gate> gate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = gates_.find(url);
            if (it != gates_.end()) {
                gate = it->second;
            }
        }
        if (gate) {
            gate->pass();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pages_.find(url);
        if (it == pages_.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

private:
    std::mutex mutex_;
    std::map<std::string, FakePage> pages_;
    std::map<std::string, std::shared_ptr<Gate>> gates_;
};

struct SessionCounters {
    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::atomic<int> live{0};
    std::atomic<int> maxLive{0};
};

class FakeSession : public PageSession {
public:
    FakeSession(FakeSite& site, SessionCounters& counters) : site_(site), counters_(counters) {}

    bool navigate(const std::string& url) override {
        FakePage page;
        if (!site_.load(url, page)) {
            return false;
        }
        page_ = std::move(page);
        return true;
    }

    std::string title() override { return page_.title; }

    std::optional<Element> find(const std::string& selector) override {
        auto all = findAll(selector);
        if (all.empty()) {
            return std::nullopt;
        }
        return all.front();
    }

    std::vector<Element> findAll(const std::string& selector) override {
        check();
        std::vector<Element> out;
        if (selector == kShowMore && !page_.moreRows.empty()) {
            out.push_back(Element{kShowMore, "Show more"});
            return out;
        }
        auto it = page_.matches.find(selector);
        if (it == page_.matches.end()) {
            return out;
        }
        for (const auto& handle : it->second) {
            out.push_back(Element{handle, page_.nodes[handle].text});
        }
        return out;
    }

    std::optional<Element> findWithin(const Element& parent, const std::string& selector) override {
        check();
        auto node = page_.nodes.find(parent.handle);
        if (node == page_.nodes.end()) {
            return std::nullopt;
        }
        auto child = node->second.children.find(selector);
        if (child == node->second.children.end()) {
            return std::nullopt;
        }
        return Element{child->second, page_.nodes[child->second].text};
    }

    std::optional<std::string> attribute(const Element& element, const std::string& name) override {
        auto node = page_.nodes.find(element.handle);
        if (node == page_.nodes.end()) {
            return std::nullopt;
        }
        auto attr = node->second.attributes.find(name);
        if (attr == node->second.attributes.end()) {
            return std::nullopt;
        }
        return attr->second;
    }

    bool click(const Element& element) override {
        ++clicks;
        if (element.handle == kShowMore && !page_.moreRows.empty()) {
            auto& rows = page_.matches[page_.rowSelector];
            rows.insert(rows.end(), page_.moreRows.front().begin(), page_.moreRows.front().end());
            page_.moreRows.erase(page_.moreRows.begin());
        }
        return true;
    }

    bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds) override {
        return predicate();
    }

    void close() noexcept override {
        if (closed_) {
            return;
        }
        closed_ = true;
        ++counters_.closed;
        --counters_.live;
    }

    int clicks = 0;

private:
    static constexpr const char* kShowMore = "#gsc_bpf_more";

    void check() const {
        if (page_.throwOnQuery) {
            throw std::runtime_error("stale element");
        }
    }

    FakeSite& site_;
    SessionCounters& counters_;
    FakePage page_;
    bool closed_ = false;
};

class FakeSessionFactory : public SessionFactory {
public:
    explicit FakeSessionFactory(FakeSite& site) : site_(site) {}

    std::unique_ptr<PageSession> open() override {
        if (failOpen) {
            throw SessionInitError("browser unavailable");
        }
        return openFake();
    }

    std::unique_ptr<FakeSession> openFake() {
        ++counters.opened;
        int live = ++counters.live;
        int seen = counters.maxLive.load();
        while (live > seen && !counters.maxLive.compare_exchange_weak(seen, live)) {
        }
        return std::make_unique<FakeSession>(site_, counters);
    }

    std::atomic<bool> failOpen{false};
    SessionCounters counters;

private:
    FakeSite& site_;
};

struct PublishedEvent {
    EventKind kind;
    JobSnapshot snapshot;
    std::string clientId;
};

class RecordingPublisher : public ProgressPublisher {
public:
    bool publish(EventKind kind, const JobSnapshot& snapshot,
                 const std::string& clientId) noexcept override {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(PublishedEvent{kind, snapshot, clientId});
        } catch (const std::exception&) {
            return false;
        }
        return !fail.load();
    }

    std::vector<PublishedEvent> eventsFor(const JobId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PublishedEvent> out;
        for (const auto& event : events_) {
            if (event.snapshot.id == id) {
                out.push_back(event);
            }
        }
        return out;
    }

    std::atomic<bool> fail{false};

private:
    mutable std::mutex mutex_;
    std::vector<PublishedEvent> events_;
};

}
