/**
 * @file TestDoubles.hpp
 * @brief In-process stand-ins for the remote collaborators, shared by the tests.
 */

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "domain/Catalog.hpp"
#include "domain/DescriptionService.hpp"
#include "domain/Errors.hpp"
#include "domain/FileStore.hpp"
#include "domain/LiveCatalogService.hpp"
#include "domain/RecognitionService.hpp"
#include "domain/SeriesRegistry.hpp"

namespace coversync::test {

/** Runs each call on its own thread so the caller can stop waiting. Joined on destruction. */
class AsyncRunner {
public:
    ~AsyncRunner() {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            threads.swap(m_threads);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    template <typename T>
    std::future<T> run(std::function<T()> fn) {
        auto promise = std::make_shared<std::promise<T>>();
        auto future = promise->get_future();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_threads.emplace_back([promise, fn]() {
            try {
                promise->set_value(fn());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        return future;
    }

private:
    std::mutex m_mutex;
    std::vector<std::thread> m_threads;
};

class FakeRecognition : public domain::RecognitionService {
public:
    using Handler = std::function<domain::RecognitionResult(const domain::RecognitionRequest&)>;

    explicit FakeRecognition(Handler handler) : m_handler(std::move(handler)) {}

    std::future<domain::RecognitionResult> recognizeAsync(const domain::RecognitionRequest& request) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            hints.push_back(request.seriesNameHint.value_or(""));
            m_lastToken = request.cancelled;
        }
        auto handler = m_handler;
        return m_runner.run<domain::RecognitionResult>([handler, request]() { return handler(request); });
    }

    domain::CancellationToken lastToken() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastToken;
    }

    std::atomic<int> calls{0};
    std::vector<std::string> hints;

private:
    Handler m_handler;
    std::mutex m_mutex;
    domain::CancellationToken m_lastToken;
    AsyncRunner m_runner;
};

class FakeLiveCatalog : public domain::LiveCatalogService {
public:
    std::future<std::vector<domain::LiveSeriesHit>> searchSeriesAsync(const std::string& name, int year) override {
        ++calls;
        std::promise<std::vector<domain::LiveSeriesHit>> promise;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (failure) {
            promise.set_exception(failure);
        } else {
            auto it = hits.find({name, year});
            promise.set_value(it != hits.end() ? it->second : std::vector<domain::LiveSeriesHit>{});
        }
        return promise.get_future();
    }

    std::map<std::pair<std::string, int>, std::vector<domain::LiveSeriesHit>> hits;
    std::exception_ptr failure;
    std::atomic<int> calls{0};

private:
    std::mutex m_mutex;
};

class FakeMirror : public domain::CatalogRepository {
public:
    std::vector<domain::CatalogSeries> findSeriesExact(const std::string& name, int yearBegan,
                                                       int issueCount) override {
        std::vector<domain::CatalogSeries> rows;
        for (const auto& s : series) {
            if (Lower(s.name) == Lower(name) && s.yearBegan == yearBegan && s.issueCount == issueCount) {
                rows.push_back(s);
            }
        }
        return rows;
    }

    std::vector<domain::CatalogIssue> findActiveIssues(std::int64_t seriesId) override {
        std::vector<domain::CatalogIssue> result;
        for (const auto& issue : issues) {
            if (issue.seriesId == seriesId && issue.active) result.push_back(issue);
        }
        return result;
    }

    std::vector<domain::CatalogSeries> series;
    std::vector<domain::CatalogIssue> issues;

private:
    static std::string Lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }
};

class FakeRegistry : public domain::SeriesRegistry {
public:
    std::optional<std::string> seriesName(std::int64_t seriesId) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = names.find(seriesId);
        if (it == names.end()) return std::nullopt;
        return it->second;
    }

    void recordIdentifiers(std::int64_t seriesId, const std::vector<std::string>& mirrorIds,
                           const std::vector<std::string>& catalogIds) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& ids = m_ids[seriesId];
        ids.mirrorIds.insert(mirrorIds.begin(), mirrorIds.end());
        ids.catalogIds.insert(catalogIds.begin(), catalogIds.end());
    }

    domain::SeriesIdentifiers identifiers(std::int64_t seriesId) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_ids.find(seriesId);
        return it == m_ids.end() ? domain::SeriesIdentifiers{} : it->second;
    }

    void recordDescription(std::int64_t seriesId, const std::string& description) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        descriptions[seriesId] = description;
    }

    std::map<std::int64_t, std::string> names;
    std::map<std::int64_t, std::string> descriptions;

private:
    mutable std::mutex m_mutex;
    std::map<std::int64_t, domain::SeriesIdentifiers> m_ids;
};

class FakeFileStore : public domain::FileStore {
public:
    std::future<std::shared_ptr<const std::string>> fetchAsync(const std::string& remotePath,
                                                               domain::CancellationToken) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::promise<std::shared_ptr<const std::string>> promise;
        auto it = files.find(remotePath);
        if (it == files.end()) {
            promise.set_exception(std::make_exception_ptr(std::runtime_error("not found: " + remotePath)));
        } else {
            promise.set_value(std::make_shared<const std::string>(it->second));
        }
        return promise.get_future();
    }

    std::future<void> storeAsync(const std::string& remotePath, std::shared_ptr<const std::string> content,
                                 domain::CancellationToken) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::promise<void> promise;
        if (failStores) {
            promise.set_exception(std::make_exception_ptr(domain::GatewayError(
                domain::GatewayError::Kind::Unauthorized, "files", "store rejected")));
        } else {
            files[remotePath] = *content;
            promise.set_value();
        }
        return promise.get_future();
    }

    std::string stored(const std::string& remotePath) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = files.find(remotePath);
        return it == files.end() ? std::string() : it->second;
    }

    std::map<std::string, std::string> files;
    bool failStores = false;

private:
    std::mutex m_mutex;
};

class FakeDescriptions : public domain::DescriptionService {
public:
    std::future<std::optional<std::string>> describeSeriesAsync(const std::string& seriesName,
                                                                 int yearBegan) override {
        std::promise<std::optional<std::string>> promise;
        promise.set_value(seriesName + " began in " + std::to_string(yearBegan) + ".");
        return promise.get_future();
    }
};

} // namespace coversync::test
