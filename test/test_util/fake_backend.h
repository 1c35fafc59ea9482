#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <gmock/gmock.h>

#include "querygen/client/backend_client.h"
#include "querygen/metrics/metrics_sink.h"

namespace querygen {
namespace test {

/**
 * @brief Behaviour shared by every FakeBackendClient of one factory
 */
struct BackendScript {
    using Responder = std::function<core::Result<client::SearchResponse>(const client::SearchRequest&)>;

    std::mutex mutex;
    std::vector<client::SearchRequest> requests;
    Responder respond = [](const client::SearchRequest&) {
        client::SearchResponse response;
        response.status = 200;
        response.body = R"({"traces": []})";
        return core::Result<client::SearchResponse>(std::move(response));
    };
    bool hang = false;                 // block each Search until Cancel()
    std::atomic<int> clients_created{0};
    std::atomic<int> cancels{0};

    size_t request_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }
};

class FakeBackendClient : public client::BackendClient {
public:
    explicit FakeBackendClient(std::shared_ptr<BackendScript> script)
        : script_(std::move(script)) {}

    core::Result<client::SearchResponse> Search(const client::SearchRequest& request) override {
        BackendScript::Responder respond;
        bool hang;
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            script_->requests.push_back(request);
            respond = script_->respond;
            hang = script_->hang;
        }
        if (hang) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return cancelled_; });
            return core::Result<client::SearchResponse>::error("error making http request: Canceled");
        }
        return respond(request);
    }

    void Cancel() override {
        script_->cancels++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    std::string Describe(const client::SearchRequest& request) const override {
        return "GET fake?q=" + request.expression;
    }

private:
    std::shared_ptr<BackendScript> script_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

inline client::ClientFactory FakeFactory(std::shared_ptr<BackendScript> script) {
    return [script]() -> std::unique_ptr<client::BackendClient> {
        script->clients_created++;
        return std::make_unique<FakeBackendClient>(script);
    };
}

class MockBackendClient : public client::BackendClient {
public:
    MOCK_METHOD(core::Result<client::SearchResponse>, Search, (const client::SearchRequest&), (override));
    MOCK_METHOD(void, Cancel, (), (override));
    MOCK_METHOD(std::string, Describe, (const client::SearchRequest&), (const, override));
};

/**
 * @brief Sink that keeps every outcome
 */
class RecordingSink : public metrics::MetricsSink {
public:
    void Record(const core::Outcome& outcome) override {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(outcome);
    }

    std::vector<core::Outcome> outcomes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::Outcome> outcomes_;
};

inline core::Result<client::SearchResponse> Respond(int status, std::string body) {
    client::SearchResponse response;
    response.status = status;
    response.body = std::move(body);
    return core::Result<client::SearchResponse>(std::move(response));
}

} // namespace test
} // namespace querygen
