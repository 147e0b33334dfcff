#pragma once

#include <rdf_sync/sparql/i_sparql_client.hpp>

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace rdf_sync {
namespace testing {

// ---------------------------------------------------------------------------
// MockSparqlClient - hand-written mock for offline unit testing.
//
// Usage:
//   MockSparqlClient mock("https://stardog.example/query");
//   mock.Enqueue(NTriples("<urn:s> <urn:p> \"o\" ."));
//   auto graph = ExecuteConstructQuery(mock, "CONSTRUCT ...", ...);
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].accept == "application/n-triples");
//
// Responses are consumed FIFO. If the queue is empty when Query is called,
// the mock returns a descriptive error rather than crashing. Query may be
// called from a discovery thread, so the queue is guarded.
// ---------------------------------------------------------------------------

struct QueryCall {
    std::string query;
    std::string accept;
    std::chrono::seconds timeout;
};

class MockSparqlClient : public ISparqlClient {
public:
    explicit MockSparqlClient(std::string endpoint = "https://mock.example/query")
        : endpoint_(std::move(endpoint)) {}

    // -- Enqueue canned responses -------------------------------------------

    void Enqueue(Result<HttpResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    // -- ISparqlClient ------------------------------------------------------

    [[nodiscard]] Result<HttpResponse, Error> Query(
        std::string_view query,
        std::string_view accept,
        std::chrono::seconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(QueryCall{std::string(query), std::string(accept), timeout});
        if (responses_.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                "MockSparqlClient::Query", endpoint_, std::nullopt,
                "No more enqueued responses for query: " + std::string(query),
                std::nullopt});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    [[nodiscard]] const std::string& Endpoint() const override { return endpoint_; }

    // -- Inspection ---------------------------------------------------------

    [[nodiscard]] size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }
    [[nodiscard]] std::vector<QueryCall> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    [[nodiscard]] size_t Pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return responses_.size();
    }

private:
    std::string endpoint_;
    mutable std::mutex mutex_;
    std::deque<Result<HttpResponse, Error>> responses_;
    std::vector<QueryCall> calls_;
};

// -- Response helpers -------------------------------------------------------

inline Result<HttpResponse, Error> NTriples(const std::string& body) {
    return Result<HttpResponse, Error>::Ok(
        HttpResponse{200, {{"Content-Type", "application/n-triples"}}, body});
}

inline Result<HttpResponse, Error> Turtle(const std::string& body) {
    return Result<HttpResponse, Error>::Ok(
        HttpResponse{200, {{"Content-Type", "text/turtle; charset=utf-8"}}, body});
}

// SPARQL JSON results with one variable "item" bound to each IRI.
inline Result<HttpResponse, Error> ItemsJson(const std::vector<std::string>& iris) {
    std::string body = R"({"head":{"vars":["item"]},"results":{"bindings":[)";
    for (size_t i = 0; i < iris.size(); ++i) {
        if (i > 0) body += ",";
        body += R"({"item":{"type":"uri","value":")" + iris[i] + R"("}})";
    }
    body += "]}}";
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        200, {{"Content-Type", "application/sparql-results+json"}}, body});
}

inline Result<HttpResponse, Error> HttpStatus(int status, const std::string& body = "") {
    return Result<HttpResponse, Error>::Ok(
        HttpResponse{status, {{"Content-Type", "text/plain"}}, body});
}

inline Result<HttpResponse, Error> TransportError(ErrorCategory category,
                                                  const std::string& message) {
    return Result<HttpResponse, Error>::Err(Error{
        "SparqlClient::Query", "https://mock.example/query", std::nullopt, message,
        std::nullopt, category});
}

} // namespace testing
} // namespace rdf_sync
