#include <rdf_sync/sparql/sparql_client.hpp>

#include <rdf_sync/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace rdf_sync {

namespace {

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    return IEquals(key, "authorization") || IEquals(key, "cookie") ||
           IEquals(key, "set-cookie");
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const httplib::Headers& hdrs,
                 const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status) + " (" +
                        std::to_string(body.size()) + " bytes)");
    for (const auto& [k, v] : hdrs) {
        if (IEquals(k, "content-type")) {
            LogDebug("http", "  < " + k + ": " + v);
        }
    }
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

std::string FindHeader(const HttpHeaders& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (IEquals(key, name)) {
            return value;
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// Impl - pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct SparqlClient::Impl {
    std::unique_ptr<httplib::Client> client;
    EndpointUrl endpoint;
    std::string endpoint_string;
    SparqlClientOptions options;

    Impl(const EndpointUrl& url, const SparqlClientOptions& opts)
        : endpoint(url), endpoint_string(url.ToString()), options(opts) {
        client = std::make_unique<httplib::Client>(url.Origin());
        client->set_connection_timeout(opts.connect_timeout);
        client->set_follow_location(true);

        if (opts.user.has_value()) {
            client->set_basic_auth(*opts.user, opts.password.value_or(""));
        }
        if (url.use_https && opts.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
    }

    httplib::Headers BuildHeaders(std::string_view accept) const {
        httplib::Headers hdrs;
        hdrs.emplace("Accept", std::string(accept));
        hdrs.emplace("User-Agent", options.user_agent);
        return hdrs;
    }

    Error TransportError(const std::string& operation, httplib::Error error,
                         std::chrono::seconds timeout) const {
        auto category = CategoryFromHttpTransportError(error);
        std::string message = "HTTP request failed: " + httplib::to_string(error);
        if (category == ErrorCategory::Timeout) {
            message += " (timeout " + std::to_string(timeout.count()) + "s)";
        }
        return Error{operation, endpoint_string, std::nullopt, message,
                     std::nullopt, category};
    }

    Result<HttpResponse, Error> DoGet(const std::string& encoded_query,
                                      std::string_view accept,
                                      std::chrono::seconds timeout) {
        auto hdrs = BuildHeaders(accept);
        const std::string path = endpoint.path + "?query=" + encoded_query;
        LogInfo("http", "GET " + endpoint_string + " (" +
                            std::to_string(encoded_query.size()) + " byte query)");
        LogRequestHeaders(hdrs);

        client->set_read_timeout(timeout);
        auto res = client->Get(path, hdrs);
        if (!res) {
            return Result<HttpResponse, Error>::Err(
                TransportError("Get", res.error(), timeout));
        }
        LogResponse(res->status, res->headers, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<HttpResponse, Error> DoPost(const std::string& encoded_query,
                                       std::string_view accept,
                                       std::chrono::seconds timeout) {
        auto hdrs = BuildHeaders(accept);
        LogInfo("http", "POST " + endpoint_string + " (" +
                            std::to_string(encoded_query.size()) + " byte query)");
        LogRequestHeaders(hdrs);

        client->set_read_timeout(timeout);
        auto res = client->Post(endpoint.path, hdrs, "query=" + encoded_query,
                                "application/x-www-form-urlencoded");
        if (!res) {
            return Result<HttpResponse, Error>::Err(
                TransportError("Post", res.error(), timeout));
        }
        LogResponse(res->status, res->headers, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

SparqlClient::SparqlClient(const EndpointUrl& endpoint,
                           const SparqlClientOptions& options)
    : impl_(std::make_unique<Impl>(endpoint, options)) {}

SparqlClient::~SparqlClient() = default;

Result<HttpResponse, Error> SparqlClient::Query(std::string_view query,
                                                std::string_view accept,
                                                std::chrono::seconds timeout) {
    const std::string encoded = UrlEncode(query);
    if (impl_->options.use_post ||
        encoded.size() > impl_->options.max_get_query_length) {
        return impl_->DoPost(encoded, accept, timeout);
    }
    return impl_->DoGet(encoded, accept, timeout);
}

const std::string& SparqlClient::Endpoint() const {
    return impl_->endpoint_string;
}

} // namespace rdf_sync
