#include <rdf_sync/core/result.hpp>

#include <cctype>

namespace rdf_sync {

namespace {

constexpr size_t kMaxServerErrorLength = 300;

std::string Trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

// Extract the string value of a top-level "message" key from a JSON error
// body (Stardog style: {"code":"QE0PE2","message":"..."}).
// No JSON library here - core/ must not depend on sparql/ libraries.
std::optional<std::string> ExtractJsonMessage(const std::string& body) {
    auto key_pos = body.find("\"message\"");
    if (key_pos == std::string::npos) return std::nullopt;
    auto colon = body.find(':', key_pos + 9);
    if (colon == std::string::npos) return std::nullopt;
    auto quote = body.find('"', colon + 1);
    if (quote == std::string::npos) return std::nullopt;

    std::string value;
    for (size_t i = quote + 1; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            char next = body[++i];
            switch (next) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                default:  value += next; break;
            }
            continue;
        }
        if (c == '"') {
            if (value.empty()) return std::nullopt;
            return value;
        }
        value += c;
    }
    return std::nullopt;
}

// Extract text content of the first occurrence of an XML element by tag name.
std::optional<std::string> ExtractXmlMessage(const std::string& body,
                                              const std::string& tag_name) {
    const std::string open_prefix = "<" + tag_name;
    auto tag_pos = body.find(open_prefix);
    if (tag_pos == std::string::npos) return std::nullopt;

    const size_t after_prefix = tag_pos + open_prefix.size();
    if (after_prefix >= body.size()) return std::nullopt;
    const char next = body[after_prefix];
    if (next != '>' && next != ' ' && next != '\t' && next != '\n' &&
        next != '\r' && next != '/') {
        return std::nullopt;
    }

    auto content_start = body.find('>', after_prefix);
    if (content_start == std::string::npos) return std::nullopt;
    ++content_start;

    const std::string close_tag = "</" + tag_name + ">";
    auto content_end = body.find(close_tag, content_start);
    if (content_end == std::string::npos) return std::nullopt;

    auto msg = Trim(body.substr(content_start, content_end - content_start));
    if (msg.empty()) return std::nullopt;
    return msg;
}

// Try to extract a human-readable error message from a SPARQL endpoint
// response body. Endpoints use several shapes:
//   {"message": "..."}     - Stardog JSON errors
//   <message>...</message> - XML error documents
//   <title>...</title>     - HTML error pages from proxies
//   plain text             - GraphDB / RDF4J MalformedQueryException text
std::optional<std::string> ExtractServerError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto trimmed = Trim(body);
    if (!trimmed.empty() && trimmed.front() == '{') {
        return ExtractJsonMessage(trimmed);
    }
    if (!trimmed.empty() && trimmed.front() == '<') {
        auto msg = ExtractXmlMessage(trimmed, "message");
        if (msg.has_value()) return msg;
        return ExtractXmlMessage(trimmed, "title");
    }

    auto first_line = trimmed.substr(0, trimmed.find('\n'));
    if (first_line.empty()) return std::nullopt;
    if (first_line.size() > kMaxServerErrorLength) {
        first_line = first_line.substr(0, kMaxServerErrorLength) + "...";
    }
    return first_line;
}

void JsonEscape(std::ostringstream& out, const std::string& s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:   out << c;      break;
        }
    }
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto server_error = ExtractServerError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Http;
            message = "Bad request - the endpoint rejected the query";
            break;
        case 401:
        case 403:
            category = ErrorCategory::Authentication;
            message = "Access denied - check endpoint credentials";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Endpoint not found";
            break;
        case 406:
            category = ErrorCategory::Http;
            message = "Endpoint cannot produce the requested format";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Query timed out on the endpoint";
            break;
        case 429:
            category = ErrorCategory::Http;
            message = "Too many requests";
            break;
        case 500:
            category = ErrorCategory::Http;
            message = "Endpoint internal error";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Connection;
            message = "Endpoint unavailable";
            break;
        default:
            category = ErrorCategory::Http;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, server_error, category};
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")";
    JsonEscape(oss, operation);
    oss << R"(",)";
    if (!endpoint.empty()) {
        oss << R"("endpoint":")";
        JsonEscape(oss, endpoint);
        oss << R"(",)";
    }
    if (http_status.has_value()) {
        oss << R"("http_status":)" << *http_status << R"(,)";
    }
    oss << R"("message":")";
    JsonEscape(oss, message);
    oss << R"(",)";
    if (server_error.has_value() && !server_error->empty()) {
        oss << R"("server_error":")";
        JsonEscape(oss, *server_error);
        oss << R"(",)";
    }
    oss << R"("exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace rdf_sync
