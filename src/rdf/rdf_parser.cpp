#include <rdf_sync/rdf/rdf_parser.hpp>

#include <rdf_sync/core/log.hpp>
#include <rdf_sync/rdf/literal_normalizer.hpp>

#include <raptor2.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace rdf_sync {

namespace {

constexpr const char* kDefaultBaseIri = "urn:x-rdf-sync:base";

const char* RaptorSyntaxName(RdfFormat format) {
    switch (format) {
        case RdfFormat::NTriples: return "ntriples";
        case RdfFormat::Turtle:   return "turtle";
    }
    return "ntriples";
}

const char* FormatName(RdfFormat format) {
    switch (format) {
        case RdfFormat::NTriples: return "N-Triples";
        case RdfFormat::Turtle:   return "Turtle";
    }
    return "RDF";
}

std::string ToString(const unsigned char* data, size_t len) {
    if (data == nullptr) return {};
    return std::string(reinterpret_cast<const char*>(data), len);
}

std::string UriString(raptor_uri* uri) {
    if (uri == nullptr) return {};
    size_t len = 0;
    const unsigned char* s = raptor_uri_as_counted_string(uri, &len);
    return ToString(s, len);
}

Term ConvertTerm(const raptor_term* term) {
    switch (term->type) {
        case RAPTOR_TERM_TYPE_URI:
            return Iri{UriString(term->value.uri)};
        case RAPTOR_TERM_TYPE_BLANK:
            return BlankNode{ToString(term->value.blank.string,
                                      term->value.blank.string_len)};
        case RAPTOR_TERM_TYPE_LITERAL: {
            const auto& lit = term->value.literal;
            return NormalizeLiteral(MakeLiteral(
                ToString(lit.string, lit.string_len),
                ToString(lit.language, lit.language_len),
                UriString(lit.datatype)));
        }
        case RAPTOR_TERM_TYPE_UNKNOWN:
        default:
            break;
    }
    // Unknown terms become a literal placeholder that MakeTriple rejects in
    // subject and predicate position.
    return Literal{"", "", ""};
}

// State shared with the raptor callbacks for one parse.
struct ParseContext {
    Graph graph;
    std::optional<std::string> first_error;
    size_t statements = 0;
};

void HandleStatement(void* user_data, raptor_statement* statement) {
    auto* ctx = static_cast<ParseContext*>(user_data);
    ++ctx->statements;
    if (ctx->first_error.has_value()) {
        return;
    }
    auto triple = MakeTriple(ConvertTerm(statement->subject),
                             ConvertTerm(statement->predicate),
                             ConvertTerm(statement->object));
    if (triple.IsErr()) {
        ctx->first_error = triple.Error().message;
        return;
    }
    ctx->graph.Insert(std::move(triple).Value());
}

void HandleLog(void* user_data, raptor_log_message* message) {
    auto* ctx = static_cast<ParseContext*>(user_data);
    const std::string text = message->text ? message->text : "unknown error";
    if (message->level < RAPTOR_LOG_LEVEL_ERROR) {
        LogDebug("parser", "raptor: " + text);
        return;
    }
    if (ctx->first_error.has_value()) {
        return;
    }
    std::string located = text;
    if (message->locator != nullptr && message->locator->line > 0) {
        located = "line " + std::to_string(message->locator->line) + ": " + text;
    }
    ctx->first_error = located;
}

// Owns the raptor world, parser and base URI for the duration of one parse.
class RaptorSession {
public:
    RaptorSession(ParseContext& ctx, RdfFormat format, const std::string& base) {
        world_ = raptor_new_world();
        if (world_ == nullptr) return;
        raptor_world_set_log_handler(world_, &ctx, HandleLog);
        if (raptor_world_open(world_) != 0) return;
        parser_ = raptor_new_parser(world_, RaptorSyntaxName(format));
        if (parser_ == nullptr) return;
        raptor_parser_set_statement_handler(parser_, &ctx, HandleStatement);
        base_ = raptor_new_uri(world_,
                               reinterpret_cast<const unsigned char*>(base.c_str()));
    }
    ~RaptorSession() {
        if (base_ != nullptr) raptor_free_uri(base_);
        if (parser_ != nullptr) raptor_free_parser(parser_);
        if (world_ != nullptr) raptor_free_world(world_);
    }

    RaptorSession(const RaptorSession&) = delete;
    RaptorSession& operator=(const RaptorSession&) = delete;

    [[nodiscard]] bool Ready() const {
        return world_ != nullptr && parser_ != nullptr && base_ != nullptr;
    }

    // Returns raptor's status: 0 on success.
    int Parse(std::string_view document) {
        if (raptor_parser_parse_start(parser_, base_) != 0) {
            return -1;
        }
        return raptor_parser_parse_chunk(
            parser_, reinterpret_cast<const unsigned char*>(document.data()),
            document.size(), 1);
    }

private:
    raptor_world* world_ = nullptr;
    raptor_parser* parser_ = nullptr;
    raptor_uri* base_ = nullptr;
};

bool IsBlankDocument(std::string_view document) {
    return std::all_of(document.begin(), document.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

} // anonymous namespace

const char* RdfFormatMimeType(RdfFormat format) {
    switch (format) {
        case RdfFormat::NTriples: return "application/n-triples";
        case RdfFormat::Turtle:   return "text/turtle";
    }
    return "application/n-triples";
}

std::optional<RdfFormat> RdfFormatFromContentType(std::string_view content_type) {
    auto semicolon = content_type.find(';');
    std::string mime(content_type.substr(0, semicolon));
    mime.erase(std::remove_if(mime.begin(), mime.end(),
                              [](unsigned char c) { return std::isspace(c) != 0; }),
               mime.end());
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (mime == "application/n-triples" || mime == "text/plain") {
        return RdfFormat::NTriples;
    }
    if (mime == "text/turtle" || mime == "application/x-turtle") {
        return RdfFormat::Turtle;
    }
    return std::nullopt;
}

Result<Graph, Error> ParseRdf(std::string_view document, RdfFormat format,
                              const std::string& base_iri) {
    if (IsBlankDocument(document)) {
        return Result<Graph, Error>::Ok(Graph{});
    }

    ParseContext ctx;
    RaptorSession session(ctx, format, base_iri.empty() ? kDefaultBaseIri : base_iri);
    if (!session.Ready()) {
        return Result<Graph, Error>::Err(Error{
            "ParseRdf", "", std::nullopt,
            std::string("Unable to create raptor ") + FormatName(format) + " parser",
            std::nullopt, ErrorCategory::Internal});
    }

    const int status = session.Parse(document);
    if (status != 0 || ctx.first_error.has_value()) {
        std::string message = std::string("Invalid ") + FormatName(format);
        if (ctx.first_error.has_value()) {
            message += ": " + *ctx.first_error;
        }
        return Result<Graph, Error>::Err(Error{
            "ParseRdf", "", std::nullopt, message, std::nullopt,
            ErrorCategory::Parse});
    }

    LogDebug("parser", "Parsed " + std::to_string(ctx.statements) + " " +
                           FormatName(format) + " statements into " +
                           std::to_string(ctx.graph.Size()) + " triples");
    return Result<Graph, Error>::Ok(std::move(ctx.graph));
}

} // namespace rdf_sync
