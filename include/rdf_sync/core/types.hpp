#pragma once

#include <rdf_sync/core/result.hpp>

#include <string>
#include <string_view>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// IriRef - validated absolute IRI supplied by a user or config file
// (graph IRIs, entity type IRIs, excluded predicates).
//
// Rules:
//   - Non-empty, has a scheme ("[A-Za-z][A-Za-z0-9+.-]*:")
//   - No whitespace, control characters, or any of <>"{}|^`\
//
// IRIs read from store responses are not wrapped; they are compared as
// delivered.
// ---------------------------------------------------------------------------
class IriRef {
public:
    static Result<IriRef, std::string> Create(std::string_view iri);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const IriRef& other) const { return value_ == other.value_; }
    bool operator!=(const IriRef& other) const { return value_ != other.value_; }
    bool operator<(const IriRef& other) const { return value_ < other.value_; }

    IriRef(const IriRef&) = default;
    IriRef& operator=(const IriRef&) = default;
    IriRef(IriRef&&) noexcept = default;
    IriRef& operator=(IriRef&&) noexcept = default;

private:
    explicit IriRef(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// StoreSide - which of the two compared systems a value belongs to.
// ---------------------------------------------------------------------------
enum class StoreSide {
    Stardog,
    GraphDb,
};

[[nodiscard]] const char* StoreSideName(StoreSide side);

} // namespace rdf_sync
