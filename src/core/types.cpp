#include <rdf_sync/core/types.hpp>

#include <cctype>

namespace rdf_sync {

namespace {

bool IsForbiddenIriChar(unsigned char c) {
    if (c <= 0x20 || c == 0x7F) return true;
    switch (c) {
        case '<': case '>': case '"': case '{': case '}':
        case '|': case '^': case '`': case '\\':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

Result<IriRef, std::string> IriRef::Create(std::string_view iri) {
    if (iri.empty()) {
        return Result<IriRef, std::string>::Err("IRI must not be empty");
    }

    auto colon = iri.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Result<IriRef, std::string>::Err(
            "IRI must be absolute (missing scheme): " + std::string(iri));
    }
    if (!std::isalpha(static_cast<unsigned char>(iri[0]))) {
        return Result<IriRef, std::string>::Err(
            "IRI scheme must start with a letter: " + std::string(iri));
    }
    for (size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(iri[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return Result<IriRef, std::string>::Err(
                "Invalid character in IRI scheme: " + std::string(iri));
        }
    }
    if (colon + 1 == iri.size()) {
        return Result<IriRef, std::string>::Err(
            "IRI has nothing after the scheme: " + std::string(iri));
    }

    for (unsigned char c : iri) {
        if (IsForbiddenIriChar(c)) {
            return Result<IriRef, std::string>::Err(
                "IRI contains a forbidden character: " + std::string(iri));
        }
    }

    return Result<IriRef, std::string>::Ok(IriRef(std::string(iri)));
}

const char* StoreSideName(StoreSide side) {
    switch (side) {
        case StoreSide::Stardog: return "stardog";
        case StoreSide::GraphDb: return "graphdb";
    }
    return "unknown";
}

} // namespace rdf_sync
