#pragma once

#include <rdf_sync/rdf/term.hpp>

#include <string>
#include <string_view>

namespace rdf_sync {

/// Unicode NFC form of a UTF-8 string. Invalid sequences are replaced by
/// U+FFFD. If ICU reports a failure the input is returned unchanged.
[[nodiscard]] std::string NormalizeNfc(std::string_view utf8);

/// True if the string is already in NFC.
[[nodiscard]] bool IsNfc(std::string_view utf8);

/// NFC-normalize the lexical form; language tag and datatype pass through.
[[nodiscard]] Literal NormalizeLiteral(const Literal& literal);

} // namespace rdf_sync
