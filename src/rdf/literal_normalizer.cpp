#include <rdf_sync/rdf/literal_normalizer.hpp>

#include <rdf_sync/core/log.hpp>

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace rdf_sync {

namespace {

const icu::Normalizer2* NfcInstance() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        LogWarn("parser", std::string("ICU NFC instance unavailable: ") +
                              u_errorName(status));
        return nullptr;
    }
    return nfc;
}

bool IsAscii(std::string_view s) {
    for (char c : s) {
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

} // anonymous namespace

std::string NormalizeNfc(std::string_view utf8) {
    // ASCII is always NFC.
    if (IsAscii(utf8)) {
        return std::string(utf8);
    }

    const auto* nfc = NfcInstance();
    if (nfc == nullptr) {
        return std::string(utf8);
    }

    auto source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString normalized = nfc->normalize(source, status);
    if (U_FAILURE(status)) {
        LogWarn("parser", std::string("NFC normalization failed: ") +
                              u_errorName(status));
        return std::string(utf8);
    }

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

bool IsNfc(std::string_view utf8) {
    if (IsAscii(utf8)) {
        return true;
    }
    const auto* nfc = NfcInstance();
    if (nfc == nullptr) {
        return false;
    }
    auto source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    UErrorCode status = U_ZERO_ERROR;
    const UBool result = nfc->isNormalized(source, status);
    return U_SUCCESS(status) && result;
}

Literal NormalizeLiteral(const Literal& literal) {
    return Literal{NormalizeNfc(literal.lexical), literal.language,
                   literal.datatype};
}

} // namespace rdf_sync
