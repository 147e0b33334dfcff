#pragma once

#include <rdf_sync/core/result.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace rdf_sync {

enum class Outcome {
    Match,
    Mismatch,
    Error,
};

[[nodiscard]] const char* OutcomeName(Outcome outcome);

// ---------------------------------------------------------------------------
// ComparisonResult - one compared entity. `triple_count` is the left
// (Stardog) side; errored entities carry the message with store and IRI.
// ---------------------------------------------------------------------------
struct ComparisonResult {
    std::string iri;
    Outcome outcome = Outcome::Match;
    bool match = false;
    size_t triple_count = 0;
    size_t right_triple_count = 0;
    size_t only_left_count = 0;
    size_t only_right_count = 0;
    bool complete = true;  // canonical search finished within budget
    std::string error;
};

// ---------------------------------------------------------------------------
// ComparisonReport - results in processing order.
// ---------------------------------------------------------------------------
struct ComparisonReport {
    std::vector<ComparisonResult> results;

    [[nodiscard]] size_t Count(Outcome outcome) const;
    [[nodiscard]] bool AllMatched() const;
};

/// CSV with header IRI,Match,Triples,Outcome,RightTriples,OnlyLeft,OnlyRight,Error.
/// Fields are quoted when they contain a comma, quote or line break.
[[nodiscard]] std::string ReportToCsv(const ComparisonReport& report);

[[nodiscard]] Result<void, Error> WriteCsvReport(const ComparisonReport& report,
                                                 const std::string& path);

} // namespace rdf_sync
