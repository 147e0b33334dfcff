#include <rdf_sync/compare/report.hpp>

#include <algorithm>
#include <fstream>

namespace rdf_sync {

namespace {

std::string CsvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Match:    return "match";
        case Outcome::Mismatch: return "mismatch";
        case Outcome::Error:    return "error";
    }
    return "error";
}

size_t ComparisonReport::Count(Outcome outcome) const {
    return static_cast<size_t>(std::count_if(
        results.begin(), results.end(),
        [outcome](const ComparisonResult& r) { return r.outcome == outcome; }));
}

bool ComparisonReport::AllMatched() const {
    return Count(Outcome::Match) == results.size();
}

std::string ReportToCsv(const ComparisonReport& report) {
    std::string out =
        "IRI,Match,Triples,Outcome,RightTriples,OnlyLeft,OnlyRight,Error\n";
    for (const auto& r : report.results) {
        out += CsvField(r.iri);
        out += r.match ? ",True," : ",False,";
        out += std::to_string(r.triple_count) + ",";
        out += std::string(OutcomeName(r.outcome)) + ",";
        out += std::to_string(r.right_triple_count) + ",";
        out += std::to_string(r.only_left_count) + ",";
        out += std::to_string(r.only_right_count) + ",";
        out += CsvField(r.error);
        out += "\n";
    }
    return out;
}

Result<void, Error> WriteCsvReport(const ComparisonReport& report,
                                   const std::string& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return Result<void, Error>::Err(Error{
            "WriteCsvReport", "", std::nullopt,
            "Cannot open file for writing: " + path, std::nullopt,
            ErrorCategory::Internal});
    }
    file << ReportToCsv(report);
    file.close();
    if (file.fail()) {
        return Result<void, Error>::Err(Error{
            "WriteCsvReport", "", std::nullopt, "Failed to write file: " + path,
            std::nullopt, ErrorCategory::Internal});
    }
    return Result<void, Error>::Ok();
}

} // namespace rdf_sync
