#include <catch2/catch_test_macros.hpp>

#include <rdf_sync/compare/report.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace rdf_sync;

namespace {

ComparisonReport SampleReport() {
    ComparisonReport report;
    ComparisonResult match;
    match.iri = "https://example.org/cube/1";
    match.outcome = Outcome::Match;
    match.match = true;
    match.triple_count = 12;
    match.right_triple_count = 12;
    report.results.push_back(match);

    ComparisonResult mismatch;
    mismatch.iri = "https://example.org/cube/2";
    mismatch.outcome = Outcome::Mismatch;
    mismatch.triple_count = 10;
    mismatch.right_triple_count = 11;
    mismatch.only_left_count = 1;
    mismatch.only_right_count = 2;
    report.results.push_back(mismatch);

    ComparisonResult error;
    error.iri = "https://example.org/cube/3";
    error.outcome = Outcome::Error;
    error.error = "[graphdb] https://example.org/cube/3: Query timed out, \"60s\"";
    report.results.push_back(error);
    return report;
}

} // anonymous namespace

TEST_CASE("ComparisonReport: counts by outcome", "[compare][report]") {
    auto report = SampleReport();
    CHECK(report.Count(Outcome::Match) == 1);
    CHECK(report.Count(Outcome::Mismatch) == 1);
    CHECK(report.Count(Outcome::Error) == 1);
    CHECK_FALSE(report.AllMatched());
    report.results.resize(1);
    CHECK(report.AllMatched());
    CHECK(ComparisonReport{}.AllMatched());
}

TEST_CASE("ReportToCsv: header and rows", "[compare][report]") {
    auto csv = ReportToCsv(SampleReport());
    std::istringstream in(csv);
    std::string header, row1, row2, row3;
    std::getline(in, header);
    std::getline(in, row1);
    std::getline(in, row2);
    std::getline(in, row3);
    CHECK(header == "IRI,Match,Triples,Outcome,RightTriples,OnlyLeft,OnlyRight,Error");
    CHECK(row1 == "https://example.org/cube/1,True,12,match,12,0,0,");
    CHECK(row2 == "https://example.org/cube/2,False,10,mismatch,11,1,2,");
    CHECK(row3 == "https://example.org/cube/3,False,0,error,0,0,0,"
                  "\"[graphdb] https://example.org/cube/3: Query timed out, \"\"60s\"\"\"");
}

TEST_CASE("ReportToCsv: empty report has only the header", "[compare][report]") {
    CHECK(ReportToCsv({}) == "IRI,Match,Triples,Outcome,RightTriples,OnlyLeft,OnlyRight,Error\n");
}

TEST_CASE("WriteCsvReport: writes file", "[compare][report]") {
    auto path = (std::filesystem::temp_directory_path() / "rdf_sync_report_test.csv").string();
    REQUIRE(WriteCsvReport(SampleReport(), path).IsOk());
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    CHECK(ss.str() == ReportToCsv(SampleReport()));
    in.close();
    std::remove(path.c_str());
}

TEST_CASE("WriteCsvReport: unwritable path", "[compare][report]") {
    CHECK(WriteCsvReport({}, "/nonexistent-dir/rdf-sync/report.csv").IsErr());
}
