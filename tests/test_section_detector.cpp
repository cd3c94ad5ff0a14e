#include <catch2/catch_all.hpp>

#include "pdf_fixture.hpp"
#include "section_detector.hpp"

#include <sstream>

using namespace pdf_compliance;
using Pages = std::vector<int>;

static ByteBuffer proposal() {
  fixture::PdfBuilder builder;
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "Technical Requirements"));
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "Budget, cost and pricing") +
                   fixture::text_at("F1", 12, 72, 680, "Financial summary"));
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "Team Qualifications and relevant experience"));
  builder.add_page("0 0 m 100 100 l S\n");
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "PROJECT BUDGET, continued") +
                   fixture::text_at("F1", 12, 72, 680, "System requirement list"));
  return builder.build();
}

TEST_CASE("pages are recorded per category in ascending order", "[sections]") {
  std::ostringstream log;
  SectionDetector detector(log);

  SectionMatchSet matches = detector.detect(proposal());

  REQUIRE(matches.pages_for(SectionCategory::TechnicalRequirements) == Pages{1, 5});
  REQUIRE(matches.pages_for(SectionCategory::Budget) == Pages{2, 5});
  REQUIRE(matches.pages_for(SectionCategory::Qualification) == Pages{3});
  REQUIRE(matches.page_count(SectionCategory::Budget) == 2);
}

TEST_CASE("detection is idempotent", "[sections]") {
  std::ostringstream log;
  SectionDetector detector(log);
  ByteBuffer bytes = proposal();

  REQUIRE(detector.detect(bytes) == detector.detect(bytes));
}

TEST_CASE("several hits on one page count once", "[sections]") {
  SectionDetector detector;
  SectionMatchSet matches;

  detector.match_page("budget cost pricing expenses financial", 3, matches);
  detector.match_page("another budget line", 3, matches);
  detector.match_page("Expense report", 7, matches);

  REQUIRE(matches.pages_for(SectionCategory::Budget) == Pages{3, 7});
}

TEST_CASE("matching is case-insensitive and tolerates word variants", "[sections]") {
  SectionDetector detector;
  SectionMatchSet matches;

  detector.match_page("REQUIRED CREDENTIALS", 1, matches);
  detector.match_page("core competencies", 2, matches);
  detector.match_page("technical\n   specification", 3, matches);

  REQUIRE(matches.pages_for(SectionCategory::Qualification) == Pages{1, 2});
  REQUIRE(matches.pages_for(SectionCategory::TechnicalRequirements) == Pages{3});
}

TEST_CASE("glyph names from a /Differences encoding are honoured", "[sections]") {
  std::ostringstream log;
  SectionDetector detector(log);

  // code 12 is /fi in the page's encoding: the page reads "Qualifications" with a ligature
  fixture::PdfBuilder builder;
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "Overview"));
  builder.add_page(fixture::text_at("F4", 12, 72, 700, "Quali\\014cations"));
  SectionMatchSet matches = detector.detect(builder.build());

  REQUIRE(matches.pages_for(SectionCategory::Qualification) == Pages{2});
  REQUIRE_FALSE(matches.diagnostic);
}

TEST_CASE("ligature code points match their spelled-out words", "[sections]") {
  SectionDetector detector;
  SectionMatchSet matches;

  detector.match_page("Quali\xEF\xAC\x81" "cations", 1, matches);
  detector.match_page("\xEF\xAC\x81" "nancial summary", 2, matches);
  detector.match_page("technical speci\xEF\xAC\x81" "cations", 3, matches);

  REQUIRE(matches.pages_for(SectionCategory::Qualification) == Pages{1});
  REQUIRE(matches.pages_for(SectionCategory::Budget) == Pages{2});
  REQUIRE(matches.pages_for(SectionCategory::TechnicalRequirements) == Pages{3});
}

TEST_CASE("empty text contributes nothing", "[sections]") {
  SectionDetector detector;
  SectionMatchSet matches;

  detector.match_page("", 1, matches);
  REQUIRE(matches.pages_for(SectionCategory::Budget).empty());
}

TEST_CASE("custom patterns replace the defaults", "[sections]") {
  std::ostringstream log;
  SectionPatternSet patterns = {SectionPattern(SectionCategory::Budget, {R"(bill\s+of\s+materials)"})};
  SectionDetector detector(std::move(patterns), log);

  fixture::PdfBuilder builder;
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "Budget"));
  builder.add_page(fixture::text_at("F1", 12, 72, 700, "Bill of Materials"));
  SectionMatchSet matches = detector.detect(builder.build());

  REQUIRE(matches.pages_for(SectionCategory::Budget) == Pages{2});
  REQUIRE(matches.pages_for(SectionCategory::Qualification).empty());
}

TEST_CASE("unparseable bytes produce an empty match set for every category", "[sections]") {
  std::ostringstream log;
  SectionDetector detector(log);

  SectionMatchSet matches = detector.detect(fixture::to_bytes("garbage"));
  REQUIRE(matches.pages.size() == all_section_categories().size());
  for (SectionCategory c : all_section_categories()) REQUIRE(matches.pages_for(c).empty());
  REQUIRE(matches.diagnostic.has_value());
}

TEST_CASE("default patterns cover every category", "[sections]") {
  SectionPatternSet patterns = default_section_patterns();
  REQUIRE(patterns.size() == 3);
  REQUIRE(patterns[1].category == SectionCategory::Budget);
  REQUIRE(patterns[1].sources.front() == "budget");
  REQUIRE(patterns[1].patterns.size() == patterns[1].sources.size());
}
