#include <catch2/catch_all.hpp>

#include "native_call.hpp"
#include "pdf_fixture.hpp"

#include <string>
#include <type_traits>

using namespace pdf_compliance;

static ByteBuffer budget_page() {
  return fixture::single_page(fixture::one_inch_margin_content("Budget overview", "Closing line"));
}

TEST_CASE("values handed across the binding need no destructor", "[native]") {
  REQUIRE(std::is_trivially_destructible<PolicyArgs>::value);
  REQUIRE(std::is_trivially_destructible<NativeOutcome>::value);
}

TEST_CASE("policy overrides apply on top of the defaults", "[native]") {
  PolicyArgs args;
  args.has_font_size = true;
  args.font_size = 11;
  args.font_family = "Arial";
  args.has_limit[static_cast<size_t>(SectionCategory::Budget)] = true;
  args.limit[static_cast<size_t>(SectionCategory::Budget)] = 0;

  CompliancePolicy policy = policy_from(args);
  REQUIRE(policy.required_font_size == 11);
  REQUIRE(policy.required_font_family == "Arial");
  REQUIRE(policy.required_margin_inches == Catch::Approx(1.0));
  REQUIRE(policy.font_size_tolerance == 1);
  REQUIRE(policy.section_page_limits.at(SectionCategory::Budget) == 0);
  REQUIRE(policy.section_page_limits.at(SectionCategory::Qualification) == 4);

  REQUIRE(policy_from(PolicyArgs()).required_font_family == "Times New Roman");
}

TEST_CASE("analyze fills format and content with plain values", "[native]") {
  ByteBuffer bytes = budget_page();
  PolicyArgs args;
  args.has_limit[static_cast<size_t>(SectionCategory::Budget)] = true;
  args.limit[static_cast<size_t>(SectionCategory::Budget)] = 0;

  NativeOutcome out;
  REQUIRE(run_native(NativeOperation::Analyze, bytes.data(), bytes.size(), args, out));
  REQUIRE(std::string(out.error).empty());

  REQUIRE(std::string(out.format[0].first) == "file_type");
  for (const auto& field : out.format) {
    INFO(field.first);
    REQUIRE(field.second == CheckStatus::Pass);
  }

  size_t budget = static_cast<size_t>(SectionCategory::Budget);
  REQUIRE(out.has_section[budget]);
  REQUIRE(out.sections[budget].page_count == 1);
  REQUIRE(out.sections[budget].limit == 0);
  REQUIRE(out.sections[budget].status == CheckStatus::Fail);
}

TEST_CASE("single operations only fill their own part", "[native]") {
  ByteBuffer bytes = budget_page();

  NativeOutcome content;
  REQUIRE(run_native(NativeOperation::Content, bytes.data(), bytes.size(), PolicyArgs(), content));
  REQUIRE(content.format[0].first == nullptr);
  REQUIRE(content.has_section[static_cast<size_t>(SectionCategory::Qualification)]);

  NativeOutcome format;
  REQUIRE(run_native(NativeOperation::Format, bytes.data(), bytes.size(), PolicyArgs(), format));
  REQUIRE(format.format[3].second == CheckStatus::Pass);
  for (bool present : format.has_section) REQUIRE_FALSE(present);
}

TEST_CASE("validity runs without a policy and rejects garbage", "[native]") {
  ByteBuffer good = budget_page();
  ByteBuffer bad = fixture::to_bytes("not a pdf");

  NativeOutcome accepted;
  REQUIRE(run_native(NativeOperation::Validity, good.data(), good.size(), PolicyArgs(), accepted));
  REQUIRE(accepted.valid);

  NativeOutcome rejected;
  REQUIRE(run_native(NativeOperation::Validity, bad.data(), bad.size(), PolicyArgs(), rejected));
  REQUIRE_FALSE(rejected.valid);

  NativeOutcome empty;
  REQUIRE(run_native(NativeOperation::Validity, nullptr, 0, PolicyArgs(), empty));
  REQUIRE_FALSE(empty.valid);
}
