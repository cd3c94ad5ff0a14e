#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pdf_compliance {

using ByteBuffer = std::vector<unsigned char>;

enum class CheckStatus { Pass, Fail };

inline const char* to_string(CheckStatus s) { return s == CheckStatus::Pass ? "pass" : "fail"; }
inline CheckStatus status_of(bool ok) { return ok ? CheckStatus::Pass : CheckStatus::Fail; }

enum class SectionCategory { TechnicalRequirements, Budget, Qualification };
constexpr size_t SECTION_CATEGORY_COUNT = 3;

/** All categories in report order. */
const std::vector<SectionCategory>& all_section_categories();

/** Stable key used in reports, e.g. "technical_requirements". */
const char* section_category_name(SectionCategory c);
std::optional<SectionCategory> section_category_from_name(const std::string& name);

struct Margins {
  double left = 0;
  double right = 0;
  double top = 0;
  double bottom = 0;
};

struct TypographyInfo {
  std::set<int> font_sizes;
  std::set<std::string> font_families;
  std::optional<std::string> diagnostic;
};

struct MarginInfo {
  Margins margins;
  std::optional<std::string> diagnostic;
};

/**
 * Thresholds a document is judged against.
 *
 * Constructed once and passed by value or const reference; nothing in the core mutates it.
 */
struct CompliancePolicy {
  int required_font_size = 12;
  std::string required_font_family = "Times New Roman";
  double required_margin_inches = 1.0;
  double margin_tolerance_inches = 0.2;
  int font_size_tolerance = 1;
  std::map<SectionCategory, int> section_page_limits = {
      {SectionCategory::TechnicalRequirements, 8}, {SectionCategory::Budget, 4}, {SectionCategory::Qualification, 4}};
  // replaces the variants derived from required_font_family when non-empty
  std::vector<std::string> accepted_font_families;

  static CompliancePolicy defaults() { return CompliancePolicy{}; }
};

struct FormatResult {
  CheckStatus file_type = CheckStatus::Fail;
  CheckStatus font_size = CheckStatus::Fail;
  CheckStatus font_family = CheckStatus::Fail;
  CheckStatus margin = CheckStatus::Fail;

  /** Field name / status pairs in report order. Names are string literals. */
  std::array<std::pair<const char*, CheckStatus>, 4> fields() const;
};

struct SectionVerdict {
  int page_count = 0;
  int limit = 0;
  CheckStatus status = CheckStatus::Fail;
};

struct ContentResult {
  std::map<SectionCategory, SectionVerdict> sections;
};

struct ComplianceResult {
  FormatResult format;
  ContentResult content;

  int passed_checks() const;
  int total_checks() const;
  bool all_passed() const { return passed_checks() == total_checks(); }
};

}  // namespace pdf_compliance
