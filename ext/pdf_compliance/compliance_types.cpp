#include "compliance_types.hpp"

namespace pdf_compliance {

const std::vector<SectionCategory>& all_section_categories() {
  static const std::vector<SectionCategory> categories = {SectionCategory::TechnicalRequirements,
                                                          SectionCategory::Budget, SectionCategory::Qualification};
  return categories;
}

const char* section_category_name(SectionCategory c) {
  switch (c) {
    case SectionCategory::TechnicalRequirements:
      return "technical_requirements";
    case SectionCategory::Budget:
      return "budget";
    case SectionCategory::Qualification:
      return "qualification";
  }
  return "unknown";
}

std::optional<SectionCategory> section_category_from_name(const std::string& name) {
  for (SectionCategory c : all_section_categories()) {
    if (name == section_category_name(c)) return c;
  }
  return std::nullopt;
}

std::array<std::pair<const char*, CheckStatus>, 4> FormatResult::fields() const {
  return {{{"file_type", file_type}, {"font_size", font_size}, {"font_family", font_family}, {"margin", margin}}};
}

int ComplianceResult::passed_checks() const {
  int passed = 0;
  for (const auto& f : format.fields()) {
    if (f.second == CheckStatus::Pass) ++passed;
  }
  for (const auto& kv : content.sections) {
    if (kv.second.status == CheckStatus::Pass) ++passed;
  }
  return passed;
}

int ComplianceResult::total_checks() const {
  return static_cast<int>(format.fields().size() + content.sections.size());
}

}  // namespace pdf_compliance
