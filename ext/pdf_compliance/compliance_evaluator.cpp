#include "compliance_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

using namespace pdf_compliance;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::vector<std::string> pdf_compliance::accepted_font_family_variants(const CompliancePolicy& policy) {
  if (!policy.accepted_font_families.empty()) return policy.accepted_font_families;

  const std::string& family = policy.required_font_family;
  if (to_lower(family) == "times new roman") {
    return {"Times", "Times-Roman", "TimesNewRoman", "Times New Roman"};
  }

  std::string compact;
  std::string hyphenated;
  for (char c : family) {
    if (c != ' ') compact.push_back(c);
    hyphenated.push_back(c == ' ' ? '-' : c);
  }

  std::vector<std::string> variants = {family};
  for (const auto& v : {compact, hyphenated}) {
    if (std::find(variants.begin(), variants.end(), v) == variants.end()) variants.push_back(v);
  }
  return variants;
}

bool pdf_compliance::font_size_matches(const std::set<int>& sizes, const CompliancePolicy& policy) {
  return std::any_of(sizes.begin(), sizes.end(), [&](int size) {
    return std::abs(size - policy.required_font_size) <= policy.font_size_tolerance;
  });
}

bool pdf_compliance::font_family_matches(const std::set<std::string>& families, const CompliancePolicy& policy) {
  std::vector<std::string> variants = accepted_font_family_variants(policy);
  for (auto& v : variants) v = to_lower(v);

  return std::any_of(families.begin(), families.end(), [&](const std::string& font) {
    std::string name = to_lower(font);
    return std::any_of(variants.begin(), variants.end(), [&](const std::string& v) {
      return !v.empty() && name.find(v) != std::string::npos;
    });
  });
}

bool pdf_compliance::margins_match(const Margins& m, const CompliancePolicy& policy) {
  auto within = [&](double side) {
    return std::abs(side - policy.required_margin_inches) <= policy.margin_tolerance_inches + TOLERANCE_EPSILON;
  };
  return within(m.left) && within(m.right) && within(m.top) && within(m.bottom);
}

ComplianceEvaluator::ComplianceEvaluator(CompliancePolicy policy) : m_policy(std::move(policy)) {}

FormatResult ComplianceEvaluator::evaluate_format(bool valid_document, const TypographyInfo& typography,
                                                  const Margins& margins) const {
  FormatResult result;
  if (!valid_document) return result;

  result.file_type = CheckStatus::Pass;
  result.font_size = status_of(font_size_matches(typography.font_sizes, m_policy));
  result.font_family = status_of(font_family_matches(typography.font_families, m_policy));
  result.margin = status_of(margins_match(margins, m_policy));
  return result;
}

ContentResult ComplianceEvaluator::evaluate_content(const SectionMatchSet& sections) const {
  ContentResult result;
  for (const auto& kv : m_policy.section_page_limits) {
    SectionVerdict verdict;
    verdict.page_count = sections.page_count(kv.first);
    verdict.limit = kv.second;
    verdict.status = status_of(verdict.page_count <= verdict.limit);
    result.sections[kv.first] = verdict;
  }
  return result;
}
