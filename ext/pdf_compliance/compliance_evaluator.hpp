#pragma once

#include <string>
#include <vector>

#include "compliance_types.hpp"
#include "section_detector.hpp"

namespace pdf_compliance {

/** Absolute slack on tolerance comparisons so exact boundaries survive floating point. */
constexpr double TOLERANCE_EPSILON = 1e-9;

/**
 * Name fragments that count as the policy's font family. An explicit
 * `accepted_font_families` list wins; otherwise they are derived from `required_font_family`.
 */
std::vector<std::string> accepted_font_family_variants(const CompliancePolicy& policy);

bool font_size_matches(const std::set<int>& sizes, const CompliancePolicy& policy);
bool font_family_matches(const std::set<std::string>& families, const CompliancePolicy& policy);
bool margins_match(const Margins& margins, const CompliancePolicy& policy);

/**
 * Pure policy checks over already-extracted signals.
 */
class ComplianceEvaluator {
 public:
  explicit ComplianceEvaluator(CompliancePolicy policy);

  /** When `valid_document` is false every format check fails. */
  FormatResult evaluate_format(bool valid_document, const TypographyInfo& typography, const Margins& margins) const;
  ContentResult evaluate_content(const SectionMatchSet& sections) const;

  const CompliancePolicy& policy() const { return m_policy; }

 private:
  const CompliancePolicy m_policy;
};

}  // namespace pdf_compliance
