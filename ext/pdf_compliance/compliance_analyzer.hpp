#pragma once

#include <iostream>
#include <memory>

#include "compliance_evaluator.hpp"
#include "compliance_types.hpp"
#include "margin_extractor.hpp"
#include "section_detector.hpp"
#include "typography_extractor.hpp"
#include "validity_checker.hpp"

namespace pdf_compliance {

/**
 * Runs the whole pipeline for one buffer: validity gate, typography and margins for the format
 * checks, section detection for the content checks.
 *
 * Holds no per-document state, so one instance may analyse any number of buffers.
 */
class ComplianceAnalyzer {
 public:
  explicit ComplianceAnalyzer(CompliancePolicy policy = CompliancePolicy::defaults(), std::ostream& log = std::cerr);
  ComplianceAnalyzer(CompliancePolicy policy, std::unique_ptr<DocumentValidityChecker> checker,
                     SectionPatternSet patterns, std::ostream& log = std::cerr);

  bool is_valid_pdf(const ByteBuffer& bytes) const { return m_checker->is_valid(bytes); }

  /** Extraction is skipped entirely when the buffer is not a valid PDF. */
  FormatResult validate_formatting(const ByteBuffer& bytes) const;
  ContentResult validate_content(const ByteBuffer& bytes) const;
  ComplianceResult analyze(const ByteBuffer& bytes) const;

  const CompliancePolicy& policy() const { return m_evaluator.policy(); }

 private:
  std::unique_ptr<DocumentValidityChecker> m_checker;
  ComplianceEvaluator m_evaluator;
  SectionDetector m_detector;
  TypographyExtractor m_typography;
  MarginExtractor m_margins;
  std::ostream& m_log;
};

}  // namespace pdf_compliance
