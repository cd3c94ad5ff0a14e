#include "compliance_analyzer.hpp"

using namespace pdf_compliance;

ComplianceAnalyzer::ComplianceAnalyzer(CompliancePolicy policy, std::ostream& log)
    : ComplianceAnalyzer(std::move(policy), std::make_unique<DocumentValidityChecker>(log),
                         default_section_patterns(), log) {}

ComplianceAnalyzer::ComplianceAnalyzer(CompliancePolicy policy, std::unique_ptr<DocumentValidityChecker> checker,
                                       SectionPatternSet patterns, std::ostream& log)
    : m_checker(std::move(checker)),
      m_evaluator(std::move(policy)),
      m_detector(std::move(patterns), log),
      m_typography(log),
      m_margins(log),
      m_log(log) {}

FormatResult ComplianceAnalyzer::validate_formatting(const ByteBuffer& bytes) const {
  if (!m_checker->is_valid(bytes)) {
    return m_evaluator.evaluate_format(false, TypographyInfo{}, Margins{});
  }

  std::unique_ptr<DocumentHandle> doc;
  try {
    doc = DocumentHandle::open_memory("format", bytes);
  } catch (const std::exception& e) {
    // valid for the fallback parser only; nothing to measure with
    m_log << "pdf_compliance: format: " << e.what() << std::endl;
    return m_evaluator.evaluate_format(true, TypographyInfo{}, Margins{});
  }

  TypographyInfo typography = m_typography.extract(*doc);
  MarginInfo margins = m_margins.extract(*doc);
  return m_evaluator.evaluate_format(true, typography, margins.margins);
}

ContentResult ComplianceAnalyzer::validate_content(const ByteBuffer& bytes) const {
  return m_evaluator.evaluate_content(m_detector.detect(bytes));
}

ComplianceResult ComplianceAnalyzer::analyze(const ByteBuffer& bytes) const {
  ComplianceResult result;
  result.format = validate_formatting(bytes);
  result.content = validate_content(bytes);
  return result;
}
