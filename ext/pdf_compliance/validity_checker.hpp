#pragma once

#include <iostream>

#include "compliance_types.hpp"
#include "parser_strategy.hpp"

namespace pdf_compliance {

/**
 * Decides whether a buffer is a parseable PDF.
 *
 * Strategies are tried in order; the first one that opens the buffer and reports at least one
 * page wins. Parser failures never leave is_valid().
 */
class DocumentValidityChecker {
 public:
  explicit DocumentValidityChecker(std::ostream& log = std::cerr);
  DocumentValidityChecker(ParserStrategyList strategies, std::ostream& log = std::cerr);

  bool is_valid(const ByteBuffer& bytes) const;

 private:
  ParserStrategyList m_strategies;
  std::ostream& m_log;
};

}  // namespace pdf_compliance
