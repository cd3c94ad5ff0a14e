#include "validity_checker.hpp"

using namespace pdf_compliance;

DocumentValidityChecker::DocumentValidityChecker(std::ostream& log)
    : DocumentValidityChecker(default_parser_strategies(), log) {}

DocumentValidityChecker::DocumentValidityChecker(ParserStrategyList strategies, std::ostream& log)
    : m_strategies(std::move(strategies)), m_log(log) {}

bool DocumentValidityChecker::is_valid(const ByteBuffer& bytes) const {
  for (const auto& strategy : m_strategies) {
    try {
      int pages = strategy->open_page_count(bytes);
      if (pages > 0) return true;
      m_log << "pdf_compliance: validity: " << strategy->name() << " reported no pages" << std::endl;
    } catch (const std::exception& e) {
      m_log << "pdf_compliance: validity: " << strategy->name() << " rejected buffer: " << e.what() << std::endl;
    }
  }
  return false;
}
