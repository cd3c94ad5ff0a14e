#include "parser_strategy.hpp"
#include "document_handle.hpp"

#include <poppler-document.h>

#include <limits>
#include <stdexcept>

using namespace pdf_compliance;

int QpdfParserStrategy::open_page_count(const ByteBuffer& bytes) const {
  auto doc = DocumentHandle::open_memory("qpdf-validity", bytes);
  return doc->page_count();
}

std::unique_ptr<poppler::document> pdf_compliance::open_poppler_document(const ByteBuffer& bytes) {
  if (bytes.empty() || bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("pdf_compliance: poppler: unsupported buffer size " + std::to_string(bytes.size()));
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
      reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size())));
  if (!doc) {
    throw std::runtime_error("pdf_compliance: poppler: failed to load document");
  }
  return doc;
}

int PopplerParserStrategy::open_page_count(const ByteBuffer& bytes) const {
  return open_poppler_document(bytes)->pages();
}

ParserStrategyList pdf_compliance::default_parser_strategies() {
  ParserStrategyList strategies;
  strategies.push_back(std::make_unique<QpdfParserStrategy>());
  strategies.push_back(std::make_unique<PopplerParserStrategy>());
  return strategies;
}
