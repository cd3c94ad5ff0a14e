#pragma once

#include <memory>
#include <string>
#include <vector>

#include "compliance_types.hpp"

namespace poppler {
class document;
}

namespace pdf_compliance {

/**
 * Loads `bytes` with poppler. The buffer is not copied and must outlive the document.
 * Throws std::runtime_error when poppler rejects it.
 */
std::unique_ptr<poppler::document> open_poppler_document(const ByteBuffer& bytes);

/**
 * One independent way of opening a PDF buffer.
 *
 * open_page_count() returns the number of pages it found, or throws when the buffer is not
 * something this parser accepts.
 */
class ParserStrategy {
 public:
  virtual ~ParserStrategy() = default;
  virtual std::string name() const = 0;
  virtual int open_page_count(const ByteBuffer& bytes) const = 0;
};

/** Primary parser, backed by qpdf. */
class QpdfParserStrategy : public ParserStrategy {
 public:
  std::string name() const override { return "qpdf"; }
  int open_page_count(const ByteBuffer& bytes) const override;
};

/** Secondary parser, backed by poppler-cpp. Shares no code with the qpdf path. */
class PopplerParserStrategy : public ParserStrategy {
 public:
  std::string name() const override { return "poppler"; }
  int open_page_count(const ByteBuffer& bytes) const override;
};

using ParserStrategyList = std::vector<std::unique_ptr<ParserStrategy>>;

/** qpdf first, poppler second. */
ParserStrategyList default_parser_strategies();

}  // namespace pdf_compliance
