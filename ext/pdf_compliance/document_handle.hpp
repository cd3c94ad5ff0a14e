#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <memory>
#include <string>
#include <vector>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include "compliance_types.hpp"

namespace pdf_compliance {

/**
 * A thin RAII wrapper around std::shared_ptr<QPDF>.
 *
 * - One qpdf parse per analysed buffer.
 * - Owns the bytes, since qpdf reads lazily from them.
 * - Non-copyable but movable.
 */
class DocumentHandle final {
 public:
  // ---- factory ----------------------------------------------------------
  /** Throws std::runtime_error when qpdf cannot parse the buffer. */
  static std::unique_ptr<DocumentHandle> open_memory(std::string const& description, ByteBuffer data);

  // ---- public API -------------------------------------------------------
  int page_count() const;
  std::vector<QPDFPageObjectHelper> pages() const;

  // ---- rule of five -----------------------------------------------------
  ~DocumentHandle() = default;
  DocumentHandle(const DocumentHandle&) = delete;
  DocumentHandle& operator=(const DocumentHandle&) = delete;
  DocumentHandle(DocumentHandle&&) noexcept = default;
  DocumentHandle& operator=(DocumentHandle&&) noexcept = default;

 private:
  explicit DocumentHandle(std::shared_ptr<QPDF> qpdf);

  std::shared_ptr<QPDF> m_qpdf;
  ByteBuffer m_owned_buf;
};

}  // namespace pdf_compliance
