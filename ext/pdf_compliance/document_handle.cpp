#define POINTERHOLDER_TRANSITION 1

#include "document_handle.hpp"

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <stdexcept>

using namespace pdf_compliance;

std::unique_ptr<DocumentHandle> DocumentHandle::open_memory(std::string const& desc, ByteBuffer buf) {
  if (buf.empty()) {
    throw std::runtime_error("pdf_compliance: open_memory failed: empty buffer");
  }

  auto qpdf = std::make_shared<QPDF>();
  qpdf->setSuppressWarnings(true);

  auto h = std::unique_ptr<DocumentHandle>(new DocumentHandle(qpdf));
  h->m_owned_buf = std::move(buf);  // keep bytes alive, qpdf does not copy them

  try {
    qpdf->processMemoryFile(desc.c_str(), reinterpret_cast<char const*>(h->m_owned_buf.data()),
                            h->m_owned_buf.size());
  } catch (const QPDFExc& qex) {
    throw std::runtime_error("pdf_compliance: open_memory failed: " + std::string(qex.what()) +
                             " (code: " + std::to_string(qex.getErrorCode()) + ")");
  } catch (std::exception const& ex) {
    throw std::runtime_error("pdf_compliance: open_memory failed: " + std::string(ex.what()));
  }

  return h;
}

DocumentHandle::DocumentHandle(std::shared_ptr<QPDF> qpdf) : m_qpdf(std::move(qpdf)) {}

int DocumentHandle::page_count() const { return static_cast<int>(m_qpdf->getAllPages().size()); }

std::vector<QPDFPageObjectHelper> DocumentHandle::pages() const {
  QPDFPageDocumentHelper doc_helper(*m_qpdf);
  return doc_helper.getAllPages();
}
