#pragma once

#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "compliance_types.hpp"

namespace pdf_compliance {

/** Patterns for one category, tried in order against lower-cased page text. */
struct SectionPattern {
  SectionCategory category;
  std::vector<std::string> sources;
  std::vector<std::regex> patterns;

  SectionPattern(SectionCategory category, std::vector<std::string> sources);
};

using SectionPatternSet = std::vector<SectionPattern>;

/** Category -> ascending, duplicate-free 1-based page numbers. */
struct SectionMatchSet {
  std::map<SectionCategory, std::vector<int>> pages;
  std::optional<std::string> diagnostic;

  const std::vector<int>& pages_for(SectionCategory c) const;
  int page_count(SectionCategory c) const { return static_cast<int>(pages_for(c).size()); }

  bool operator==(const SectionMatchSet& other) const { return pages == other.pages; }
};

SectionPatternSet default_section_patterns();

class SectionDetector {
 public:
  explicit SectionDetector(std::ostream& log = std::cerr);
  SectionDetector(SectionPatternSet patterns, std::ostream& log = std::cerr);

  /**
   * Reads each page's text with poppler, so every font encoding poppler understands is honoured.
   * Never throws; an unopenable buffer yields no matches and sets `diagnostic`.
   */
  SectionMatchSet detect(const ByteBuffer& bytes) const;

  /** Records `page_number` for every category whose patterns hit `text` (UTF-8). */
  void match_page(const std::string& text, int page_number, SectionMatchSet& matches) const;

  const SectionPatternSet& patterns() const { return m_patterns; }

 private:
  SectionMatchSet empty_matches() const;

  SectionPatternSet m_patterns;
  std::ostream& m_log;
};

}  // namespace pdf_compliance
