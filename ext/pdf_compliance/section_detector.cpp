#include "section_detector.hpp"
#include "parser_strategy.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <algorithm>
#include <cctype>
#include <memory>

using namespace pdf_compliance;

SectionPattern::SectionPattern(SectionCategory category, std::vector<std::string> sources)
    : category(category), sources(std::move(sources)) {
  for (const auto& s : this->sources) {
    patterns.emplace_back(s, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
  }
}

const std::vector<int>& SectionMatchSet::pages_for(SectionCategory c) const {
  static const std::vector<int> none;
  auto it = pages.find(c);
  return it == pages.end() ? none : it->second;
}

SectionPatternSet pdf_compliance::default_section_patterns() {
  return {
      SectionPattern(SectionCategory::TechnicalRequirements,
                     {R"(technical\s+requirements?)", R"(technical\s+specifications?)", R"(system\s+requirements?)",
                      R"(technical\s+details)"}),
      SectionPattern(SectionCategory::Budget, {"budget", "financial", "cost", "pricing", "expenses?"}),
      SectionPattern(SectionCategory::Qualification,
                     {"qualifications?", "credentials?", "experience", "expertise", "competenc"}),
  };
}

// glyph names like /fi and /ffl decode to U+FB00..U+FB06; spell them out as plain letters
static std::string fold_ligatures(const std::string& s) {
  static const char* const expansions[] = {"ff", "fi", "fl", "ffi", "ffl", "st", "st"};

  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char b0 = static_cast<unsigned char>(s[i]);
    if (b0 == 0xEF && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xAC) {
      unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
      if (b2 >= 0x80 && b2 <= 0x86) {
        out += expansions[b2 - 0x80];
        i += 2;
        continue;
      }
    }
    out.push_back(s[i]);
  }
  return out;
}

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

SectionDetector::SectionDetector(std::ostream& log) : SectionDetector(default_section_patterns(), log) {}

SectionDetector::SectionDetector(SectionPatternSet patterns, std::ostream& log)
    : m_patterns(std::move(patterns)), m_log(log) {}

SectionMatchSet SectionDetector::empty_matches() const {
  SectionMatchSet matches;
  for (SectionCategory c : all_section_categories()) matches.pages[c];
  for (const auto& p : m_patterns) matches.pages[p.category];
  return matches;
}

void SectionDetector::match_page(const std::string& text, int page_number, SectionMatchSet& matches) const {
  if (text.empty()) return;
  std::string lower = to_lower(fold_ligatures(text));

  for (const auto& section : m_patterns) {
    for (const auto& re : section.patterns) {
      if (std::regex_search(lower, re)) {
        auto& pages = matches.pages[section.category];
        if (std::find(pages.begin(), pages.end(), page_number) == pages.end()) pages.push_back(page_number);
        break;
      }
    }
  }
}

SectionMatchSet SectionDetector::detect(const ByteBuffer& bytes) const {
  SectionMatchSet matches = empty_matches();

  std::unique_ptr<poppler::document> doc;
  try {
    doc = open_poppler_document(bytes);
  } catch (const std::exception& e) {
    m_log << "pdf_compliance: sections: " << e.what() << std::endl;
    matches.diagnostic = e.what();
    return matches;
  }

  for (int i = 0; i < doc->pages(); ++i) {
    int page_number = i + 1;
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      m_log << "pdf_compliance: sections: page " << page_number << " could not be loaded" << std::endl;
      continue;
    }

    try {
      poppler::byte_array utf8 = page->text().to_utf8();
      match_page(std::string(utf8.begin(), utf8.end()), page_number, matches);
    } catch (const std::exception& e) {
      m_log << "pdf_compliance: sections: page " << page_number << " has no extractable text: " << e.what()
            << std::endl;
    }
  }
  return matches;
}
