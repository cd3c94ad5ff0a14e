#pragma once

#include <array>
#include <cstddef>
#include <utility>

#include "compliance_types.hpp"

namespace pdf_compliance {

/**
 * Policy overrides as plain values. Everything here and in NativeOutcome is trivially
 * destructible, so a language binding may unwind past it with longjmp.
 */
struct PolicyArgs {
  bool has_font_size = false;
  int font_size = 0;
  const char* font_family = nullptr;  // borrowed, must outlive the call
  bool has_margin = false;
  double margin = 0;
  bool has_margin_tolerance = false;
  double margin_tolerance = 0;
  bool has_font_size_tolerance = false;
  int font_size_tolerance = 0;
  bool has_limit[SECTION_CATEGORY_COUNT] = {};
  int limit[SECTION_CATEGORY_COUNT] = {};
};

struct NativeOutcome {
  bool valid = false;
  std::array<std::pair<const char*, CheckStatus>, 4> format = {};
  bool has_section[SECTION_CATEGORY_COUNT] = {};
  SectionVerdict sections[SECTION_CATEGORY_COUNT] = {};
  char error[512] = {};
};

enum class NativeOperation { Analyze, Format, Content, Validity };

/** Defaults with every override in `args` applied. */
CompliancePolicy policy_from(const PolicyArgs& args);

/**
 * Runs one operation over `length` bytes at `data`. Returns false with `out.error` set instead of
 * throwing; the C++ objects it builds are gone by the time it returns.
 */
bool run_native(NativeOperation op, const unsigned char* data, size_t length, const PolicyArgs& args,
                NativeOutcome& out) noexcept;

}  // namespace pdf_compliance
