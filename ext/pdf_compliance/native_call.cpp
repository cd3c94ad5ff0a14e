#include "native_call.hpp"
#include "compliance_analyzer.hpp"

#include <cstdio>
#include <iostream>

using namespace pdf_compliance;

CompliancePolicy pdf_compliance::policy_from(const PolicyArgs& args) {
  CompliancePolicy policy = CompliancePolicy::defaults();
  if (args.has_font_size) policy.required_font_size = args.font_size;
  if (args.font_family) policy.required_font_family = args.font_family;
  if (args.has_margin) policy.required_margin_inches = args.margin;
  if (args.has_margin_tolerance) policy.margin_tolerance_inches = args.margin_tolerance;
  if (args.has_font_size_tolerance) policy.font_size_tolerance = args.font_size_tolerance;
  for (size_t c = 0; c < SECTION_CATEGORY_COUNT; ++c) {
    if (args.has_limit[c]) policy.section_page_limits[static_cast<SectionCategory>(c)] = args.limit[c];
  }
  return policy;
}

static void copy_content(const ContentResult& content, NativeOutcome& out) {
  for (const auto& kv : content.sections) {
    size_t c = static_cast<size_t>(kv.first);
    out.has_section[c] = true;
    out.sections[c] = kv.second;
  }
}

bool pdf_compliance::run_native(NativeOperation op, const unsigned char* data, size_t length, const PolicyArgs& args,
                                NativeOutcome& out) noexcept {
  try {
    ByteBuffer buf(data, data + length);

    if (op == NativeOperation::Validity) {
      DocumentValidityChecker checker(std::cerr);
      out.valid = checker.is_valid(buf);
      return true;
    }

    ComplianceAnalyzer analyzer(policy_from(args), std::cerr);
    if (op == NativeOperation::Format || op == NativeOperation::Analyze) {
      out.format = analyzer.validate_formatting(buf).fields();
    }
    if (op == NativeOperation::Content || op == NativeOperation::Analyze) {
      copy_content(analyzer.validate_content(buf), out);
    }
    return true;
  } catch (const std::exception& e) {
    std::snprintf(out.error, sizeof(out.error), "%s", e.what());
    return false;
  }
}
