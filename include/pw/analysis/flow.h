#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pw/analysis/code_analyzer.h"
#include "pw/analysis/syntax.h"

namespace pw::analysis {

// Name of the untrusted source an expression reads from, if any
// ("req.body", "process.argv", "fetch", ...).
std::optional<std::string> UntrustedSource(const Expression& expr);

// True when the expression passes through a known sanitizer or converter.
bool IsSanitized(const Expression& expr);

// Flow-sensitive pass: variables assigned directly from an untrusted source,
// used in a later sink call without a sanitizer in between.
std::vector<SecurityVulnerability> RunDataFlowPass(const SyntaxTree& tree);

// Flow-insensitive fixed point: taint spreads through any assignment whose
// value references a tainted name; every sink call touching a tainted name is
// reported.
std::vector<SecurityVulnerability> RunTaintPass(const SyntaxTree& tree);

} // namespace pw::analysis
