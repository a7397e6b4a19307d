#pragma once

#include <string>

namespace consolebar {
namespace bar {

// Formats value with a numeric pattern. Standard specifiers: P[n], F[n],
// N[n], G. Anything else is a custom pattern built from 0 # . , % and
// literals, with up to three ';'-separated sections (positive;negative;zero).
// "0%" renders 0.355 as "36%".
std::string formatPercentage(double value, const std::string& pattern);

}}
