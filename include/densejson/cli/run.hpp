#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace densejson::cli {

inline constexpr int kUsageError = 2;

// Runs the densejson command line. args[0] is the program name.
//
// Returns 0 on success, kUsageError for malformed arguments and
// EXIT_FAILURE when reading, resolving, filtering or rendering fails.
// The rendering goes to `out`; every diagnostic is a single line on `err`.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace densejson::cli
