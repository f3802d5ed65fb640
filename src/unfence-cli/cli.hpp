#pragma once

#include <iosfwd>

namespace unfence {

// Runs the command line front end: `argv[1..argc)` are the arguments, the
// markdown is read from `in` (or the named file) and the stripped text is
// written to `out`. Returns the process exit code.
[[nodiscard]] int run_cli(int argc, const char* const* argv, std::istream& in,
    std::ostream& out, std::ostream& err);

} // namespace unfence
