#pragma once

#include <ostream>

namespace protoplan {

/**
 * @brief Runs the command-line front end.
 *
 * Results and help go to `out`, diagnostics to `err`.
 *
 * @return Process exit status: 0 on success, 1 on any error.
 */
int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err);

} // namespace protoplan
