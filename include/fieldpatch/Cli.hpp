/**
 * @file Cli.hpp
 * @brief Command-line front end over a file-backed LocalStore
 *
 * Commands:
 * - plan       predict the projection and takeovers
 * - apply      apply the patch and write the binding state
 * - reconcile  detect and correct drift, refreshing the state
 * - release    hand taken-over fields back and remove the state
 * - ownership  print path → owner for the target
 * - paths      print the paths a patch touches
 */

#ifndef FIELDPATCH_CLI_HPP
#define FIELDPATCH_CLI_HPP

#include <ostream>

namespace fieldpatch {

/**
 * @brief Run one command
 * @return 0 on success, 1 on any fatal error (message written to `err`)
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace fieldpatch

#endif // FIELDPATCH_CLI_HPP
