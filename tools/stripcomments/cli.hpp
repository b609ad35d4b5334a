#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace decomment::cli {

/**
 * True when the first argument (after global flags) is not a command name,
 * so "stripcomments file.py" is read as "stripcomments strip file.py".
 */
bool needs_default_command(const std::vector<std::string>& args,
                           const std::vector<std::string>& command_names);

/**
 * Parse arguments (without the program name) and execute the selected
 * command.
 *
 * @param in Source for --stdin
 * @param out Stripped text, listings and help
 * @param err Status and error messages
 * @return Exit code
 */
int run(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace decomment::cli
