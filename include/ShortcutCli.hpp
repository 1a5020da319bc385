#ifndef SHORTCUT_CLI_HPP
#define SHORTCUT_CLI_HPP

#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief Runs one shortcutctl command.
 * @param args Command line without the program name.
 * @return 0 on success, 1 when the operation was refused or a file could not be written,
 *         2 on a usage error.
 */
int run_shortcut_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

#endif
