#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "Logging.hpp"
#include "ShortcutCli.hpp"

int main(int argc, char** argv) {
    // Store diagnostics stay quiet unless something goes wrong
    if (auto res = init_logging("warn", ""); !res) {
        spdlog::error("{}", res.error());
    }
    std::vector<std::string> args(argv + 1, argv + argc);
    return run_shortcut_cli(args, std::cout, std::cerr);
}
