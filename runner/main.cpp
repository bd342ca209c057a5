/**
 * @file runner/main.cpp
 * @brief Executável sem interface gráfica: joga uma série de partidas com o `GreedySolver`.
 *
 * Como executar:
 * - `./cavern_run -s 42 -n 5`
 * - `./cavern_run -l find.cav scram.cav --no-timeout`
 *
 * A visualização (`-g`) só existe no `cavern_sim` (`-DBUILD_SIM=ON`).
 */
#include <cstdio>
#include <string>
#include <vector>
#include "core/CavernIO.hpp"
#include "core/Logger.hpp"
#include "core/RunOptions.hpp"
#include "core/Session.hpp"
#include "solver/GreedySolver.hpp"

using namespace cavern;

int main(int argc, char** argv) {
    const std::string prog = argc > 0 ? argv[0] : "cavern_run";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    RunOptions opt;
    try {
        opt = parseRunOptions(args);
    } catch (const ConfigError& e) {
        std::fprintf(stderr, "%s\n%s", e.what(), runUsage(prog).c_str());
        return 2;
    }
    if (opt.help) {
        std::printf("%s", runUsage(prog).c_str());
        return 0;
    }
    if (opt.display) {
        std::fprintf(stderr, "Error, the display is only available in cavern_sim (configure with -DBUILD_SIM=ON)\n");
        return 2;
    }

    Logger log(opt.quiet ? LogLevel::Error : LogLevel::Info);
    GreedySolver solver;
    try {
        runSession(opt, solver, log);
    } catch (const FormatError& e) {
        log.error("cavern file: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        log.error("%s", e.what());
        return 1;
    }
    return 0;
}
