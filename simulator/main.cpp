/**
 * @file simulator/main.cpp
 * @brief Simulador SDL2: joga a série de partidas desenhando cada movimento.
 *
 * Como executar:
 * - Habilite o alvo do simulador no CMake: `-DBUILD_SIM=ON`.
 * - Garanta a dependência da SDL2 instalada no sistema (dev headers).
 * - Rode o executável gerado (ex.: `./cavern_sim -s 42`).
 *
 * Aceita as mesmas opções do `cavern_run`; a janela abre sempre. Com
 * `--no-timeout` cada movimento é desenhado com uma pequena pausa.
 *
 * Controles:
 * - ESC: fechar a janela
 * - S: salvar a caverna exibida em `caverns/`
 */
#include <cstdio>
#include <string>
#include <vector>
#include "SdlDisplay.hpp"
#include "core/CavernIO.hpp"
#include "core/Logger.hpp"
#include "core/RunOptions.hpp"
#include "core/Session.hpp"
#include "solver/GreedySolver.hpp"

using namespace cavern;

int main(int argc, char** argv) {
    const std::string prog = argc > 0 ? argv[0] : "cavern_sim";
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

    Logger log(opt.quiet ? LogLevel::Error : LogLevel::Info);
    GreedySolver solver;
    try {
        SdlDisplay display(1000, 700, opt.timeLimited ? 0 : 25);
        runSession(opt, solver, log, &display);
        display.waitUntilClosed();
    } catch (const FormatError& e) {
        log.error("cavern file: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        log.error("%s", e.what());
        return 1;
    }
    return 0;
}
