#pragma once
#include <cstdio>

/**
 * @file Logger.hpp
 * @brief Destino de mensagens de relatório e diagnóstico.
 *
 * Substitui um interruptor global de impressão: quem invoca o jogo decide
 * onde (e se) as mensagens aparecem passando um `Logger` explicitamente.
 */

namespace cavern {

/** @brief Níveis de severidade, em ordem crescente. */
enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/**
 * @brief Logger simples no estilo `printf`.
 *
 * `report()` escreve linhas de resultado (pontuação, semente) no fluxo de
 * saída; `debug()/warn()/error()` escrevem diagnósticos no fluxo de erro.
 */
class Logger {
public:
    /**
     * @brief Constrói um logger.
     * @param level nível mínimo emitido
     * @param out fluxo para relatórios (padrão: stdout)
     * @param err fluxo para diagnósticos (padrão: stderr)
     */
    explicit Logger(LogLevel level = LogLevel::Info, std::FILE* out = stdout, std::FILE* err = stderr)
        : level_(level), out_(out), err_(err) {}

    LogLevel level() const { return level_; }
    void setLevel(LogLevel l) { level_ = l; }
    bool enabled(LogLevel l) const { return level_ != LogLevel::Off && l >= level_; }

    /** @brief Linha de relatório (nível Info) no fluxo de saída. */
    void report(const char* fmt, ...);
    void debug(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

    /** @brief Logger compartilhado que descarta tudo. */
    static Logger& silent();

private:
    LogLevel level_;
    std::FILE* out_;
    std::FILE* err_;
};

} // namespace cavern
