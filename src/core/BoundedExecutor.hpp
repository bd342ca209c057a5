/**
 * @file BoundedExecutor.hpp
 * @brief Execução de callbacks não confiáveis com prazo de relógio.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include "Cavern.hpp"

namespace cavern {

/**
 * @brief Mensagem relatada pela callback ao motor.
 */
struct PhaseMessage {
    enum class Kind : uint8_t {
        Move = 1,       ///< Movimento validado para `node`
        OutOfSteps = 2, ///< Tentativa de mover além do orçamento (estado intacto)
        Done = 3,       ///< Callback retornou normalmente (terminal)
        Fault = 4       ///< Callback lançou exceção; `text` descreve (terminal)
    };
    Kind kind{Kind::Done};
    NodeId node{0};
    std::string text{};
};

/**
 * @brief Destino das mensagens emitidas pela callback.
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void send(const PhaseMessage& msg) = 0;
};

/** @brief Desfecho de uma execução limitada. */
enum class ExecStatus : uint8_t { Completed, Faulted, TimedOut };

/** @brief Nome legível do desfecho. */
const char* execStatusName(ExecStatus s);

struct ExecResult {
    ExecStatus status{ExecStatus::Completed};
    std::string detail{}; ///< Descrição da falha (vazio se concluído)
};

/**
 * @brief Executor de callbacks com prazo.
 *
 * `runIsolated` executa o corpo em um processo filho (heap própria) e recebe
 * as mensagens por um pipe; ao estourar o prazo o filho é morto com SIGKILL.
 * O estado do motor só muda pelo `handler`, chamado no processo pai para
 * cada mensagem recebida, de modo que abandonar o filho nunca deixa o motor
 * em estado parcial. Apenas uma callback executa por vez e o chamador
 * bloqueia até o fim ou o prazo.
 */
class BoundedExecutor {
public:
    using Body = std::function<void(MessageSink&)>;
    using Handler = std::function<void(const PhaseMessage&)>;

    /**
     * @brief Executa `body` em processo isolado com prazo.
     * @param body     callback; recebe o sink para relatar mensagens
     * @param deadline tempo máximo de relógio
     * @param handler  chamado no processo pai para cada mensagem não terminal
     * @return desfecho (Completed, Faulted ou TimedOut)
     * @throws std::system_error se não for possível criar o pipe ou o processo
     */
    static ExecResult runIsolated(const Body& body, std::chrono::milliseconds deadline, const Handler& handler);

    /**
     * @brief Executa `body` no próprio processo, sem prazo.
     *
     * Exceções do corpo viram `Faulted`.
     */
    static ExecResult runInline(const Body& body, const Handler& handler);
};

} // namespace cavern
