#pragma once
#include <string>
#include "Cavern.hpp"
#include "GameRun.hpp"

/**
 * @file Display.hpp
 * @brief Interface estreita de notificação para uma visualização opcional.
 */

namespace cavern {

/**
 * @brief Destino de eventos do jogo (posição, ouro, fase, erros).
 *
 * Todas as notificações têm implementação vazia; o motor funciona igual com
 * ou sem visualização. Chamadas sempre no processo do motor, nunca na
 * callback do resolvedor.
 */
class Display {
public:
    virtual ~Display() = default;

    /** @brief Nova caverna em uso (início de fase). */
    virtual void cavernChanged(const Cavern& cav, Phase phase, int stepsRemaining) { (void)cav; (void)phase; (void)stepsRemaining; }
    virtual void positionChanged(const Node& n) { (void)n; }
    virtual void stepsRemainingChanged(int steps) { (void)steps; }
    virtual void bonusChanged(double bonus) { (void)bonus; }
    virtual void goldChanged(int gold, int score) { (void)gold; (void)score; }
    /** @brief Rótulo de fase ("Finding", "Scramming", "Scram succeeded"...). */
    virtual void phaseChanged(const std::string& label) { (void)label; }
    virtual void errorShown(const std::string& message) { (void)message; }
};

/** @brief Visualização ausente: ignora todos os eventos. */
class NullDisplay : public Display {};

} // namespace cavern
