/**
 * @file SdlDisplay.hpp
 * @brief Visualização 2D (SDL2) dos eventos do jogo.
 */
#pragma once
#include <SDL2/SDL.h>
#include <optional>
#include <string>
#include "core/Cavern.hpp"
#include "core/Display.hpp"

namespace cavern {

/**
 * @brief `Display` que desenha a caverna corrente em uma janela SDL2.
 *
 * Paredes em preto, ladrilhos abertos em cinza, arestas mais claras quanto
 * menor o comprimento, ouro em amarelo, entrada em azul, alvo/saída em verde
 * e o explorador em vermelho. Contadores vão para o título da janela.
 *
 * Controles:
 * - ESC: fechar a janela (o jogo continua sem desenhar)
 * - S: salvar a caverna exibida em `caverns/`
 */
class SdlDisplay : public Display {
public:
    /**
     * @brief Abre a janela.
     * @param width largura em pixels
     * @param height altura em pixels
     * @param stepDelayMs pausa após cada movimento (0 = sem pausa)
     * @throws std::runtime_error se a SDL2 não puder ser inicializada
     */
    SdlDisplay(int width, int height, int stepDelayMs = 0);
    ~SdlDisplay() override;

    SdlDisplay(const SdlDisplay&) = delete;
    SdlDisplay& operator=(const SdlDisplay&) = delete;

    void cavernChanged(const Cavern& cav, Phase phase, int stepsRemaining) override;
    void positionChanged(const Node& n) override;
    void stepsRemainingChanged(int steps) override;
    void bonusChanged(double bonus) override;
    void goldChanged(int gold, int score) override;
    void phaseChanged(const std::string& label) override;
    void errorShown(const std::string& message) override;

    bool closed() const { return closed_; }

    /** @brief Mantém a janela aberta até o usuário fechá-la. */
    void waitUntilClosed();

private:
    void pump();
    void redraw();
    void updateTitle();
    void saveCurrent();

    SDL_Window* win_{nullptr};
    SDL_Renderer* ren_{nullptr};
    int width_;
    int height_;
    int stepDelayMs_;
    bool closed_{false};

    std::optional<Cavern> cav_{};
    Phase phase_{Phase::Find};
    int position_{-1};
    int steps_{0};
    double bonus_{0.0};
    int gold_{0};
    int score_{0};
    int saved_{0};
    std::string label_{};
    std::string error_{};
};

} // namespace cavern
