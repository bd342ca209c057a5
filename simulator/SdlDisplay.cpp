#include "SdlDisplay.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include "core/CavernIO.hpp"
#include "core/Config.hpp"

namespace fs = std::filesystem;

namespace cavern {

static constexpr int MARGIN = 20;

SdlDisplay::SdlDisplay(int width, int height, int stepDelayMs)
    : width_(width), height_(height), stepDelayMs_(stepDelayMs) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        throw std::runtime_error(std::string("SDL_Init error: ") + SDL_GetError());
    }
    win_ = SDL_CreateWindow("Cavern", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, width, height, SDL_WINDOW_SHOWN);
    if (!win_) {
        std::string err = std::string("SDL_CreateWindow error: ") + SDL_GetError();
        SDL_Quit();
        throw std::runtime_error(err);
    }
    ren_ = SDL_CreateRenderer(win_, -1, SDL_RENDERER_ACCELERATED);
    if (!ren_) {
        std::string err = std::string("SDL_CreateRenderer error: ") + SDL_GetError();
        SDL_DestroyWindow(win_);
        SDL_Quit();
        throw std::runtime_error(err);
    }
}

SdlDisplay::~SdlDisplay() {
    if (ren_) SDL_DestroyRenderer(ren_);
    if (win_) SDL_DestroyWindow(win_);
    SDL_Quit();
}

void SdlDisplay::cavernChanged(const Cavern& cav, Phase phase, int stepsRemaining) {
    cav_ = cav;
    phase_ = phase;
    steps_ = stepsRemaining;
    position_ = cav.entranceIndex();
    error_.clear();
    redraw();
}

void SdlDisplay::positionChanged(const Node& n) {
    position_ = n.index();
    // o ouro do ladrilho é recolhido ao entrar no SCRAM
    if (cav_ && phase_ == Phase::Scram) cav_->node(position_).tile().takeGold();
    redraw();
    if (stepDelayMs_ > 0 && !closed_) SDL_Delay(static_cast<Uint32>(stepDelayMs_));
}

void SdlDisplay::stepsRemainingChanged(int steps) { steps_ = steps; updateTitle(); }
void SdlDisplay::bonusChanged(double bonus) { bonus_ = bonus; updateTitle(); }
void SdlDisplay::goldChanged(int gold, int score) { gold_ = gold; score_ = score; updateTitle(); }
void SdlDisplay::phaseChanged(const std::string& label) { label_ = label; redraw(); }
void SdlDisplay::errorShown(const std::string& message) { error_ = message; redraw(); }

void SdlDisplay::pump() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        if (e.type == SDL_QUIT) closed_ = true;
        if (e.type == SDL_KEYDOWN) {
            if (e.key.keysym.sym == SDLK_ESCAPE) closed_ = true;
            if (e.key.keysym.sym == SDLK_s) saveCurrent();
        }
    }
    if (closed_ && win_) SDL_HideWindow(win_);
}

void SdlDisplay::saveCurrent() {
    if (!cav_) return;
    std::error_code ec;
    fs::create_directories("caverns", ec);
    char name[64];
    std::snprintf(name, sizeof(name), "cavern_%s_%d.cav", phaseName(phase_), ++saved_);
    const fs::path out = fs::path("caverns") / name;
    if (ec || !CavernIO::saveFile(out.string(), *cav_)) {
        std::fprintf(stderr, "Falha ao salvar %s\n", out.string().c_str());
    } else {
        std::printf("Salvo: %s\n", out.string().c_str());
    }
}

void SdlDisplay::updateTitle() {
    if (closed_) return;
    char title[256];
    if (phase_ == Phase::Find) {
        std::snprintf(title, sizeof(title), "Cavern - %s - bonus=%.2f %s", label_.c_str(), bonus_, error_.c_str());
    } else {
        std::snprintf(title, sizeof(title), "Cavern - %s - steps=%d gold=%d score=%d %s",
                      label_.c_str(), steps_, gold_, score_, error_.c_str());
    }
    SDL_SetWindowTitle(win_, title);
}

void SdlDisplay::redraw() {
    pump();
    if (closed_) return;
    updateTitle();

    SDL_SetRenderDrawColor(ren_, 0, 0, 0, 255);
    SDL_RenderClear(ren_);
    if (!cav_) { SDL_RenderPresent(ren_); return; }

    const Cavern& cav = *cav_;
    const int cell = std::max(2, std::min((width_ - 2*MARGIN) / cav.cols(), (height_ - 2*MARGIN) / cav.rows()));
    auto x0 = [&](const Node& n) { return MARGIN + n.tile().column() * cell; };
    auto y0 = [&](const Node& n) { return MARGIN + n.tile().row() * cell; };

    // ladrilhos abertos
    SDL_SetRenderDrawColor(ren_, 60, 60, 60, 255);
    for (const Node& n : cav.nodes()) {
        SDL_Rect r{ x0(n) + 1, y0(n) + 1, cell - 2, cell - 2 };
        SDL_RenderFillRect(ren_, &r);
    }
    // arestas: mais claras quanto mais curtas
    for (const Edge& e : cav.edges()) {
        const Node& a = cav.node(e.a);
        const Node& b = cav.node(e.b);
        const int shade = 255 - (e.length - 1) * 160 / std::max(1, MAX_EDGE_WEIGHT - 1);
        SDL_SetRenderDrawColor(ren_, static_cast<Uint8>(shade), static_cast<Uint8>(shade), static_cast<Uint8>(shade), 255);
        SDL_RenderDrawLine(ren_, x0(a) + cell/2, y0(a) + cell/2, x0(b) + cell/2, y0(b) + cell/2);
    }
    // ouro
    SDL_SetRenderDrawColor(ren_, 230, 200, 0, 255);
    for (const Node& n : cav.nodes()) {
        const int g = n.tile().gold();
        if (g <= 0) continue;
        const int side = std::max(2, (cell / 2) * g / MAX_TILE_GOLD);
        SDL_Rect r{ x0(n) + (cell - side)/2, y0(n) + (cell - side)/2, side, side };
        SDL_RenderFillRect(ren_, &r);
    }
    SDL_Rect ent{ x0(cav.entrance()), y0(cav.entrance()), cell, cell };
    SDL_SetRenderDrawColor(ren_, 40, 80, 220, 255);
    SDL_RenderDrawRect(ren_, &ent);
    SDL_Rect tgt{ x0(cav.target()), y0(cav.target()), cell, cell };
    SDL_SetRenderDrawColor(ren_, 0, 200, 0, 255);
    SDL_RenderDrawRect(ren_, &tgt);

    if (position_ >= 0 && position_ < cav.nodeCount()) {
        const Node& p = cav.node(position_);
        SDL_SetRenderDrawColor(ren_, 200, 0, 0, 255);
        SDL_Rect body{ x0(p) + cell/4, y0(p) + cell/4, cell/2, cell/2 };
        SDL_RenderFillRect(ren_, &body);
    }
    SDL_RenderPresent(ren_);
}

void SdlDisplay::waitUntilClosed() {
    while (!closed_) {
        redraw();
        SDL_Delay(30);
    }
}

} // namespace cavern
