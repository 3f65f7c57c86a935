/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

// Minimal SDL3 host for the simulation core: keyboard in, flat-colored boxes out.

#include "core/ConfigLoader.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <variant>

namespace
{

const std::string GAME_NAME{"Cosmic Defenders"};

Cosmic::InputIntent readInput(const bool* keys, bool specialPressed)
{
    float x = 0.0f;
    float y = 0.0f;
    if (keys[SDL_SCANCODE_LEFT] || keys[SDL_SCANCODE_A]) {
        x -= 1.0f;
    }
    if (keys[SDL_SCANCODE_RIGHT] || keys[SDL_SCANCODE_D]) {
        x += 1.0f;
    }
    if (keys[SDL_SCANCODE_UP] || keys[SDL_SCANCODE_W]) {
        y -= 1.0f;
    }
    if (keys[SDL_SCANCODE_DOWN] || keys[SDL_SCANCODE_S]) {
        y += 1.0f;
    }

    Cosmic::InputIntent input;
    input.moveVector = Vector2D(x, y);
    input.fireHeld = keys[SDL_SCANCODE_SPACE];
    input.specialPressed = specialPressed;
    return input;
}

void fillBody(SDL_Renderer* renderer, const Cosmic::Body& body)
{
    const SDL_FRect rect{body.position.getX() - body.size.getX() * 0.5f,
                         body.position.getY() - body.size.getY() * 0.5f,
                         body.size.getX(), body.size.getY()};
    SDL_RenderFillRect(renderer, &rect);
}

void render(SDL_Renderer* renderer, const Cosmic::GameSession& session)
{
    const Cosmic::EntityStore& store = session.getStore();

    SDL_SetRenderDrawColor(renderer, 5, 5, 20, 255);
    SDL_RenderClear(renderer);

    SDL_SetRenderDrawColor(renderer, 255, 160, 40, 255);
    for (const auto& particle : session.getParticles().getParticles()) {
        const SDL_FRect rect{particle.position.getX(), particle.position.getY(), particle.size,
                             particle.size};
        SDL_RenderFillRect(renderer, &rect);
    }

    SDL_SetRenderDrawColor(renderer, 80, 220, 120, 255);
    for (const auto& powerUp : store.getPowerUps()) {
        fillBody(renderer, powerUp);
    }

    for (const auto& enemy : store.getEnemies()) {
        if (enemy.isBoss()) {
            SDL_SetRenderDrawColor(renderer, 200, 40, 200, 255);
        } else {
            SDL_SetRenderDrawColor(renderer, 220, 60, 60, 255);
        }
        fillBody(renderer, enemy);
    }

    for (const auto& bullet : store.getBullets()) {
        if (bullet.faction == Cosmic::Faction::Player) {
            SDL_SetRenderDrawColor(renderer, 240, 240, 120, 255);
        } else {
            SDL_SetRenderDrawColor(renderer, 255, 90, 90, 255);
        }
        fillBody(renderer, bullet);
    }

    const Cosmic::Player& player = store.getPlayer();
    if (player.alive) {
        const bool blink = player.isInvulnerable() &&
                           (static_cast<int>(player.invulnerableTimer * 10.0f) % 2 == 0);
        if (!blink) {
            SDL_SetRenderDrawColor(renderer, 90, 160, 255, 255);
            fillBody(renderer, player);
        }
    }

    SDL_RenderPresent(renderer);
}

void logEvents(const Cosmic::EventQueue& events)
{
    for (const auto& event : events) {
        if (const auto* wave = std::get_if<Cosmic::WaveCompleted>(&event)) {
            GAMELOOP_INFO("Wave " + std::to_string(wave->wave) + " cleared");
        } else if (const auto* level = std::get_if<Cosmic::LevelCompleted>(&event)) {
            GAMELOOP_INFO("Level " + std::to_string(level->level) + " complete with score " +
                          std::to_string(level->score) + ", press N for the next level");
        } else if (const auto* over = std::get_if<Cosmic::GameOver>(&event)) {
            GAMELOOP_INFO("Game over - final score " + std::to_string(over->finalScore) +
                          " on wave " + std::to_string(over->wave) + ", press R to restart");
        }
    }
}

} // namespace

int main(int argc, char* argv[])
{
    GAMELOOP_INFO("Initializing " + GAME_NAME);

    Cosmic::GameConfig config;
    if (argc > 1) {
        Cosmic::ConfigLoader loader;
        if (!loader.loadFromFile(argv[1], config)) {
            GAMELOOP_CRITICAL("Invalid config " + std::string(argv[1]) + ": " + loader.getLastError());
            return EXIT_FAILURE;
        }
    }

    uint32_t seed = Cosmic::SeededRandom::DEFAULT_SEED;
    if (argc > 2) {
        seed = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));
    }

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        GAMELOOP_CRITICAL(std::string("SDL initialization failed: ") + SDL_GetError());
        return EXIT_FAILURE;
    }

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    if (!SDL_CreateWindowAndRenderer(GAME_NAME.c_str(), static_cast<int>(config.field.width),
                                     static_cast<int>(config.field.height), 0, &window, &renderer)) {
        GAMELOOP_CRITICAL(std::string("Window creation failed: ") + SDL_GetError());
        SDL_Quit();
        return EXIT_FAILURE;
    }
    SDL_SetRenderVSync(renderer, 1);

    Cosmic::GameSession session(config, seed);
    Cosmic::TimestepManager timestep(60.0f, 1.0f / config.referenceTickRate);

    GAMELOOP_INFO("Starting Main Loop");

    bool running = true;
    bool specialQueued = false;
    while (running) {
        timestep.startFrame();

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT) {
                running = false;
            } else if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
                if (event.key.scancode == SDL_SCANCODE_ESCAPE) {
                    running = false;
                } else if (event.key.scancode == SDL_SCANCODE_LSHIFT ||
                           event.key.scancode == SDL_SCANCODE_E) {
                    specialQueued = true;
                } else if (event.key.scancode == SDL_SCANCODE_R && session.isGameOver()) {
                    session.reset();
                } else if (event.key.scancode == SDL_SCANCODE_N && session.isLevelComplete()) {
                    session.startNextLevel();
                }
            }
        }

        const bool* keys = SDL_GetKeyboardState(nullptr);
        while (timestep.shouldUpdate()) {
            session.tick(readInput(keys, specialQueued), timestep.getUpdateDeltaTime());
            specialQueued = false;
            logEvents(session.drainEvents());
        }

        render(renderer, session);
        timestep.endFrame();
    }

    GAMELOOP_INFO("Shutting down with score " + std::to_string(session.getScore()));
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return EXIT_SUCCESS;
}
