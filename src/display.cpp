#include "display.hpp"
#include "input.hpp"
#include "ppu.hpp"
#include <iostream>

Display::Display(int scale)
    : scale(scale > 0 ? scale : 1) {}

Display::~Display() {
    close();
}

bool Display::init(const std::string& title) {
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "[SDL] init error: " << SDL_GetError() << std::endl;
        return false;
    }
    sdlInitialized = true;

    window = SDL_CreateWindow(
        title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        PPU::SCREEN_WIDTH * scale,
        PPU::SCREEN_HEIGHT * scale,
        SDL_WINDOW_SHOWN
    );

    if (!window) {
        std::cerr << "[SDL] Window creation error: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "[SDL] Renderer creation error: " << SDL_GetError() << std::endl;
        return false;
    }

    texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        PPU::SCREEN_WIDTH,
        PPU::SCREEN_HEIGHT
    );

    if (!texture) {
        std::cerr << "[SDL] Texture creation error: " << SDL_GetError() << std::endl;
        return false;
    }

    std::cout << "[SDL] Display initialized successfully" << std::endl;
    return true;
}

void Display::updateFrame(const uint32_t* framebuffer) {
    if (!texture || !renderer) return;

    void* pixels;
    int pitch;

    if (SDL_LockTexture(texture, nullptr, &pixels, &pitch) == 0) {
        uint32_t* dest = static_cast<uint32_t*>(pixels);
        const int stride = pitch / static_cast<int>(sizeof(uint32_t)); // pitchは幅*4とは限らない

        for (int y = 0; y < PPU::SCREEN_HEIGHT; ++y) {
            for (int x = 0; x < PPU::SCREEN_WIDTH; ++x) {
                dest[y * stride + x] = framebuffer[y * PPU::SCREEN_WIDTH + x];
            }
        }

        SDL_UnlockTexture(texture);
    }

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

void Display::setTitle(const std::string& title) {
    if (window) SDL_SetWindowTitle(window, title.c_str());
}

bool Display::handleEvents(Input* input) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_QUIT) {
            return false;
        }

        if (event.type != SDL_KEYDOWN || event.key.repeat) continue;

        // ESCキーで終了
        if (event.key.keysym.sym == SDLK_ESCAPE) {
            return false;
        }

        if (!input) continue;

        // メニュー/ツールバー相当のキー割り当て
        switch (event.key.keysym.sym) {
            case SDLK_RETURN:
            case SDLK_SPACE:
                input->press(HostCommand::Start);
                break;
            case SDLK_p:
                input->press(HostCommand::Pause);
                break;
            case SDLK_r:
                input->press(HostCommand::Reset);
                break;
            case SDLK_o:
                input->press(HostCommand::OpenROM);
                break;
            case SDLK_c:
                input->press(HostCommand::CloseROM);
                break;
            case SDLK_F2:
                input->press(HostCommand::ShowCPUState);
                break;
        }
    }
    return true;
}

void Display::close() {
    if (texture) {
        SDL_DestroyTexture(texture);
        texture = nullptr;
    }
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    if (sdlInitialized) {
        SDL_Quit();
        sdlInitialized = false;
    }
}
