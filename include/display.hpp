#pragma once
#include <SDL2/SDL.h>
#include <cstdint>
#include <string>

class Input;  // 前方宣言

class Display {
public:
    explicit Display(int scale = 3);
    ~Display();

    bool init(const std::string& title);
    void updateFrame(const uint32_t* framebuffer);
    void setTitle(const std::string& title);
    bool handleEvents(Input* input = nullptr); // false if quit requested
    void close();

private:
    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture* texture = nullptr;
    bool sdlInitialized = false;

    int scale;
};
