#pragma once
#include <array>
#include <cstdint>
#include <string>
#include "vram.hpp"

class PPU {
public:
    static constexpr int SCREEN_WIDTH  = 256;
    static constexpr int SCREEN_HEIGHT = 224;
    static constexpr int TILE_SIZE     = 8;
    static constexpr int MAP_COLUMNS   = SCREEN_WIDTH / TILE_SIZE;   // 32
    static constexpr int MAP_ROWS      = SCREEN_HEIGHT / TILE_SIZE;  // 28
    static constexpr uint32_t BACKDROP = 0xFF000000;                 // 黒

    PPU();
    void reset();
    void renderFrame();
    void clear();

    // 1行ぶん(2byte)を色番号8個に展開する。先頭がbit7
    static std::array<uint8_t, 8> decodeTileRow(uint8_t plane0, uint8_t plane1);

    VideoMemory& videoMemory() { return vram; }
    const VideoMemory& videoMemory() const { return vram; }

    const uint32_t* getFrameBuffer() const { return framebuffer; }
    uint32_t pixel(int x, int y) const { return framebuffer[y * SCREEN_WIDTH + x]; }
    bool saveFramePPM(const std::string& path) const;

private:
    VideoMemory vram;
    uint32_t framebuffer[SCREEN_WIDTH * SCREEN_HEIGHT]; // 出力先ピクセル (ARGB8888)

    void renderTile(int x, int y, uint8_t tileIndex);
};
