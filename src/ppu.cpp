#include "ppu.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

PPU::PPU() {
    reset();
}

void PPU::reset() {
    vram.clear();
    clear();
}

void PPU::clear() {
    std::fill(framebuffer, framebuffer + SCREEN_WIDTH * SCREEN_HEIGHT, BACKDROP);
}

std::array<uint8_t, 8> PPU::decodeTileRow(uint8_t plane0, uint8_t plane1) {
    std::array<uint8_t, 8> row{};
    for (int tx = 0; tx < 8; ++tx) {
        int bit = 7 - tx;
        row[tx] = static_cast<uint8_t>(((plane1 >> bit) & 0x01) << 1 |
                                       ((plane0 >> bit) & 0x01));
    }
    return row;
}

void PPU::renderFrame() {
    // 毎フレーム全面を塗り直す
    clear();

    // 背景タイルを行優先で並べる
    for (int row = 0; row < MAP_ROWS; ++row) {
        for (int col = 0; col < MAP_COLUMNS; ++col) {
            uint16_t mapAddr = static_cast<uint16_t>(VideoMemory::TILEMAP_BASE + row * MAP_COLUMNS + col);
            uint8_t tileIndex = vram.readByte(mapAddr);
            renderTile(col * TILE_SIZE, row * TILE_SIZE, tileIndex);
        }
    }
}

void PPU::renderTile(int x, int y, uint8_t tileIndex) {
    uint16_t tileAddr = static_cast<uint16_t>(VideoMemory::PATTERN_BASE + tileIndex * 16);

    for (int ty = 0; ty < TILE_SIZE; ++ty) {
        uint8_t plane0 = vram.readByte(tileAddr);
        uint8_t plane1 = vram.readByte(tileAddr + 1);
        tileAddr += 2;

        std::array<uint8_t, 8> colors = decodeTileRow(plane0, plane1);
        uint32_t* line = &framebuffer[(y + ty) * SCREEN_WIDTH + x];
        for (int tx = 0; tx < TILE_SIZE; ++tx) {
            if (colors[tx] == 0) continue;  // 0番は透明
            line[tx] = vram.paletteColor(colors[tx]).toARGB();
        }
    }
}

bool PPU::saveFramePPM(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        std::cerr << "[PPU] Failed to open frame dump: " << path << std::endl;
        return false;
    }

    out << "P6\n" << SCREEN_WIDTH << " " << SCREEN_HEIGHT << "\n255\n";
    for (int y = 0; y < SCREEN_HEIGHT; ++y) {
        const uint32_t* line = &framebuffer[y * SCREEN_WIDTH];
        for (int x = 0; x < SCREEN_WIDTH; ++x) {
            uint32_t pixel = line[x];
            out.put(static_cast<char>((pixel >> 16) & 0xFF));
            out.put(static_cast<char>((pixel >> 8) & 0xFF));
            out.put(static_cast<char>(pixel & 0xFF));
        }
    }
    return static_cast<bool>(out);
}
