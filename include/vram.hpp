#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    uint32_t toARGB() const {
        return 0xFF000000u | (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) | b;
    }
    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// PPU専用のVRAM(32KB) + パレット
//
// 0x0000-0x0FFF : タイルパターン (1タイル16byte, 1行 = plane0,plane1 の2byte)
// 0x1000-       : タイルマップ (1セル1byte、32セル/行)
class VideoMemory {
public:
    static constexpr uint32_t SIZE          = 0x8000;
    static constexpr uint16_t PATTERN_BASE  = 0x0000;
    static constexpr uint16_t PATTERN_SIZE  = 0x1000;
    static constexpr uint16_t TILEMAP_BASE  = 0x1000;
    static constexpr size_t   PALETTE_SIZE  = 256;

    VideoMemory();

    uint8_t readByte(uint16_t addr) const { return vram[addr & (SIZE - 1)]; }
    void writeByte(uint16_t addr, uint8_t val) { vram[addr & (SIZE - 1)] = val; }

    bool loadTiles(const std::vector<uint8_t>& bytes);
    bool loadTileMap(const std::vector<uint8_t>& bytes);

    // index 0 は透明(背景)扱いで描画されないが、値自体は保持する
    bool setPalette(const std::vector<Color>& colors);
    const Color& paletteColor(uint8_t index) const { return palette[index]; }

    void clear();

private:
    std::vector<uint8_t> vram;                  // 32KB
    std::array<Color, PALETTE_SIZE> palette{};  // 全て黒で初期化
};
