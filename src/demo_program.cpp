#include "boot_image.hpp"
#include "cpu.hpp"
#include "ppu.hpp"

BootImage demoBootImage() {
    BootImage image;

    std::vector<uint8_t> p;
    auto emit16 = [&](uint16_t v) { p.push_back(v & 0xFF); p.push_back(v >> 8); };
    p.push_back(0xA9); p.push_back(0x01);     // LDA #$01
    p.push_back(0x8D); emit16(0x2000);        // STA $2000
    p.push_back(0xA9); p.push_back(0x3F);     // LDA #$3F
    p.push_back(0x8D); emit16(0x2006);        // STA $2006
    p.push_back(0xA9); p.push_back(0x00);     // LDA #$00
    p.push_back(0x8D); emit16(0x2006);        // STA $2006
    p.push_back(0x4C); emit16(CPU::BOOT_PC);  // JMP $8000 (loop)
    image.program.push_back({CPU::BOOT_PC, p});

    image.hasResetVector = true;
    image.resetVector = CPU::BOOT_PC;

    // 各タイルの1行目だけ 10101010 / 01010101
    image.tiles.assign(VideoMemory::PATTERN_SIZE, 0);
    for (int i = 0; i < 256; ++i) {
        image.tiles[i * 16]     = 0xAA;
        image.tiles[i * 16 + 1] = 0x55;
    }

    image.palette = {
        {0, 0, 0},      // 0: Black (透明)
        {255, 0, 0},    // 1: Red
        {0, 255, 0},    // 2: Green
        {0, 0, 255},    // 3: Blue
    };

    image.tileMap.resize(PPU::MAP_COLUMNS * PPU::MAP_ROWS);
    for (int y = 0; y < PPU::MAP_ROWS; ++y) {
        for (int x = 0; x < PPU::MAP_COLUMNS; ++x) {
            image.tileMap[y * PPU::MAP_COLUMNS + x] = static_cast<uint8_t>((x + y) % 256);
        }
    }

    return image;
}
