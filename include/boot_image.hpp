#pragma once
#include <cstdint>
#include <vector>
#include "vram.hpp"

// リセット時にCPU/PPUを組み立て直すための初期イメージ
struct BootImage {
    struct Segment {
        uint16_t origin = 0;
        std::vector<uint8_t> bytes;
    };

    std::vector<Segment> program;
    bool hasResetVector = false;
    uint16_t resetVector = 0;

    std::vector<uint8_t> tiles;     // パターン領域の先頭から
    std::vector<Color> palette;
    std::vector<uint8_t> tileMap;   // TILEMAP_BASEから
};

// 縞模様タイル + 4色パレット + 斜めに並ぶタイルマップ + $2000/$2006へ書き込むループ
BootImage demoBootImage();
