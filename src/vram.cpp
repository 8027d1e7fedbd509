#include "vram.hpp"
#include <algorithm>
#include <iostream>

VideoMemory::VideoMemory()
    : vram(SIZE, 0) {}

bool VideoMemory::loadTiles(const std::vector<uint8_t>& bytes) {
    size_t count = std::min<size_t>(bytes.size(), PATTERN_SIZE);
    if (count < bytes.size()) {
        std::cerr << "[VRAM] Tile data overflows pattern region ("
                  << bytes.size() << " > " << PATTERN_SIZE << " bytes), truncated" << std::endl;
    }
    std::copy(bytes.begin(), bytes.begin() + count, vram.begin() + PATTERN_BASE);
    return count == bytes.size();
}

bool VideoMemory::loadTileMap(const std::vector<uint8_t>& bytes) {
    const size_t capacity = SIZE - TILEMAP_BASE;
    size_t count = std::min(bytes.size(), capacity);
    if (count < bytes.size()) {
        std::cerr << "[VRAM] Tile map overflows VRAM ("
                  << bytes.size() << " > " << capacity << " bytes), truncated" << std::endl;
    }
    std::copy(bytes.begin(), bytes.begin() + count, vram.begin() + TILEMAP_BASE);
    return count == bytes.size();
}

bool VideoMemory::setPalette(const std::vector<Color>& colors) {
    size_t count = std::min(colors.size(), PALETTE_SIZE);
    if (count < colors.size()) {
        std::cerr << "[VRAM] Palette has " << colors.size()
                  << " entries, only " << PALETTE_SIZE << " used" << std::endl;
    }
    std::copy(colors.begin(), colors.begin() + count, palette.begin());
    return count == colors.size();
}

void VideoMemory::clear() {
    std::fill(vram.begin(), vram.end(), 0);
    palette.fill(Color{});
}
