#include <catch2/catch.hpp>
#include "memory.hpp"
#include "vram.hpp"

TEST_CASE("AddressSpace words are little-endian", "[memory]") {
    AddressSpace mem;
    mem.writeWord(0xFFFC, 0x9000);
    REQUIRE(mem.readByte(0xFFFC) == 0x00);
    REQUIRE(mem.readByte(0xFFFD) == 0x90);
    REQUIRE(mem.readWord(0xFFFC) == 0x9000);
}

TEST_CASE("AddressSpace wraps at the top of memory", "[memory]") {
    AddressSpace mem;

    SECTION("word access at 0xFFFF") {
        mem.writeWord(0xFFFF, 0xBEEF);
        REQUIRE(mem.readByte(0xFFFF) == 0xEF);
        REQUIRE(mem.readByte(0x0000) == 0xBE);
        REQUIRE(mem.readWord(0xFFFF) == 0xBEEF);
    }

    SECTION("program load crossing 0xFFFF") {
        REQUIRE(mem.load(0xFFFE, {0x11, 0x22, 0x33}));
        REQUIRE(mem.readByte(0xFFFE) == 0x11);
        REQUIRE(mem.readByte(0xFFFF) == 0x22);
        REQUIRE(mem.readByte(0x0000) == 0x33);
    }
}

TEST_CASE("AddressSpace clear zeroes everything", "[memory]") {
    AddressSpace mem;
    mem.writeByte(0x1234, 0x56);
    mem.clear();
    REQUIRE(mem.readByte(0x1234) == 0);
}

TEST_CASE("VideoMemory loaders place data in their regions", "[vram]") {
    VideoMemory vram;

    REQUIRE(vram.loadTiles({0xAA, 0x55}));
    REQUIRE(vram.loadTileMap({0x07, 0x08}));
    REQUIRE(vram.readByte(VideoMemory::PATTERN_BASE) == 0xAA);
    REQUIRE(vram.readByte(VideoMemory::PATTERN_BASE + 1) == 0x55);
    REQUIRE(vram.readByte(VideoMemory::TILEMAP_BASE) == 0x07);
    REQUIRE(vram.readByte(VideoMemory::TILEMAP_BASE + 1) == 0x08);
}

TEST_CASE("VideoMemory truncates oversized loads", "[vram]") {
    VideoMemory vram;

    SECTION("tiles never spill into the tile map") {
        std::vector<uint8_t> tiles(VideoMemory::PATTERN_SIZE + 4, 0xFF);
        REQUIRE_FALSE(vram.loadTiles(tiles));
        REQUIRE(vram.readByte(VideoMemory::PATTERN_SIZE - 1) == 0xFF);
        REQUIRE(vram.readByte(VideoMemory::TILEMAP_BASE) == 0x00);
    }

    SECTION("palette keeps the first 256 entries") {
        std::vector<Color> colors(VideoMemory::PALETTE_SIZE + 1, Color{1, 2, 3});
        REQUIRE_FALSE(vram.setPalette(colors));
        REQUIRE(vram.paletteColor(255) == Color{1, 2, 3});
    }
}

TEST_CASE("VideoMemory addresses are masked to 32 KiB", "[vram]") {
    VideoMemory vram;
    vram.writeByte(0x8001, 0x42);
    REQUIRE(vram.readByte(0x0001) == 0x42);
}

TEST_CASE("Color converts to opaque ARGB", "[vram]") {
    REQUIRE(Color{255, 0, 0}.toARGB() == 0xFFFF0000u);
    REQUIRE(Color{0, 255, 0}.toARGB() == 0xFF00FF00u);
    REQUIRE(Color{0, 0, 255}.toARGB() == 0xFF0000FFu);
}
