#include "memory.hpp"
#include <algorithm>
#include <iostream>

AddressSpace::AddressSpace()
    : ram(SIZE, 0)
{ // 64KBをゼロ初期化
}

uint16_t AddressSpace::readWord(uint16_t addr) const {
    uint8_t lo = ram[addr];
    uint8_t hi = ram[static_cast<uint16_t>(addr + 1)];
    return static_cast<uint16_t>((hi << 8) | lo);
}

void AddressSpace::writeWord(uint16_t addr, uint16_t val) {
    ram[addr] = val & 0xFF;
    ram[static_cast<uint16_t>(addr + 1)] = (val >> 8) & 0xFF;
}

bool AddressSpace::load(uint16_t origin, const std::vector<uint8_t>& bytes) {
    if (bytes.size() > SIZE) {
        std::cerr << "[MEM] Program too large: " << bytes.size()
                  << " bytes (max " << SIZE << "), truncated" << std::endl;
    }

    size_t count = bytes.size() < SIZE ? bytes.size() : SIZE;
    for (size_t i = 0; i < count; ++i) {
        ram[static_cast<uint16_t>(origin + i)] = bytes[i];
    }
    return count == bytes.size();
}

void AddressSpace::clear() {
    std::fill(ram.begin(), ram.end(), 0);
}
