#pragma once
#include <cstdint>
#include <vector>

// CPUから見えるフラットな64KBアドレス空間
// バンク切り替えやメモリマップドI/Oは持たない（$2000等への書き込みも普通のRAM書き込み）
class AddressSpace {
public:
    static constexpr uint32_t SIZE = 0x10000;

    AddressSpace();

    uint8_t readByte(uint16_t addr) const { return ram[addr]; }
    void writeByte(uint16_t addr, uint8_t val) { ram[addr] = val; }

    // リトルエンディアン。0xFFFFをまたぐ場合は0x0000へ折り返す
    uint16_t readWord(uint16_t addr) const;
    void writeWord(uint16_t addr, uint16_t val);

    // originから順に書き込む（アドレスは16bitで折り返す）
    bool load(uint16_t origin, const std::vector<uint8_t>& bytes);
    void clear();

    const uint8_t* data() const { return ram.data(); }

private:
    std::vector<uint8_t> ram; // 64KB
};
