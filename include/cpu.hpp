#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "memory.hpp"

// ---------------------------
// Pレジスタ用ビットマスク定義
// ---------------------------
const uint8_t FLAG_Z = 0x02; // 0000 0010  Zeroフラグ
const uint8_t FLAG_N = 0x80; // 1000 0000  Negativeフラグ

// 6本とも同じ幅で保持する。A/X/Y/Pは下位8bit、PC/SPは16bitとして使う
struct Registers {
    uint16_t A  = 0;
    uint16_t X  = 0;
    uint16_t Y  = 0;
    uint16_t PC = 0;
    uint16_t SP = 0;
    uint16_t P  = 0;
};

enum class Operation : uint8_t {
    Unknown,
    LoadImmediate,   // LDA #nn
    LoadAbsolute,    // LDA nnnn
    StoreAbsolute,   // STA nnnn
    JumpAbsolute,    // JMP nnnn
    NoOp,            // NOP
    Break            // BRK
};

enum class AddressingMode : uint8_t {
    Implied,
    Immediate,
    Absolute
};

struct Instruction {
    Operation op = Operation::Unknown;
    AddressingMode mode = AddressingMode::Implied;
    uint8_t cycles = 0;
    const char* mnemonic = "???";
};

// ダンプ表示用 (アドレス, 生バイト)
struct MemoryLine {
    uint16_t address;
    uint8_t value;
};

class CPU {
public:
    static constexpr uint16_t BOOT_PC      = 0x8000;
    static constexpr uint16_t STACK_TOP    = 0x01FF;
    static constexpr uint16_t RESET_VECTOR = 0xFFFC;

    CPU();
    void reset();      // リセットベクタからPCを読み直す（他のレジスタ・メモリはそのまま）
    int step();        // 1命令を実行し、消費サイクル数を返す

    void updateFlags(uint8_t value);

    bool loadProgram(const std::vector<uint8_t>& bytes, uint16_t origin);
    void setResetVector(uint16_t address);

    const Registers& registers() const { return regs; }
    Registers& registers() { return regs; }
    AddressSpace& memory() { return mem; }
    const AddressSpace& memory() const { return mem; }

    std::vector<MemoryLine> disassembleWindow(uint16_t center, int radius) const;

    bool isHalted() const { return halted; }
    uint64_t clockCycles() const { return totalCycles; }
    void setTrace(bool enabled) { trace = enabled; }

    static const Instruction& decode(uint8_t opcode);

private:
    AddressSpace mem;
    Registers regs;

    uint64_t totalCycles = 0;  // 累計サイクル（折り返さない、表示用）
    bool halted = false;       // BRK実行済み
    bool trace = false;

    uint8_t fetchByte();
    uint16_t fetchWord();
    void traceInstruction(uint16_t addr, const Instruction& ins, uint16_t operand) const;
};
