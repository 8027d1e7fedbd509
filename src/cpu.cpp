#include "cpu.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>

namespace {

// オペコード → 命令 の対応表。未登録は Unknown (0サイクル)
std::array<Instruction, 256> buildOpcodeTable() {
    std::array<Instruction, 256> table{};
    table[0xA9] = {Operation::LoadImmediate, AddressingMode::Immediate, 2, "LDA"};
    table[0xAD] = {Operation::LoadAbsolute,  AddressingMode::Absolute,  4, "LDA"};
    table[0x8D] = {Operation::StoreAbsolute, AddressingMode::Absolute,  4, "STA"};
    table[0x4C] = {Operation::JumpAbsolute,  AddressingMode::Absolute,  3, "JMP"};
    table[0xEA] = {Operation::NoOp,          AddressingMode::Implied,   2, "NOP"};
    table[0x00] = {Operation::Break,         AddressingMode::Implied,   7, "BRK"};
    return table;
}

const std::array<Instruction, 256> OPCODES = buildOpcodeTable();

}

CPU::CPU() {
    regs.PC = BOOT_PC;
    regs.SP = STACK_TOP;
}

const Instruction& CPU::decode(uint8_t opcode) {
    return OPCODES[opcode];
}

void CPU::reset() {
    regs.PC = mem.readWord(RESET_VECTOR);

    std::cout << "[CPU RESET] PC=" << std::hex << std::uppercase << std::setfill('0')
              << std::setw(4) << regs.PC << std::dec << std::nouppercase << std::endl;
}

bool CPU::loadProgram(const std::vector<uint8_t>& bytes, uint16_t origin) {
    return mem.load(origin, bytes);
}

void CPU::setResetVector(uint16_t address) {
    mem.writeWord(RESET_VECTOR, address);
}

void CPU::updateFlags(uint8_t value) {
    regs.P &= ~(FLAG_Z | FLAG_N);  // Z,Nだけ落とす。他のビットは保持
    if (value == 0) regs.P |= FLAG_Z;
    if (value & 0x80) regs.P |= FLAG_N;
}

uint8_t CPU::fetchByte() {
    uint8_t value = mem.readByte(regs.PC);
    regs.PC = static_cast<uint16_t>(regs.PC + 1);  // 0xFFFFの次は0x0000
    return value;
}

uint16_t CPU::fetchWord() {
    uint8_t lo = fetchByte();
    uint8_t hi = fetchByte();
    return static_cast<uint16_t>((hi << 8) | lo);
}

int CPU::step() {
    const uint16_t opAddr = regs.PC;

    // 1. 命令をフェッチ
    uint8_t opcode = fetchByte();
    const Instruction& ins = decode(opcode);

    // 未知のオペコードは何もしない（PCは1つ進む）
    if (ins.op == Operation::Unknown) {
        if (trace) {
            std::cout << "[CPU] " << std::hex << std::uppercase << std::setfill('0')
                      << std::setw(4) << opAddr << ": ??? ($" << std::setw(2)
                      << static_cast<int>(opcode) << ")" << std::dec << std::nouppercase
                      << std::endl;
        }
        return 0;
    }

    // 2. オペランド取得
    uint16_t operand = 0;
    switch (ins.mode) {
        case AddressingMode::Immediate: operand = fetchByte(); break;
        case AddressingMode::Absolute:  operand = fetchWord(); break;
        case AddressingMode::Implied:   break;
    }

    if (trace) traceInstruction(opAddr, ins, operand);

    // 3. 実行
    switch (ins.op) {
        case Operation::LoadImmediate:
            regs.A = operand & 0xFF;
            updateFlags(static_cast<uint8_t>(regs.A));
            break;

        case Operation::LoadAbsolute:
            regs.A = mem.readByte(operand);
            updateFlags(static_cast<uint8_t>(regs.A));
            break;

        case Operation::StoreAbsolute:
            mem.writeByte(operand, static_cast<uint8_t>(regs.A & 0xFF));
            break;

        case Operation::JumpAbsolute:
            regs.PC = operand;
            break;

        case Operation::NoOp:
            break;

        case Operation::Break:
            halted = true;
            std::cout << "[CPU] BRK at " << std::hex << std::uppercase << std::setfill('0')
                      << std::setw(4) << opAddr << ", halted" << std::dec << std::nouppercase
                      << std::endl;
            break;

        case Operation::Unknown:
            break;
    }

    totalCycles += ins.cycles;
    return ins.cycles;
}

std::vector<MemoryLine> CPU::disassembleWindow(uint16_t center, int radius) const {
    std::vector<MemoryLine> lines;
    // 64KBより広い窓は意味が無いので切り詰める
    radius = std::max(0, std::min(radius, static_cast<int>(AddressSpace::SIZE - 1)));
    for (int offset = -radius; offset <= radius; ++offset) {
        int addr = static_cast<int>(center) + offset;
        // 範囲外は折り返さずに捨てる
        if (addr < 0 || addr >= static_cast<int>(AddressSpace::SIZE)) continue;
        lines.push_back({static_cast<uint16_t>(addr), mem.readByte(static_cast<uint16_t>(addr))});
    }
    return lines;
}

void CPU::traceInstruction(uint16_t addr, const Instruction& ins, uint16_t operand) const {
    std::cout << "[CPU] " << std::hex << std::uppercase << std::setfill('0')
              << std::setw(4) << addr << ": " << ins.mnemonic;
    switch (ins.mode) {
        case AddressingMode::Immediate:
            std::cout << " #$" << std::setw(2) << operand;
            break;
        case AddressingMode::Absolute:
            std::cout << " $" << std::setw(4) << operand;
            break;
        case AddressingMode::Implied:
            break;
    }
    std::cout << std::dec << std::nouppercase << std::endl;
}
