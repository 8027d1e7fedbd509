#include <catch2/catch.hpp>
#include <algorithm>
#include <climits>
#include <vector>
#include "cpu.hpp"

namespace {

// PCの位置に命令を置いて1命令実行する
int execute(CPU& cpu, std::vector<uint8_t> bytes) {
    cpu.loadProgram(bytes, cpu.registers().PC);
    return cpu.step();
}

}

TEST_CASE("CPU powers on at the boot address", "[cpu]") {
    CPU cpu;
    const Registers& r = cpu.registers();
    REQUIRE(r.PC == 0x8000);
    REQUIRE(r.SP == 0x01FF);
    REQUIRE(r.A == 0);
    REQUIRE(r.X == 0);
    REQUIRE(r.Y == 0);
    REQUIRE(r.P == 0);
    REQUIRE_FALSE(cpu.isHalted());
    REQUIRE(cpu.clockCycles() == 0);
}

TEST_CASE("updateFlags touches only Zero and Negative", "[cpu][flags]") {
    CPU cpu;
    const uint16_t initial = GENERATE(as<uint16_t>{}, 0x00, 0xFF, 0x5A, 0x82, 0x7D);

    for (int v = 0; v < 256; ++v) {
        cpu.registers().P = initial;
        cpu.updateFlags(static_cast<uint8_t>(v));
        const uint16_t p = cpu.registers().P;

        CHECK(((p & FLAG_Z) != 0) == (v == 0));
        CHECK(((p & FLAG_N) != 0) == ((v & 0x80) != 0));
        CHECK((p & ~(FLAG_Z | FLAG_N)) == (initial & ~(FLAG_Z | FLAG_N)));
    }
}

TEST_CASE("LDA immediate then STA absolute", "[cpu]") {
    CPU cpu;
    cpu.loadProgram({0xA9, 0x42, 0x8D, 0x00, 0x03}, 0x8000);

    REQUIRE(cpu.step() == 2);
    REQUIRE(cpu.registers().A == 0x42);
    REQUIRE(cpu.registers().PC == 0x8002);

    REQUIRE(cpu.step() == 4);
    REQUIRE(cpu.memory().readByte(0x0300) == 0x42);
    REQUIRE(cpu.registers().A == 0x42);
    REQUIRE(cpu.registers().PC == 0x8005);
    REQUIRE(cpu.clockCycles() == 6);
}

TEST_CASE("LDA sets flags from the loaded value", "[cpu]") {
    CPU cpu;

    SECTION("zero") {
        cpu.registers().P = FLAG_N;
        REQUIRE(execute(cpu, {0xA9, 0x00}) == 2);
        REQUIRE((cpu.registers().P & FLAG_Z) != 0);
        REQUIRE((cpu.registers().P & FLAG_N) == 0);
    }

    SECTION("negative from memory") {
        cpu.memory().writeByte(0x1234, 0x80);
        REQUIRE(execute(cpu, {0xAD, 0x34, 0x12}) == 4);
        REQUIRE(cpu.registers().A == 0x80);
        REQUIRE((cpu.registers().P & FLAG_N) != 0);
        REQUIRE((cpu.registers().P & FLAG_Z) == 0);
        REQUIRE(cpu.registers().PC == 0x8003);
    }
}

TEST_CASE("STA does not change flags", "[cpu]") {
    CPU cpu;
    cpu.registers().A = 0;
    cpu.registers().P = 0x41;
    REQUIRE(execute(cpu, {0x8D, 0x00, 0x20}) == 4);
    REQUIRE(cpu.registers().P == 0x41);
}

TEST_CASE("JMP absolute always lands on its target", "[cpu]") {
    const uint16_t from = GENERATE(as<uint16_t>{}, 0x0000, 0x1234, 0x8000, 0xFFFD);
    CPU cpu;
    cpu.registers().PC = from;

    for (int i = 0; i < 3; ++i) {
        cpu.registers().PC = from;
        REQUIRE(execute(cpu, {0x4C, 0x00, 0x80}) == 3);
        REQUIRE(cpu.registers().PC == 0x8000);
    }
}

TEST_CASE("Operand fetch wraps past 0xFFFF", "[cpu]") {
    CPU cpu;
    cpu.registers().PC = 0xFFFE;
    REQUIRE(execute(cpu, {0x4C, 0x34, 0x12}) == 3);
    REQUIRE(cpu.memory().readByte(0x0000) == 0x12);
    REQUIRE(cpu.registers().PC == 0x1234);
}

TEST_CASE("NOP only advances PC", "[cpu]") {
    CPU cpu;

    SECTION("normal") {
        REQUIRE(execute(cpu, {0xEA}) == 2);
        REQUIRE(cpu.registers().PC == 0x8001);
    }

    SECTION("at the end of memory") {
        cpu.registers().PC = 0xFFFF;
        REQUIRE(execute(cpu, {0xEA}) == 2);
        REQUIRE(cpu.registers().PC == 0x0000);
    }
}

TEST_CASE("BRK halts the CPU", "[cpu]") {
    CPU cpu;
    REQUIRE(execute(cpu, {0x00}) == 7);
    REQUIRE(cpu.isHalted());
    REQUIRE(cpu.clockCycles() == 7);
}

TEST_CASE("Unknown opcode is a zero-cycle no-op", "[cpu]") {
    CPU cpu;
    cpu.registers().A = 0x12;
    cpu.registers().X = 0x34;
    cpu.registers().Y = 0x56;
    cpu.registers().P = 0x82;
    cpu.loadProgram({0xFF}, 0x8000);
    const Registers before = cpu.registers();
    const std::vector<uint8_t> memBefore(cpu.memory().data(), cpu.memory().data() + AddressSpace::SIZE);

    REQUIRE(cpu.step() == 0);

    const Registers& after = cpu.registers();
    REQUIRE(after.A == before.A);
    REQUIRE(after.X == before.X);
    REQUIRE(after.Y == before.Y);
    REQUIRE(after.SP == before.SP);
    REQUIRE(after.P == before.P);
    REQUIRE(after.PC == before.PC + 1);  // 次のバイトから実行を続ける
    REQUIRE(std::equal(memBefore.begin(), memBefore.end(), cpu.memory().data()));
    REQUIRE_FALSE(cpu.isHalted());
    REQUIRE(cpu.clockCycles() == 0);
}

TEST_CASE("reset loads PC from the reset vector only", "[cpu]") {
    CPU cpu;
    Registers& r = cpu.registers();
    r.A = 0x11;
    r.X = 0x22;
    r.Y = 0x33;
    r.SP = 0x0150;
    r.P = 0x82;
    cpu.memory().writeByte(0x0400, 0x99);

    cpu.setResetVector(0x9000);
    cpu.reset();

    REQUIRE(r.PC == 0x9000);
    REQUIRE(r.A == 0x11);
    REQUIRE(r.X == 0x22);
    REQUIRE(r.Y == 0x33);
    REQUIRE(r.SP == 0x0150);
    REQUIRE(r.P == 0x82);
    REQUIRE(cpu.memory().readByte(0x0400) == 0x99);
    REQUIRE(cpu.memory().readWord(CPU::RESET_VECTOR) == 0x9000);
}

TEST_CASE("Opcode table", "[cpu]") {
    REQUIRE(CPU::decode(0xA9).op == Operation::LoadImmediate);
    REQUIRE(CPU::decode(0xAD).op == Operation::LoadAbsolute);
    REQUIRE(CPU::decode(0x8D).op == Operation::StoreAbsolute);
    REQUIRE(CPU::decode(0x4C).op == Operation::JumpAbsolute);
    REQUIRE(CPU::decode(0xEA).cycles == 2);
    REQUIRE(CPU::decode(0x00).cycles == 7);

    int known = 0;
    for (int op = 0; op < 256; ++op) {
        if (CPU::decode(static_cast<uint8_t>(op)).op != Operation::Unknown) ++known;
    }
    REQUIRE(known == 6);
}

TEST_CASE("disassembleWindow returns raw bytes around an address", "[cpu]") {
    CPU cpu;
    cpu.loadProgram({0xA9, 0x01, 0x8D}, 0x8000);

    SECTION("centered") {
        auto lines = cpu.disassembleWindow(0x8000, 2);
        REQUIRE(lines.size() == 5);
        REQUIRE(lines[0].address == 0x7FFE);
        REQUIRE(lines[2].address == 0x8000);
        REQUIRE(lines[2].value == 0xA9);
        REQUIRE(lines[3].value == 0x01);
        REQUIRE(lines[4].value == 0x8D);
    }

    SECTION("clipped at both ends of memory") {
        REQUIRE(cpu.disassembleWindow(0x0002, 5).size() == 8);
        auto top = cpu.disassembleWindow(0xFFFE, 2);
        REQUIRE(top.size() == 4);
        REQUIRE(top.front().address == 0xFFFC);
        REQUIRE(top.back().address == 0xFFFF);
    }
}

TEST_CASE("disassembleWindow clamps its radius", "[cpu]") {
    CPU cpu;

    SECTION("huge radius covers memory once") {
        auto lines = cpu.disassembleWindow(0x8000, INT_MAX);
        REQUIRE(lines.size() == AddressSpace::SIZE);
        REQUIRE(lines.front().address == 0x0000);
        REQUIRE(lines.back().address == 0xFFFF);
    }

    SECTION("negative radius is just the center") {
        auto lines = cpu.disassembleWindow(0x8000, -3);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].address == 0x8000);
    }
}
