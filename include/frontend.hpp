#pragma once
#include <cstdint>
#include <string>
#include "display.hpp"
#include "emulator.hpp"
#include "input.hpp"

// SDL2ウィンドウ + キー入力でEmulatorを操作する
class Frontend {
public:
    explicit Frontend(Emulator& emu);

    void run();

    static std::string formatRegisters(const Registers& regs);

private:
    Emulator& emu;
    Display display;
    Input input;

    const uint32_t* pendingFrame = nullptr;
    bool titleDirty = true;

    void refreshTitle();
};
