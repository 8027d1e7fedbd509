#include "frontend.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

constexpr const char* WINDOW_TITLE = "retrotile";
constexpr uint64_t MAX_IDLE_MS = 5;  // 入力への反応を保つための最大待ち時間

}

Frontend::Frontend(Emulator& emu)
    : emu(emu), display(emu.settings().windowScale) {}

std::string Frontend::formatRegisters(const Registers& regs) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0')
        << "A=$" << std::setw(2) << (regs.A & 0xFF)
        << " X=$" << std::setw(2) << (regs.X & 0xFF)
        << " Y=$" << std::setw(2) << (regs.Y & 0xFF)
        << " PC=$" << std::setw(4) << regs.PC
        << " SP=$" << std::setw(4) << regs.SP
        << " P=$" << std::setw(2) << (regs.P & 0xFF);
    return out.str();
}

void Frontend::run() {
    std::cout << "[SDL] Initializing display...\n";

    if (!display.init(WINDOW_TITLE)) {
        std::cerr << "[SDL] Failed to initialize display. Falling back to console mode.\n";
        display.close();
        emu.run(emu.settings().headlessFrames);
        return;
    }

    emu.setFrameListener([this](const uint32_t* framebuffer) { pendingFrame = framebuffer; });
    emu.setStateListener([this](const Registers&) { titleDirty = true; });

    std::cout << "[INFO] Emulator ready. Enter/Space=start P=pause R=reset O=open C=close F2=CPU state Esc=quit\n";
    pendingFrame = emu.getPPU().getFrameBuffer();

    bool quit = false;
    while (!quit) {
        if (!display.handleEvents(&input)) {
            std::cout << "\n[INFO] Quit requested\n";
            break;
        }

        HostCommand command;
        bool handled = false;
        while (input.next(command)) {
            handled = true;
            if (!emu.handleCommand(command)) {
                quit = true;
                break;
            }
        }
        if (handled) {
            // リセット/クローズ後は画面をそのまま描き直す
            pendingFrame = emu.getPPU().getFrameBuffer();
            titleDirty = true;
        }

        emu.getTimer().runDue();

        if (pendingFrame) {
            display.updateFrame(pendingFrame);
            pendingFrame = nullptr;
        }
        if (titleDirty) {
            refreshTitle();
            titleDirty = false;
        }

        Timer& timer = emu.getTimer();
        uint64_t wait = timer.hasPending() ? std::min(timer.msUntilNext(), MAX_IDLE_MS) : MAX_IDLE_MS;
        if (wait > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait));
        }
    }

    emu.stop();
    display.close();
    std::cout << "[INFO] Frames rendered: " << emu.getScheduler().frameCount() << "\n";
}

void Frontend::refreshTitle() {
    display.setTitle(std::string(WINDOW_TITLE) + " - " + emu.status() + " | " +
                     formatRegisters(emu.snapshotRegisters()));
}
