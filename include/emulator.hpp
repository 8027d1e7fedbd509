#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "boot_image.hpp"
#include "cpu.hpp"
#include "input.hpp"
#include "ppu.hpp"
#include "scheduler.hpp"
#include "timer.hpp"

struct EmulatorConfig {
    int fps = FrameScheduler::DEFAULT_FPS;
    int cyclesPerFrame = FrameScheduler::CYCLES_PER_FRAME;
    int windowScale = 3;
    bool trace = false;
    bool headless = false;
    int headlessFrames = 60;
    std::string programPath;             // 空ならデモプログラム
    uint16_t programOrigin = CPU::BOOT_PC;
    std::string framePath = "frame.ppm";
};

class Emulator {
public:
    static constexpr int CPU_VIEW_RADIUS = 5;

    Emulator();
    explicit Emulator(const EmulatorConfig& config, Timer::Clock clock = nullptr);

    // ライフサイクル
    bool start();
    void stop();
    void reset();
    int stepFrame();
    void openROM();
    void closeROM();

    // 初期イメージの登録（即時反映し、リセット時にも再適用される）
    bool loadProgram(const std::vector<uint8_t>& bytes, uint16_t origin);
    void setResetVector(uint16_t address);
    bool loadTiles(const std::vector<uint8_t>& bytes);
    bool setPalette(const std::vector<Color>& colors);
    bool loadTileMap(const std::vector<uint8_t>& bytes);
    bool loadProgramFile(const std::string& path, uint16_t origin);

    // デバッグ表示用
    Registers snapshotRegisters() const { return cpu.registers(); }
    std::vector<MemoryLine> disassembleWindow(uint16_t center, int radius) const;
    void dumpCPUState(std::ostream& out) const;

    bool handleCommand(HostCommand command);  // Quitならfalse
    void run(int maxFrames);                  // ウィンドウ無しで実行

    void setFrameListener(FrameScheduler::FrameListener listener);
    void setStateListener(FrameScheduler::StateListener listener);

    bool isRunning() const { return scheduler.isRunning(); }
    const std::string& status() const { return statusText; }
    const EmulatorConfig& settings() const { return config; }
    const CPU& getCPU() const { return cpu; }
    const PPU& getPPU() const { return ppu; }
    const FrameScheduler& getScheduler() const { return scheduler; }
    const BootImage& bootImage() const { return image; }
    Timer& getTimer() { return timer; }

private:
    EmulatorConfig config;
    Timer timer;
    CPU cpu;
    PPU ppu;
    FrameScheduler scheduler;
    BootImage image;
    std::string statusText = "Ready";
    FrameScheduler::StateListener stateListener;

    void rebuild();
    void applyImage();
    void setStatus(const std::string& text);
    void notifyState();
};
