#pragma once
#include <cstdint>
#include <functional>
#include "cpu.hpp"
#include "ppu.hpp"
#include "timer.hpp"

// CPUをサイクル予算ぶん回してからPPUで1フレーム描き、次のtickをTimerに登録する
class FrameScheduler {
public:
    static constexpr int DEFAULT_FPS = 60;
    static constexpr int CYCLES_PER_FRAME = 1364;  // ~60Hz相当

    using FrameListener = std::function<void(const uint32_t* framebuffer)>;
    using StateListener = std::function<void(const Registers& regs)>;

    FrameScheduler(CPU& cpu, PPU& ppu, Timer& timer,
                   int fps = DEFAULT_FPS, int cyclesPerFrame = CYCLES_PER_FRAME);
    ~FrameScheduler();

    bool start();
    void stop();
    bool isRunning() const { return running; }

    // 予算ぶん実行 + 描画 + 通知。再スケジュールはしない
    int runFrame();

    int computeDelayMs(double elapsedSeconds) const;

    void setFrameListener(FrameListener listener) { onFrame = std::move(listener); }
    void setStateListener(StateListener listener) { onStateChanged = std::move(listener); }

    uint64_t frameCount() const { return frames; }
    int lastFrameCycles() const { return lastCycles; }
    int fps() const { return targetFps; }
    int cycleBudget() const { return budget; }

private:
    CPU& cpu;
    PPU& ppu;
    Timer& timer;

    int targetFps;
    int budget;
    bool running = false;
    bool tickPending = false;
    Timer::TaskId pendingTick = 0;
    uint64_t lastTime = 0;     // 前回tickの時刻(ms)。ペース調整専用
    uint64_t frames = 0;
    int lastCycles = 0;

    FrameListener onFrame;
    StateListener onStateChanged;

    void tick();
    void cancelPending();
};
