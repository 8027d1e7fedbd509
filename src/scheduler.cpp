#include "scheduler.hpp"
#include <algorithm>
#include <iostream>

FrameScheduler::FrameScheduler(CPU& cpu, PPU& ppu, Timer& timer, int fps, int cyclesPerFrame)
    : cpu(cpu), ppu(ppu), timer(timer),
      targetFps(fps > 0 ? fps : DEFAULT_FPS),
      budget(cyclesPerFrame > 0 ? cyclesPerFrame : CYCLES_PER_FRAME) {}

FrameScheduler::~FrameScheduler() {
    cancelPending();
}

bool FrameScheduler::start() {
    if (running) return true;

    // HALTは自動で解除しない。再開にはリセットが必要
    if (cpu.isHalted()) {
        std::cerr << "[INFO] CPU is halted, reset required before start" << std::endl;
        return false;
    }

    running = true;
    lastTime = timer.now();
    tick();
    return running;
}

void FrameScheduler::stop() {
    running = false;
    cancelPending();
}

int FrameScheduler::runFrame() {
    int cycles = 0;
    while (cycles < budget && !cpu.isHalted()) {
        cycles += cpu.step();
    }
    lastCycles = cycles;

    ppu.renderFrame();
    ++frames;

    if (onFrame) onFrame(ppu.getFrameBuffer());
    if (onStateChanged) onStateChanged(cpu.registers());
    return cycles;
}

int FrameScheduler::computeDelayMs(double elapsedSeconds) const {
    int delay = static_cast<int>((1.0 / targetFps - elapsedSeconds) * 1000.0);
    return std::max(1, delay);
}

void FrameScheduler::tick() {
    tickPending = false;
    if (!running) return;

    runFrame();
    if (!running) return;  // リスナー内でstop()された

    if (cpu.isHalted()) {
        running = false;
        std::cout << "[INFO] CPU halted after " << frames << " frames" << std::endl;
        return;
    }

    uint64_t current = timer.now();
    double elapsed = static_cast<double>(current - lastTime) / 1000.0;
    int delay = computeDelayMs(elapsed);
    pendingTick = timer.postDelayed(static_cast<uint32_t>(delay), [this]() { tick(); });
    tickPending = true;
    lastTime = current;
}

void FrameScheduler::cancelPending() {
    if (tickPending) {
        timer.cancel(pendingTick);
        tickPending = false;
    }
}
