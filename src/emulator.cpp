#include "emulator.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <iterator>
#include <utility>

Emulator::Emulator()
    : Emulator(EmulatorConfig{}) {}

Emulator::Emulator(const EmulatorConfig& config, Timer::Clock clock)
    : config(config),
      timer(clock ? Timer(std::move(clock)) : Timer()),
      scheduler(cpu, ppu, timer, config.fps, config.cyclesPerFrame),
      image(demoBootImage())
{
    scheduler.setStateListener([this](const Registers&) { notifyState(); });
    rebuild();
}

bool Emulator::start() {
    if (scheduler.isRunning()) return true;

    // 停止中のCPU、最初のフレームでBRK、またはリスナーがstop()した場合はfalse
    if (!scheduler.start()) {
        if (!cpu.isHalted()) {
            setStatus("Paused");
        } else if (statusText != "Halted") {
            setStatus("Halted");
        }
        return false;
    }
    setStatus("Running");
    return true;
}

void Emulator::stop() {
    if (!scheduler.isRunning()) return;
    scheduler.stop();
    setStatus("Paused");
}

void Emulator::reset() {
    stop();
    rebuild();
    setStatus("System reset");
}

int Emulator::stepFrame() {
    if (scheduler.isRunning()) {
        std::cerr << "[EMU] stepFrame ignored while running" << std::endl;
        return 0;
    }
    if (cpu.isHalted()) {
        std::cerr << "[EMU] CPU is halted, reset required" << std::endl;
        return 0;
    }
    return scheduler.runFrame();
}

void Emulator::openROM() {
    // 実際のROM読み込みは未実装。デモイメージで組み直すだけ
    image = demoBootImage();
    stop();
    rebuild();
    setStatus("ROM loaded (simulated)");
}

void Emulator::closeROM() {
    stop();
    cpu = CPU();
    cpu.setTrace(config.trace);
    ppu.clear();
    notifyState();
    setStatus("ROM closed");
}

bool Emulator::loadProgram(const std::vector<uint8_t>& bytes, uint16_t origin) {
    // 同じoriginへの再ロードは前のセグメントを置き換える
    auto it = std::find_if(image.program.begin(), image.program.end(),
                           [origin](const BootImage::Segment& s) { return s.origin == origin; });
    if (it != image.program.end()) {
        image.program.erase(it);
    }
    image.program.push_back({origin, bytes});
    return cpu.loadProgram(bytes, origin);
}

void Emulator::setResetVector(uint16_t address) {
    image.hasResetVector = true;
    image.resetVector = address;
    cpu.setResetVector(address);
}

bool Emulator::loadTiles(const std::vector<uint8_t>& bytes) {
    image.tiles = bytes;
    return ppu.videoMemory().loadTiles(bytes);
}

bool Emulator::setPalette(const std::vector<Color>& colors) {
    image.palette = colors;
    return ppu.videoMemory().setPalette(colors);
}

bool Emulator::loadTileMap(const std::vector<uint8_t>& bytes) {
    image.tileMap = bytes;
    return ppu.videoMemory().loadTileMap(bytes);
}

bool Emulator::loadProgramFile(const std::string& path, uint16_t origin) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "[EMU] Failed to open program file: " << path << std::endl;
        return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        std::cerr << "[EMU] Program file is empty: " << path << std::endl;
        return false;
    }

    // デモプログラムを置き換える。タイル・パレットはそのまま
    image.program.clear();
    image.program.push_back({origin, bytes});
    image.hasResetVector = true;
    image.resetVector = origin;

    std::cout << "[EMU] Program loaded: " << path << " (" << bytes.size() << " bytes at $"
              << std::hex << std::uppercase << std::setfill('0') << std::setw(4) << origin
              << std::dec << std::nouppercase << ")" << std::endl;

    reset();
    return bytes.size() <= AddressSpace::SIZE;
}

std::vector<MemoryLine> Emulator::disassembleWindow(uint16_t center, int radius) const {
    return cpu.disassembleWindow(center, radius);
}

void Emulator::dumpCPUState(std::ostream& out) const {
    const Registers& r = cpu.registers();
    const std::pair<const char*, uint16_t> regs[] = {
        {"A", r.A}, {"X", r.X}, {"Y", r.Y}, {"PC", r.PC}, {"SP", r.SP}, {"P", r.P}
    };

    out << std::hex << std::uppercase << std::setfill('0');
    out << "Registers:\n";
    for (const auto& reg : regs) {
        out << "  " << reg.first << ": 0x" << std::setw(4) << reg.second << "\n";
    }

    out << "\nDisassembly:\n";
    for (const MemoryLine& line : cpu.disassembleWindow(r.PC, CPU_VIEW_RADIUS)) {
        out << (line.address == r.PC ? '>' : ' ')
            << " 0x" << std::setw(4) << line.address
            << ": 0x" << std::setw(2) << static_cast<int>(line.value) << "\n";
    }
    out << std::dec << std::nouppercase << std::setfill(' ');
}

bool Emulator::handleCommand(HostCommand command) {
    switch (command) {
        case HostCommand::Start:        start(); break;
        case HostCommand::Pause:        stop(); break;
        case HostCommand::Reset:        reset(); break;
        case HostCommand::OpenROM:      openROM(); break;
        case HostCommand::CloseROM:     closeROM(); break;
        case HostCommand::ShowCPUState: dumpCPUState(std::cout); break;
        case HostCommand::Quit:         return false;
    }
    return true;
}

void Emulator::run(int maxFrames) {
    std::cout << "[EMU] Emulator running (console mode)...\n";

    const uint64_t firstFrame = scheduler.frameCount();
    const uint64_t firstCycle = cpu.clockCycles();
    start();

    while (scheduler.isRunning() &&
           scheduler.frameCount() - firstFrame < static_cast<uint64_t>(maxFrames)) {
        timer.waitForNext();
        timer.runDue();
    }
    stop();

    // フレームバッファのダンプ（簡易PPM）
    if (ppu.saveFramePPM(config.framePath)) {
        std::cout << "[INFO] Frame saved to " << config.framePath << "\n";
    }

    std::cout << "[INFO] Frames rendered: " << (scheduler.frameCount() - firstFrame) << "\n";
    std::cout << "[INFO] CPU cycles: " << (cpu.clockCycles() - firstCycle) << "\n";
    dumpCPUState(std::cout);
}

void Emulator::setFrameListener(FrameScheduler::FrameListener listener) {
    scheduler.setFrameListener(std::move(listener));
}

void Emulator::setStateListener(FrameScheduler::StateListener listener) {
    stateListener = std::move(listener);
}

void Emulator::rebuild() {
    cpu = CPU();
    cpu.setTrace(config.trace);
    ppu.reset();
    applyImage();
    cpu.reset();
    notifyState();
}

void Emulator::applyImage() {
    for (const BootImage::Segment& segment : image.program) {
        cpu.loadProgram(segment.bytes, segment.origin);
    }
    if (image.hasResetVector) {
        cpu.setResetVector(image.resetVector);
    }

    VideoMemory& vram = ppu.videoMemory();
    vram.loadTiles(image.tiles);
    vram.setPalette(image.palette);
    vram.loadTileMap(image.tileMap);
}

void Emulator::setStatus(const std::string& text) {
    statusText = text;
    std::cout << "[EMU] " << text << std::endl;
}

void Emulator::notifyState() {
    // BRKはどのフレームで当たっても一度だけHaltedにする
    if (cpu.isHalted() && statusText != "Halted") {
        setStatus("Halted");
    }
    if (stateListener) stateListener(cpu.registers());
}
