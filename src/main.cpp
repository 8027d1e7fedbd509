#include "emulator.hpp"
#include "frontend.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [--trace] [--headless] [--frames N] [program.bin]" << std::endl;
}

int main(int argc, char* argv[]) {
    EmulatorConfig config;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--trace") == 0) {
            config.trace = true;
        } else if (std::strcmp(argv[i], "--headless") == 0) {
            config.headless = true;
        } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            config.headlessFrames = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "[INFO] Unknown option: " << argv[i] << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            config.programPath = argv[i];
        }
    }

    Emulator emu(config);                    // エミュレータ本体を作成（デモイメージで起動）

    if (!config.programPath.empty()) {
        std::cout << "[INFO] Loading program: " << config.programPath << std::endl;
        if (!emu.loadProgramFile(config.programPath, config.programOrigin)) {
            return 1;
        }
    }

    if (config.headless) {
        emu.run(config.headlessFrames);
        return 0;
    }

    Frontend frontend(emu);
    frontend.run();                          // SDL2ウィンドウ付きメインループ開始
    return 0;
}
