#pragma once
#include <cstdint>
#include <deque>

// メニュー/ツールバー相当の操作
enum class HostCommand : uint8_t {
    Start,
    Pause,
    Reset,
    OpenROM,
    CloseROM,
    ShowCPUState,
    Quit
};

class Input {
public:
    Input();

    void press(HostCommand command);
    bool next(HostCommand& command);   // 取り出すものが無ければfalse
    bool empty() const { return pending.empty(); }
    void clear() { pending.clear(); }

private:
    std::deque<HostCommand> pending;
};
