#include "input.hpp"

Input::Input() = default;

void Input::press(HostCommand command) {
    // 同じ操作の連打は1回にまとめる
    if (!pending.empty() && pending.back() == command) return;
    pending.push_back(command);
}

bool Input::next(HostCommand& command) {
    if (pending.empty()) return false;
    command = pending.front();
    pending.pop_front();
    return true;
}
