#include "timer.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace {

uint64_t steadyMillis() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

}

Timer::Timer()
    : clock(steadyMillis) {}

Timer::Timer(Clock clock)
    : clock(std::move(clock)) {}

Timer::TaskId Timer::postDelayed(uint32_t delayMs, Task task) {
    TaskId id = nextId++;
    tasks.push_back({id, now() + delayMs, std::move(task)});
    return id;
}

bool Timer::cancel(TaskId id) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [id](const Pending& p) { return p.id == id; });
    if (it == tasks.end()) return false;
    tasks.erase(it);
    return true;
}

int Timer::runDue() {
    const uint64_t current = now();
    const TaskId limit = nextId;  // これ以降に登録されたものは今回は実行しない
    int executed = 0;

    while (true) {
        auto due = tasks.end();
        for (auto it = tasks.begin(); it != tasks.end(); ++it) {
            if (it->id >= limit || it->deadline > current) continue;
            if (due == tasks.end() || it->deadline < due->deadline) due = it;
        }
        if (due == tasks.end()) break;

        Task task = std::move(due->task);
        tasks.erase(due);
        task();
        ++executed;
    }
    return executed;
}

uint64_t Timer::msUntilNext() const {
    if (tasks.empty()) return 0;
    uint64_t earliest = tasks.front().deadline;
    for (const Pending& p : tasks) earliest = std::min(earliest, p.deadline);
    uint64_t current = now();
    return earliest > current ? earliest - current : 0;
}

void Timer::waitForNext() const {
    uint64_t wait = msUntilNext();
    if (wait > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(wait));
    }
}
