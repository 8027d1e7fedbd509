#pragma once
#include <cstdint>
#include <functional>
#include <vector>

// シングルスレッドの遅延タスクキュー
// postDelayed()で登録したタスクは runDue() を呼んだスレッド上で実行される
class Timer {
public:
    using Clock  = std::function<uint64_t()>;  // ミリ秒
    using Task   = std::function<void()>;
    using TaskId = uint64_t;

    Timer();
    explicit Timer(Clock clock);

    uint64_t now() const { return clock(); }

    TaskId postDelayed(uint32_t delayMs, Task task);
    bool cancel(TaskId id);

    // 期限の来たタスクを期限順に実行する。実行中に登録されたタスクは次回回し
    int runDue();

    bool hasPending() const { return !tasks.empty(); }
    uint64_t msUntilNext() const;
    void waitForNext() const;

private:
    struct Pending {
        TaskId id;
        uint64_t deadline;
        Task task;
    };

    Clock clock;
    std::vector<Pending> tasks;
    TaskId nextId = 1;
};
