#ifndef FAKE_PROCESS_HANDLE_H
#define FAKE_PROCESS_HANDLE_H

#include "app/ProcessHandle.h"

#include <atomic>

// Counts kill attempts and destructions across all instances sharing a tally
struct KillTally {
    std::atomic<int> kills{0};
    std::atomic<int> alive{0};
};

class FakeHandle : public ProcessHandle {
public:
    FakeHandle(qint64 pid, KillTally &tally) : m_pid(pid), m_tally(tally) { ++m_tally.alive; }
    ~FakeHandle() override { --m_tally.alive; }

    qint64 processId() const override { return m_pid; }
    bool kill() override {
        ++m_tally.kills;
        return m_killResult;
    }

    void setKillResult(bool result) { m_killResult = result; }

private:
    qint64 m_pid;
    KillTally &m_tally;
    bool m_killResult = true;
};

#endif // FAKE_PROCESS_HANDLE_H
