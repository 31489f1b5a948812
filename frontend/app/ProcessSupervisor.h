#ifndef PROCESSSUPERVISOR_H
#define PROCESSSUPERVISOR_H

#include "ProcessHandle.h"

#include <QMutex>
#include <memory>

/**
 * @brief Owns the backend server process for the application's lifetime.
 *
 * Holds at most one ProcessHandle behind a mutex. The handle is stored once
 * at startup and taken out once when the main window closes:
 * - launchBackend() spawns the backend (no lock held)
 * - storeHandle() puts the result in the slot
 * - terminateOnClose() takes it back out and kills the process
 *
 * Created in main() and passed by reference to whoever needs it.
 */
class ProcessSupervisor
{
public:
    explicit ProcessSupervisor(const BackendCommand &command = BackendCommand::defaults());
    ~ProcessSupervisor();

    BackendCommand command() const { return m_command; }

    // Spawns the backend. Failures are logged and give nullptr.
    std::unique_ptr<ProcessHandle> launchBackend() const;

    // Replaces the slot contents. A previously stored handle is dropped.
    void storeHandle(std::unique_ptr<ProcessHandle> handle);

    // Moves the handle out, leaving the slot empty.
    std::unique_ptr<ProcessHandle> take();

    // Kills the stored backend, if any. Safe to call more than once.
    void terminateOnClose();

    bool hasHandle() const;
    qint64 backendProcessId() const;  // -1 when the slot is empty

private:
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    BackendCommand m_command;

    mutable QMutex m_mutex;
    std::unique_ptr<ProcessHandle> m_handle;
};

#endif // PROCESSSUPERVISOR_H
