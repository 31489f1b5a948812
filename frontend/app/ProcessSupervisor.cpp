#include "ProcessSupervisor.h"
#include <QMutexLocker>
#include <QDebug>

ProcessSupervisor::ProcessSupervisor(const BackendCommand &command)
    : m_command(command)
{
}

ProcessSupervisor::~ProcessSupervisor() = default;

std::unique_ptr<ProcessHandle> ProcessSupervisor::launchBackend() const
{
    QString errorMsg;
    std::unique_ptr<QProcessHandle> handle = QProcessHandle::spawn(m_command, &errorMsg);

    if (!handle) {
        qWarning().noquote() << QString("Failed to start backend: %1. "
                                        "Frontend will connect when backend is manually started.")
                                    .arg(errorMsg);
        return nullptr;
    }

    qInfo().noquote() << "Backend started with PID:" << handle->processId();
    return handle;
}

void ProcessSupervisor::storeHandle(std::unique_ptr<ProcessHandle> handle)
{
    std::unique_ptr<ProcessHandle> previous;
    {
        QMutexLocker locker(&m_mutex);
        previous = std::move(m_handle);
        m_handle = std::move(handle);
    }
    // previous is destroyed here, outside the lock
}

std::unique_ptr<ProcessHandle> ProcessSupervisor::take()
{
    QMutexLocker locker(&m_mutex);
    return std::move(m_handle);
}

void ProcessSupervisor::terminateOnClose()
{
    std::unique_ptr<ProcessHandle> handle = take();
    if (!handle) {
        return;
    }

    // A failed kill means the backend is already gone
    handle->kill();
    qInfo().noquote() << "Backend process terminated.";
}

bool ProcessSupervisor::hasHandle() const
{
    QMutexLocker locker(&m_mutex);
    return m_handle != nullptr;
}

qint64 ProcessSupervisor::backendProcessId() const
{
    QMutexLocker locker(&m_mutex);
    return m_handle ? m_handle->processId() : -1;
}
