#include "ProcessHandle.h"
#include <QProcess>
#include <QDebug>

BackendCommand BackendCommand::defaults()
{
    BackendCommand command;
    command.program = "python";
    command.arguments << "-m" << "uvicorn" << "app.main:app"
                      << "--port" << "8000"
                      << "--host" << "127.0.0.1";
    command.workingDirectory = "../backend";
    return command;
}

QString BackendCommand::toString() const
{
    QStringList parts;
    parts << program << arguments;
    return parts.join(' ');
}

// ============================================================================
// QProcessHandle
// ============================================================================

QProcessHandle::QProcessHandle(QProcess *process)
    : m_process(process)
{
}

QProcessHandle::~QProcessHandle()
{
    // QProcess would kill a running child in its own destructor, but it
    // also prints a warning. Reap it here instead.
    if (m_process->state() != QProcess::NotRunning) {
        m_process->kill();
        m_process->waitForFinished(3000);
    }
    delete m_process;
}

std::unique_ptr<QProcessHandle> QProcessHandle::spawn(const BackendCommand &command,
                                                      QString *errorMessage)
{
    QProcess *process = new QProcess();
    process->setProgram(command.program);
    process->setArguments(command.arguments);
    if (!command.workingDirectory.isEmpty()) {
        process->setWorkingDirectory(command.workingDirectory);
    }
    // Backend logs go straight to our own stdout/stderr
    process->setProcessChannelMode(QProcess::ForwardedChannels);

    process->start();
    if (!process->waitForStarted()) {
        if (errorMessage) {
            *errorMessage = process->errorString();
        }
        delete process;
        return nullptr;
    }

    return std::unique_ptr<QProcessHandle>(new QProcessHandle(process));
}

qint64 QProcessHandle::processId() const
{
    return m_process->processId();
}

bool QProcessHandle::kill()
{
    if (m_process->state() == QProcess::NotRunning) {
        return false;
    }

    m_process->kill();
    m_process->waitForFinished(3000);
    return true;
}
