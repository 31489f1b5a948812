#ifndef PROCESSHANDLE_H
#define PROCESSHANDLE_H

#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <memory>

class QProcess;

/**
 * @brief Command line used to start the backend server.
 *
 * Defaults to the development launch:
 *   python -m uvicorn app.main:app --port 8000 --host 127.0.0.1
 * run from ../backend.
 */
struct BackendCommand {
    QString program;
    QStringList arguments;
    QString workingDirectory;

    static BackendCommand defaults();
    QString toString() const;
};

/**
 * @brief Opaque reference to a running OS process.
 *
 * Only exposes what the supervisor needs: the process ID and a forceful kill.
 */
class ProcessHandle
{
public:
    virtual ~ProcessHandle() = default;

    virtual qint64 processId() const = 0;

    // Sends a forceful kill. Returns false if the signal could not be delivered.
    virtual bool kill() = 0;
};

/**
 * @brief ProcessHandle backed by a QProcess.
 */
class QProcessHandle : public ProcessHandle
{
public:
    ~QProcessHandle() override;

    // Blocks until the OS spawn call returns. Returns nullptr on failure and
    // fills errorMessage.
    static std::unique_ptr<QProcessHandle> spawn(const BackendCommand &command,
                                                 QString *errorMessage = nullptr);

    qint64 processId() const override;
    bool kill() override;

private:
    explicit QProcessHandle(QProcess *process);
    QProcessHandle(const QProcessHandle&) = delete;
    QProcessHandle& operator=(const QProcessHandle&) = delete;

    QProcess *m_process;
};

#endif // PROCESSHANDLE_H
