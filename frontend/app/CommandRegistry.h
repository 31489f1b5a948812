#ifndef COMMANDREGISTRY_H
#define COMMANDREGISTRY_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonValue>
#include <QMap>
#include <functional>

/**
 * @brief Result of invoking a frontend command.
 */
struct CommandResult {
    bool success = false;
    QString errorMessage;
    QJsonValue value;

    static CommandResult ok(const QJsonValue &value);
    static CommandResult error(const QString &message);
};

// Greeting shown by the frontend. Never fails.
QString greet(const QString &name);

/**
 * @brief Named commands the frontend can call.
 *
 * Each command takes its arguments as a JSON object and answers with a
 * CommandResult. Unknown commands and bad arguments come back as failed
 * results; nothing throws.
 */
class CommandRegistry
{
public:
    using Handler = std::function<CommandResult(const QJsonObject &args)>;

    CommandRegistry() = default;

    // Registry holding the built-in commands (greet)
    static CommandRegistry withDefaultCommands();

    void registerCommand(const QString &name, const Handler &handler);
    bool hasCommand(const QString &name) const { return m_handlers.contains(name); }
    QStringList commandNames() const { return m_handlers.keys(); }

    CommandResult invoke(const QString &name, const QJsonObject &args = QJsonObject()) const;

private:
    QMap<QString, Handler> m_handlers;
};

#endif // COMMANDREGISTRY_H
