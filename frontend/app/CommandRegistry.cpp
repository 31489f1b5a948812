#include "CommandRegistry.h"
#include <QDebug>

CommandResult CommandResult::ok(const QJsonValue &value)
{
    CommandResult result;
    result.success = true;
    result.value = value;
    return result;
}

CommandResult CommandResult::error(const QString &message)
{
    CommandResult result;
    result.errorMessage = message;
    return result;
}

QString greet(const QString &name)
{
    return QString("Hello, %1! Welcome to Lazy Learn.").arg(name);
}

// ============================================================================
// Registry
// ============================================================================

CommandRegistry CommandRegistry::withDefaultCommands()
{
    CommandRegistry registry;

    registry.registerCommand("greet", [](const QJsonObject &args) {
        QJsonValue name = args.value("name");
        if (!name.isString()) {
            return CommandResult::error("Missing argument: name");
        }
        return CommandResult::ok(greet(name.toString()));
    });

    return registry;
}

void CommandRegistry::registerCommand(const QString &name, const Handler &handler)
{
    if (m_handlers.contains(name)) {
        qWarning() << "Replacing handler for command:" << name;
    }
    m_handlers.insert(name, handler);
}

CommandResult CommandRegistry::invoke(const QString &name, const QJsonObject &args) const
{
    auto it = m_handlers.constFind(name);
    if (it == m_handlers.constEnd()) {
        return CommandResult::error(QString("Unknown command: %1").arg(name));
    }
    return it.value()(args);
}
