#include "CommandRegistry.h"
#include "Logging.h"

bool CommandRegistry::registerCommand(const QString &name, Handler handler)
{
    if (name.isEmpty() || !handler) {
        qCWarning(lcaApp) << "Refusing to register invalid command" << name;
        return false;
    }
    if (m_handlers.contains(name)) {
        qCWarning(lcaApp) << "Command already registered:" << name;
        return false;
    }
    m_handlers.insert(name, std::move(handler));
    return true;
}

CommandResult CommandRegistry::invoke(const QString &name) const
{
    CommandResult result;

    auto it = m_handlers.constFind(name);
    if (it == m_handlers.constEnd()) {
        result.errorMessage = QString("Unknown command: %1").arg(name);
        return result;
    }

    result.value = it.value()();
    result.success = true;
    return result;
}

void registerBuiltinCommands(CommandRegistry &registry)
{
    registry.registerCommand("ping", []() {
        return QJsonValue(QStringLiteral("pong"));
    });
}
