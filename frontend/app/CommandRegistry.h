#ifndef COMMANDREGISTRY_H
#define COMMANDREGISTRY_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <QJsonValue>
#include <functional>

/**
 * @brief Result of invoking a UI command.
 */
struct CommandResult {
    bool success = false;
    QString errorMessage;

    QJsonValue value;
};

/**
 * @brief Named, synchronous, zero-argument commands callable from the UI.
 */
class CommandRegistry
{
public:
    using Handler = std::function<QJsonValue()>;

    // Returns false if a command with this name already exists
    bool registerCommand(const QString &name, Handler handler);

    bool contains(const QString &name) const { return m_handlers.contains(name); }
    QStringList commandNames() const { return m_handlers.keys(); }

    CommandResult invoke(const QString &name) const;

private:
    QMap<QString, Handler> m_handlers;
};

// Registers "ping" -> "pong"
void registerBuiltinCommands(CommandRegistry &registry);

#endif // COMMANDREGISTRY_H
