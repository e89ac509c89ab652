#ifndef UINOTIFIER_H
#define UINOTIFIER_H

#include <QEvent>
#include <QString>

/**
 * @brief Named event with a text payload, delivered to a top-level window.
 */
class UiEvent : public QEvent
{
public:
    UiEvent(const QString &name, const QString &payload);

    static QEvent::Type eventType();

    QString name() const { return m_name; }
    QString payload() const { return m_payload; }

private:
    QString m_name;
    QString m_payload;
};

namespace UiEvents {
inline constexpr const char *BackendReady = "backend-ready";
inline constexpr const char *BackendUnavailable = "backend-unavailable";
}

/**
 * @brief Delivers UiEvents to windows looked up by object name.
 *
 * Lookup goes through QApplication::topLevelWidgets(). A missing window is
 * not an error: emitTo() returns false and nothing is posted.
 */
class UiNotifier
{
public:
    static constexpr const char *kMainWindowId = "main";

    virtual ~UiNotifier() = default;

    virtual bool emitTo(const QString &windowId,
                        const QString &eventName,
                        const QString &payload);
};

#endif // UINOTIFIER_H
