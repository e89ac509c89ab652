#include "UiNotifier.h"
#include "Logging.h"

#include <QApplication>
#include <QWidget>

UiEvent::UiEvent(const QString &name, const QString &payload)
    : QEvent(eventType())
    , m_name(name)
    , m_payload(payload)
{
}

QEvent::Type UiEvent::eventType()
{
    static const QEvent::Type type =
        static_cast<QEvent::Type>(QEvent::registerEventType());
    return type;
}

bool UiNotifier::emitTo(const QString &windowId,
                        const QString &eventName,
                        const QString &payload)
{
    const QWidgetList windows = QApplication::topLevelWidgets();
    for (QWidget *window : windows) {
        if (window->objectName() != windowId)
            continue;

        qCDebug(lcaApp) << "Emitting" << eventName << "to window" << windowId;
        QCoreApplication::postEvent(window, new UiEvent(eventName, payload));
        return true;
    }

    qCDebug(lcaApp) << "No window" << windowId << "for event" << eventName;
    return false;
}
