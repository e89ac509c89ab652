#include "mainwindow.h"
#include "app/CommandRegistry.h"
#include "app/Logging.h"
#include "app/UiNotifier.h"

#include <QFormLayout>
#include <QLabel>
#include <QPushButton>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

MainWindow::MainWindow(const CommandRegistry *commands,
                       const QString &dataDir,
                       QWidget *parent)
    : QMainWindow(parent)
    , m_commands(commands)
{
    setObjectName(UiNotifier::kMainWindowId);
    setWindowTitle(tr("Local Chess Analyzer"));
    setupUi(dataDir);
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi(const QString &dataDir)
{
    auto *central = new QWidget(this);
    auto *layout = new QVBoxLayout(central);

    auto *form = new QFormLayout();
    m_dataDirLabel = new QLabel(dataDir, central);
    m_dataDirLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    m_pingResultLabel = new QLabel(tr("-"), central);
    form->addRow(tr("Data directory:"), m_dataDirLabel);
    form->addRow(tr("Last ping:"), m_pingResultLabel);
    layout->addLayout(form);

    m_pingButton = new QPushButton(tr("Ping"), central);
    layout->addWidget(m_pingButton);
    layout->addStretch();
    setCentralWidget(central);

    connect(m_pingButton, &QPushButton::clicked, this, &MainWindow::ping);

    // Setup status bar labels
    m_backendStatusLabel = new QLabel(tr("Backend: Starting..."));
    statusBar()->addWidget(m_backendStatusLabel);

    resize(480, 200);
}

QString MainWindow::statusText() const
{
    return m_backendStatusLabel->text();
}

bool MainWindow::event(QEvent *event)
{
    if (event->type() == UiEvent::eventType()) {
        auto *uiEvent = static_cast<UiEvent*>(event);
        if (uiEvent->name() == UiEvents::BackendReady) {
            onBackendReady(uiEvent->payload());
        } else if (uiEvent->name() == UiEvents::BackendUnavailable) {
            onBackendUnavailable(uiEvent->payload());
        } else {
            qCDebug(lcaApp) << "Unhandled UI event" << uiEvent->name();
        }
        return true;
    }
    return QMainWindow::event(event);
}

void MainWindow::onBackendReady(const QString &port)
{
    m_backendPort = port;
    m_backendStatusLabel->setText(tr("Backend: Online (port %1)").arg(port));
    m_backendStatusLabel->setStyleSheet("color: green;");
    emit backendReady(port);
}

void MainWindow::onBackendUnavailable(const QString &reason)
{
    m_backendPort.clear();
    m_backendStatusLabel->setText(tr("Backend: Unavailable - %1").arg(reason));
    m_backendStatusLabel->setStyleSheet("color: red;");
    emit backendUnavailable(reason);
}

void MainWindow::ping()
{
    if (!m_commands) {
        m_pingResultLabel->setText(tr("No command registry"));
        return;
    }

    const CommandResult result = m_commands->invoke("ping");
    if (result.success) {
        m_pingResultLabel->setText(result.value.toString());
    } else {
        m_pingResultLabel->setText(result.errorMessage);
        qCWarning(lcaApp) << "Ping failed:" << result.errorMessage;
    }
}
