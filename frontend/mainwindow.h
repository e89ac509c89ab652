#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>

class CommandRegistry;
class QLabel;
class QPushButton;

/**
 * @brief Main application window for LocalChessAnalyzer.
 *
 * Object name "main". Receives backend-ready / backend-unavailable UiEvents
 * and shows the backend status; the Ping button calls the "ping" command.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(const CommandRegistry *commands,
               const QString &dataDir,
               QWidget *parent = nullptr);
    ~MainWindow() override;

    QString backendPort() const { return m_backendPort; }
    bool isBackendOnline() const { return !m_backendPort.isEmpty(); }
    QString statusText() const;

signals:
    void backendReady(const QString &port);
    void backendUnavailable(const QString &reason);

protected:
    bool event(QEvent *event) override;

private slots:
    void ping();

private:
    void setupUi(const QString &dataDir);
    void onBackendReady(const QString &port);
    void onBackendUnavailable(const QString &reason);

    const CommandRegistry *m_commands;
    QString m_backendPort;

    QLabel *m_backendStatusLabel = nullptr;
    QLabel *m_dataDirLabel = nullptr;
    QLabel *m_pingResultLabel = nullptr;
    QPushButton *m_pingButton = nullptr;
};

#endif // MAINWINDOW_H
