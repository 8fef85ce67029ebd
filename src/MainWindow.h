#pragma once

#include <QMainWindow>

#include "backend/LifecycleEvent.h"

class QCloseEvent;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class LogStore;
class PairingSession;

class MainWindow final : public QMainWindow
{
  Q_OBJECT

public:
  explicit MainWindow(LogStore* logs, QWidget* parent = nullptr);
  ~MainWindow() override;

  PairingSession* session() const { return m_session; }

protected:
  void closeEvent(QCloseEvent* event) override;

private:
  void buildUi();
  void buildMenus();
  void startSession();
  void applySuggestion();

  void openSettings();
  void openLogs();

  void requestPair();
  void requestConnect();

  void onEvent(const LifecycleEvent& event);
  void showCredential(const PairingCredential& credential);
  void appendLog(const QString& line);
  void refreshControls();

  LogStore* m_logs = nullptr;
  PairingSession* m_session = nullptr;

  QLabel* m_statusLabel = nullptr;
  QLabel* m_qrImage = nullptr;
  QLabel* m_payloadLabel = nullptr;
  QLabel* m_manualLabel = nullptr;

  QLineEdit* m_pairHost = nullptr;
  QLineEdit* m_pairPort = nullptr;
  QLineEdit* m_pairCode = nullptr;
  QLineEdit* m_connectHost = nullptr;
  QLineEdit* m_connectPort = nullptr;

  QPushButton* m_regenerateButton = nullptr;
  QPushButton* m_pairButton = nullptr;
  QPushButton* m_connectButton = nullptr;
  QPushButton* m_mirrorButton = nullptr;

  QPlainTextEdit* m_logView = nullptr;

  // Set by requests, cleared by the terminal event that answers them.
  bool m_busy = false;
};
