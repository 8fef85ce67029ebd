#pragma once

#include <QDialog>

class QCheckBox;
class QLineEdit;
class QPlainTextEdit;
class LogStore;

// Full console: every LogStore line, including Qt warnings and controller output.
class LogsDialog final : public QDialog
{
  Q_OBJECT

public:
  explicit LogsDialog(LogStore* logs, QWidget* parent = nullptr);
  ~LogsDialog() override;

  LogsDialog(const LogsDialog&) = delete;
  LogsDialog& operator=(const LogsDialog&) = delete;

private:
  void buildUi();
  void reload();

  bool matchesFilter(const QString& line) const;
  void appendLine(const QString& line);
  void scrollToEndIfFollowing();
  void copyAll();
  void saveToFile();

  LogStore* m_logs = nullptr;
  QPlainTextEdit* m_view = nullptr;
  QLineEdit* m_filter = nullptr;
  QCheckBox* m_followTail = nullptr;
};
