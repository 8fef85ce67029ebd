#pragma once

#include <QDialog>

class QLineEdit;
class QSpinBox;

class SettingsDialog final : public QDialog
{
  Q_OBJECT

public:
  explicit SettingsDialog(QWidget* parent = nullptr);

private:
  void load();
  void restoreDefaults();
  void accept() override;

  QLineEdit* m_adbProgram = nullptr;
  QLineEdit* m_mirrorProgram = nullptr;
  QLineEdit* m_mirrorExtraArgs = nullptr;
  QLineEdit* m_wellKnownPort = nullptr;
  QSpinBox* m_commandTimeoutMs = nullptr;
  QSpinBox* m_shutdownGraceMs = nullptr;
};
