#include "SettingsDialog.h"

#include "backend/BridgeConfig.h"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QSettings>
#include <QSpinBox>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(QWidget* parent)
    : QDialog(parent)
{
  setWindowTitle(tr("Settings"));
  setModal(true);
  resize(560, 360);

  auto* root = new QVBoxLayout(this);

  auto* programs = new QGroupBox(tr("Programs"), this);
  {
    auto* form = new QFormLayout(programs);
    m_adbProgram = new QLineEdit(programs);
    m_adbProgram->setPlaceholderText(QStringLiteral("adb"));
    form->addRow(tr("adb"), m_adbProgram);

    m_mirrorProgram = new QLineEdit(programs);
    m_mirrorProgram->setPlaceholderText(QStringLiteral("scrcpy"));
    form->addRow(tr("scrcpy"), m_mirrorProgram);

    m_mirrorExtraArgs = new QLineEdit(programs);
    m_mirrorExtraArgs->setPlaceholderText(QStringLiteral("--max-size 1024"));
    form->addRow(tr("scrcpy extra arguments"), m_mirrorExtraArgs);
  }
  root->addWidget(programs);

  auto* bridge = new QGroupBox(tr("Connection"), this);
  {
    auto* form = new QFormLayout(bridge);
    m_wellKnownPort = new QLineEdit(bridge);
    form->addRow(tr("Port after pairing"), m_wellKnownPort);

    m_commandTimeoutMs = new QSpinBox(bridge);
    m_commandTimeoutMs->setRange(100, 600000);
    m_commandTimeoutMs->setSingleStep(500);
    m_commandTimeoutMs->setSuffix(tr(" ms"));
    form->addRow(tr("adb command timeout"), m_commandTimeoutMs);

    m_shutdownGraceMs = new QSpinBox(bridge);
    m_shutdownGraceMs->setRange(0, 60000);
    m_shutdownGraceMs->setSingleStep(250);
    m_shutdownGraceMs->setSuffix(tr(" ms"));
    form->addRow(tr("Shutdown grace period"), m_shutdownGraceMs);

    auto* help = new QLabel(tr("Changes restart the background controller."), bridge);
    help->setWordWrap(true);
    form->addRow(help);
  }
  root->addWidget(bridge);
  root->addStretch(1);

  auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel | QDialogButtonBox::RestoreDefaults, this);
  connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
  connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
  connect(buttons->button(QDialogButtonBox::RestoreDefaults), &QPushButton::clicked, this, &SettingsDialog::restoreDefaults);
  root->addWidget(buttons);

  load();
}

void SettingsDialog::load()
{
  QSettings s;
  const BridgeConfig cfg = loadBridgeConfig(s);
  m_adbProgram->setText(cfg.adbProgram);
  m_mirrorProgram->setText(cfg.mirrorProgram);
  m_mirrorExtraArgs->setText(cfg.mirrorExtraArgs.join(QLatin1Char(' ')));
  m_wellKnownPort->setText(cfg.wellKnownPort);
  m_commandTimeoutMs->setValue(cfg.commandTimeoutMs);
  m_shutdownGraceMs->setValue(cfg.shutdownGraceMs);
}

void SettingsDialog::restoreDefaults()
{
  const BridgeConfig cfg;
  m_adbProgram->setText(cfg.adbProgram);
  m_mirrorProgram->setText(cfg.mirrorProgram);
  m_mirrorExtraArgs->clear();
  m_wellKnownPort->setText(cfg.wellKnownPort);
  m_commandTimeoutMs->setValue(cfg.commandTimeoutMs);
  m_shutdownGraceMs->setValue(cfg.shutdownGraceMs);
}

void SettingsDialog::accept()
{
  BridgeConfig cfg;
  const QString adb = m_adbProgram->text().trimmed();
  const QString scrcpy = m_mirrorProgram->text().trimmed();
  if (!adb.isEmpty()) {
    cfg.adbProgram = adb;
  }
  if (!scrcpy.isEmpty()) {
    cfg.mirrorProgram = scrcpy;
  }
  cfg.mirrorExtraArgs = m_mirrorExtraArgs->text().split(QLatin1Char(' '), Qt::SkipEmptyParts);
  cfg.commandTimeoutMs = m_commandTimeoutMs->value();
  cfg.shutdownGraceMs = m_shutdownGraceMs->value();

  const QString port = m_wellKnownPort->text().trimmed();
  if (!isValidPort(port)) {
    QMessageBox::warning(this, tr("Settings"), tr("Port must be a number between 1 and 65535."));
    return;
  }
  cfg.wellKnownPort = port;

  QSettings s;
  saveBridgeConfig(s, cfg);
  QDialog::accept();
}
