#include "MainWindow.h"

#include <QApplication>
#include <QClipboard>
#include <QCloseEvent>
#include <QFontDatabase>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QPixmap>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSettings>
#include <QStatusBar>
#include <QVBoxLayout>

#include "backend/BridgeConfig.h"
#include "backend/LogStore.h"
#include "backend/NetworkSuggestion.h"
#include "backend/PairingSession.h"
#include "settings/SettingsKeys.h"
#include "ui/LogsDialog.h"
#include "ui/QrImage.h"
#include "ui/SettingsDialog.h"

namespace {

constexpr int kQrModulePixels = 6;

} // namespace

MainWindow::MainWindow(LogStore* logs, QWidget* parent)
    : QMainWindow(parent)
    , m_logs(logs)
{
  setWindowTitle(QStringLiteral("PairMirror"));

  buildUi();
  buildMenus();
  applySuggestion();
  startSession();
}

MainWindow::~MainWindow()
{
  if (m_session) {
    m_session->shutdown();
  }
}

void MainWindow::buildUi()
{
  auto* central = new QWidget(this);
  auto* root = new QVBoxLayout(central);

  auto* qrBox = new QGroupBox(tr("Pair device with QR code"), central);
  auto* qrLayout = new QVBoxLayout(qrBox);
  m_qrImage = new QLabel(qrBox);
  m_qrImage->setAlignment(Qt::AlignCenter);
  qrLayout->addWidget(m_qrImage);

  m_payloadLabel = new QLabel(qrBox);
  m_payloadLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
  m_payloadLabel->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
  m_payloadLabel->setAlignment(Qt::AlignCenter);
  qrLayout->addWidget(m_payloadLabel);

  m_manualLabel = new QLabel(qrBox);
  m_manualLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
  m_manualLabel->setWordWrap(true);
  qrLayout->addWidget(m_manualLabel);

  auto* qrButtons = new QHBoxLayout();
  m_regenerateButton = new QPushButton(tr("Regenerate"), qrBox);
  connect(m_regenerateButton, &QPushButton::clicked, this, [this]() {
    if (m_session) {
      m_session->regenerate();
    }
  });
  qrButtons->addWidget(m_regenerateButton);
  auto* copyButton = new QPushButton(tr("Copy payload"), qrBox);
  connect(copyButton, &QPushButton::clicked, this, [this]() {
    if (auto* cb = QApplication::clipboard(); cb && m_payloadLabel) {
      cb->setText(m_payloadLabel->text());
    }
  });
  qrButtons->addWidget(copyButton);
  qrButtons->addStretch(1);
  qrLayout->addLayout(qrButtons);
  root->addWidget(qrBox);

  auto* pairBox = new QGroupBox(tr("Pair device with pairing code"), central);
  auto* pairForm = new QFormLayout(pairBox);
  m_pairHost = new QLineEdit(pairBox);
  m_pairHost->setPlaceholderText(tr("Phone IP address"));
  m_pairPort = new QLineEdit(pairBox);
  m_pairPort->setPlaceholderText(tr("Pairing port"));
  m_pairCode = new QLineEdit(pairBox);
  m_pairCode->setPlaceholderText(tr("Pairing code (empty: QR password)"));
  pairForm->addRow(tr("Host"), m_pairHost);
  pairForm->addRow(tr("Port"), m_pairPort);
  pairForm->addRow(tr("Code"), m_pairCode);
  m_pairButton = new QPushButton(tr("Pair"), pairBox);
  connect(m_pairButton, &QPushButton::clicked, this, &MainWindow::requestPair);
  pairForm->addRow(QString(), m_pairButton);
  root->addWidget(pairBox);

  auto* connectBox = new QGroupBox(tr("Connect"), central);
  auto* connectForm = new QFormLayout(connectBox);
  m_connectHost = new QLineEdit(connectBox);
  m_connectPort = new QLineEdit(connectBox);
  connectForm->addRow(tr("Host"), m_connectHost);
  connectForm->addRow(tr("Port"), m_connectPort);
  auto* connectButtons = new QHBoxLayout();
  m_connectButton = new QPushButton(tr("Connect"), connectBox);
  connect(m_connectButton, &QPushButton::clicked, this, &MainWindow::requestConnect);
  connectButtons->addWidget(m_connectButton);
  m_mirrorButton = new QPushButton(tr("Start scrcpy"), connectBox);
  m_mirrorButton->setEnabled(false);
  connect(m_mirrorButton, &QPushButton::clicked, this, [this]() {
    if (!m_session) {
      return;
    }
    m_busy = true;
    refreshControls();
    m_session->launchMirror();
  });
  connectButtons->addWidget(m_mirrorButton);
  connectButtons->addStretch(1);
  connectForm->addRow(QString(), connectButtons);
  root->addWidget(connectBox);

  m_logView = new QPlainTextEdit(central);
  m_logView->setReadOnly(true);
  m_logView->setMaximumBlockCount(1000);
  m_logView->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
  root->addWidget(m_logView, 1);

  setCentralWidget(central);

  m_statusLabel = new QLabel(this);
  statusBar()->addPermanentWidget(m_statusLabel, 1);
}

void MainWindow::buildMenus()
{
  QMenu* file = menuBar()->addMenu(tr("&File"));
  file->addAction(tr("Settings…"), this, &MainWindow::openSettings);
  file->addAction(tr("Logs…"), this, &MainWindow::openLogs);
  file->addSeparator();
  file->addAction(tr("Quit"), this, &QWidget::close);
}

void MainWindow::startSession()
{
  QSettings s;
  const BridgeConfig cfg = loadBridgeConfig(s);

  m_session = new PairingSession(cfg, this);
  m_session->attachLogStore(m_logs);
  connect(m_session, &PairingSession::eventDelivered, this, &MainWindow::onEvent);

  showCredential(m_session->credential());
  refreshControls();
  m_session->checkBridge();
}

void MainWindow::applySuggestion()
{
  QSettings s;
  const BridgeConfig cfg = loadBridgeConfig(s);
  const QString lastHost = s.value(SettingsKeys::uiLastPairHost()).toString();
  const QString lastPort = s.value(SettingsKeys::uiLastConnectPort(), cfg.wellKnownPort).toString();

  const std::optional<NetworkSuggestion> suggestion = suggestNetworkTarget(cfg.wellKnownPort);
  const QString host = !lastHost.isEmpty() ? lastHost : (suggestion ? suggestion->suggestedHost : QString());

  m_pairHost->setText(host);
  m_pairPort->setText(suggestion ? suggestion->pairingPort : QString());
  m_connectHost->setText(host);
  m_connectPort->setText(lastPort);
}

void MainWindow::openSettings()
{
  SettingsDialog dlg(this);
  if (dlg.exec() != QDialog::Accepted) {
    return;
  }
  // The running controller keeps its config; restart it so new programs and timeouts apply.
  if (m_session) {
    disconnect(m_session, nullptr, this, nullptr);
    if (!m_session->shutdown()) {
      appendLog(tr("Previous controller is still busy; it will exit on its own."));
    }
    m_session->deleteLater();
    m_session = nullptr;
  }
  startSession();
}

void MainWindow::openLogs()
{
  auto* dlg = new LogsDialog(m_logs, this);
  dlg->setAttribute(Qt::WA_DeleteOnClose);
  dlg->show();
}

void MainWindow::requestPair()
{
  if (!m_session) {
    return;
  }
  const QString host = m_pairHost->text().trimmed();
  const QString port = m_pairPort->text().trimmed();
  if (host.isEmpty() || !isValidPort(port)) {
    appendLog(tr("Enter the phone address and the pairing port shown on the phone."));
    return;
  }
  QSettings s;
  s.setValue(SettingsKeys::uiLastPairHost(), host);

  m_busy = true;
  refreshControls();
  m_session->pair(host, port, m_pairCode->text().trimmed());
}

void MainWindow::requestConnect()
{
  if (!m_session) {
    return;
  }
  const QString host = m_connectHost->text().trimmed();
  const QString port = m_connectPort->text().trimmed();
  if (host.isEmpty() || !isValidPort(port)) {
    appendLog(tr("Enter the phone address and the connect port."));
    return;
  }
  QSettings s;
  s.setValue(SettingsKeys::uiLastConnectPort(), port);

  m_busy = true;
  refreshControls();
  m_session->connectDevice(host, port);
}

void MainWindow::onEvent(const LifecycleEvent& event)
{
  switch (event.kind) {
    case LifecycleEvent::Kind::Log:
      appendLog(event.text);
      break;
    case LifecycleEvent::Kind::PhaseChanged:
      break;
    case LifecycleEvent::Kind::BridgeReady:
      appendLog(tr("adb ready: %1").arg(event.text));
      m_busy = false;
      break;
    case LifecycleEvent::Kind::BridgeUnavailable:
    case LifecycleEvent::Kind::Error:
      appendLog(tr("Error: %1").arg(event.failure.reason));
      m_busy = false;
      break;
    case LifecycleEvent::Kind::CredentialChanged:
      showCredential(event.credential);
      break;
    case LifecycleEvent::Kind::Paired:
      appendLog(tr("Paired. Connecting is the next step."));
      m_connectHost->setText(event.address.host);
      m_connectPort->setText(event.address.port);
      m_busy = false;
      break;
    case LifecycleEvent::Kind::Connected:
      appendLog(tr("Connected to %1").arg(event.address.target()));
      m_busy = false;
      break;
    case LifecycleEvent::Kind::MirrorStarted:
      appendLog(tr("scrcpy started for %1").arg(event.serial));
      m_busy = false;
      break;
  }
  refreshControls();
}

void MainWindow::showCredential(const PairingCredential& credential)
{
  m_payloadLabel->setText(credential.qrPayload());

  QString error;
  const QImage qr = renderQrImage(credential.qrPayload(), kQrModulePixels, &error);
  if (qr.isNull()) {
    m_qrImage->setPixmap(QPixmap());
    m_qrImage->setText(tr("QR code unavailable: %1").arg(error));
  } else {
    m_qrImage->setPixmap(QPixmap::fromImage(qr));
  }
  m_manualLabel->setText(tr("Service name: %1    Password: %2\nManual fallback: %3")
                             .arg(credential.name, credential.password, credential.manualPairHint()));
}

void MainWindow::appendLog(const QString& line)
{
  if (m_logView) {
    m_logView->appendPlainText(line);
  }
}

void MainWindow::refreshControls()
{
  const ControllerState st = m_session ? m_session->state() : ControllerState{};
  const bool ready = m_session && st.bridgeAvailable && !m_busy;

  m_regenerateButton->setEnabled(m_session != nullptr);
  m_pairButton->setEnabled(ready);
  m_connectButton->setEnabled(ready);
  m_mirrorButton->setEnabled(ready && st.connectedAddress.has_value());

  QString status = tr("Phase: %1").arg(phaseName(st.phase));
  if (st.connectedAddress) {
    status += tr("  |  Connected: %1").arg(st.connectedAddress->target());
  }
  if (st.mirrorPid > 0) {
    status += tr("  |  scrcpy pid %1").arg(st.mirrorPid);
  }
  if (m_session && !st.bridgeAvailable && st.phase != Phase::Uninitialized && st.phase != Phase::CheckingBridge) {
    status += tr("  |  adb unavailable");
  }
  m_statusLabel->setText(status);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
  if (m_session && !m_session->shutdown()) {
    qWarning("controller still busy at exit; abandoning it");
  }
  event->accept();
}
