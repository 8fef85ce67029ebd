#include "LogsDialog.h"

#include "backend/LogStore.h"

#include <QApplication>
#include <QCheckBox>
#include <QClipboard>
#include <QDialogButtonBox>
#include <QFileDialog>
#include <QFontDatabase>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QTextCursor>
#include <QVBoxLayout>

LogsDialog::LogsDialog(LogStore* logs, QWidget* parent)
    : QDialog(parent)
    , m_logs(logs)
{
  setWindowTitle(tr("PairMirror log"));
  setModal(false);
  resize(860, 520);

  buildUi();
  reload();

  if (m_logs) {
    connect(m_logs, &LogStore::lineAdded, this, &LogsDialog::appendLine);
    connect(m_logs, &LogStore::cleared, this, [this]() { m_view->clear(); });
  }
}

LogsDialog::~LogsDialog() = default;

void LogsDialog::buildUi()
{
  auto* root = new QVBoxLayout(this);

  auto* bar = new QHBoxLayout();
  m_filter = new QLineEdit(this);
  m_filter->setPlaceholderText(tr("Filter (e.g. bridge, warning)"));
  m_filter->setClearButtonEnabled(true);
  connect(m_filter, &QLineEdit::textChanged, this, &LogsDialog::reload);
  bar->addWidget(m_filter, 1);

  m_followTail = new QCheckBox(tr("Follow tail"), this);
  m_followTail->setChecked(true);
  bar->addWidget(m_followTail);

  auto* clearButton = new QPushButton(tr("Clear"), this);
  connect(clearButton, &QPushButton::clicked, this, [this]() {
    if (m_logs) {
      m_logs->clear();
    }
  });
  bar->addWidget(clearButton);

  auto* copyButton = new QPushButton(tr("Copy"), this);
  connect(copyButton, &QPushButton::clicked, this, &LogsDialog::copyAll);
  bar->addWidget(copyButton);

  auto* saveButton = new QPushButton(tr("Save…"), this);
  connect(saveButton, &QPushButton::clicked, this, &LogsDialog::saveToFile);
  bar->addWidget(saveButton);
  root->addLayout(bar);

  m_view = new QPlainTextEdit(this);
  m_view->setReadOnly(true);
  m_view->setLineWrapMode(QPlainTextEdit::NoWrap);
  m_view->setMaximumBlockCount(2500);
  m_view->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
  root->addWidget(m_view, 1);

  auto* buttons = new QDialogButtonBox(QDialogButtonBox::Close, this);
  connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
  root->addWidget(buttons);
}

bool LogsDialog::matchesFilter(const QString& line) const
{
  const QString f = m_filter ? m_filter->text().trimmed() : QString();
  return f.isEmpty() || line.contains(f, Qt::CaseInsensitive);
}

void LogsDialog::reload()
{
  if (!m_logs) {
    return;
  }
  QStringList shown;
  for (const QString& line : m_logs->lines()) {
    if (matchesFilter(line)) {
      shown.push_back(line);
    }
  }
  m_view->setPlainText(shown.join(QLatin1Char('\n')));
  scrollToEndIfFollowing();
}

void LogsDialog::appendLine(const QString& line)
{
  if (!matchesFilter(line)) {
    return;
  }
  m_view->appendPlainText(line);
  scrollToEndIfFollowing();
}

void LogsDialog::scrollToEndIfFollowing()
{
  if (!m_followTail->isChecked()) {
    return;
  }
  QTextCursor c = m_view->textCursor();
  c.movePosition(QTextCursor::End);
  m_view->setTextCursor(c);
}

void LogsDialog::copyAll()
{
  if (auto* cb = QApplication::clipboard()) {
    cb->setText(m_view->toPlainText());
  }
}

void LogsDialog::saveToFile()
{
  if (!m_logs) {
    return;
  }

  const QString path = QFileDialog::getSaveFileName(this, tr("Save log"), QStringLiteral("pairmirror.log"));
  if (path.trimmed().isEmpty()) {
    return;
  }

  QString error;
  if (!m_logs->saveToFile(path, &error)) {
    QMessageBox::warning(this, tr("Save log"), error);
  }
}
