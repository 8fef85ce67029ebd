#include "LogStore.h"

#include <QDateTime>
#include <QMetaObject>
#include <QSaveFile>
#include <QThread>

#include <algorithm>

namespace {

LogStore* g_logStore = nullptr;

QtMessageHandler g_prevQtHandler = nullptr;
bool g_forwardQt = true;

QString levelTag(LogStore::Level level)
{
  switch (level) {
    case LogStore::Level::Error:
      return QStringLiteral("E");
    case LogStore::Level::Warning:
      return QStringLiteral("W");
    case LogStore::Level::Info:
      return QStringLiteral("I");
    case LogStore::Level::Debug:
      return QStringLiteral("D");
  }
  return QStringLiteral("?");
}

void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
  LogStore* store = LogStore::instance();
  if (store) {
    LogStore::Level level = LogStore::Level::Info;
    switch (type) {
      case QtDebugMsg:
        level = LogStore::Level::Debug;
        break;
      case QtInfoMsg:
        level = LogStore::Level::Info;
        break;
      case QtWarningMsg:
        level = LogStore::Level::Warning;
        break;
      case QtCriticalMsg:
      case QtFatalMsg:
        level = LogStore::Level::Error;
        break;
    }
    const QString source = context.category && qstrcmp(context.category, "default") != 0 ? QString::fromUtf8(context.category)
                                                                                          : QStringLiteral("Qt");
    store->append(level, source, message);
  }

  if (g_prevQtHandler && g_forwardQt) {
    g_prevQtHandler(type, context, message);
  }
}

} // namespace

LogStore::LogStore(QObject* parent)
    : QObject(parent)
{
  if (!g_logStore) {
    g_logStore = this;
  }
}

LogStore::~LogStore()
{
  if (g_logStore == this) {
    g_logStore = nullptr;
    if (m_qtHandlerInstalled) {
      qInstallMessageHandler(g_prevQtHandler);
      g_prevQtHandler = nullptr;
    }
  }
}

LogStore* LogStore::instance()
{
  return g_logStore;
}

void LogStore::installQtMessageHandler(bool forwardToStderr)
{
  if (m_qtHandlerInstalled) {
    return;
  }

  g_forwardQt = forwardToStderr;
  g_prevQtHandler = qInstallMessageHandler(&qtMessageHandler);
  m_qtHandlerInstalled = true;
}

void LogStore::setMaxLines(int maxLines)
{
  m_maxLines = std::max(1, maxLines);
  while (m_lines.size() > m_maxLines) {
    m_lines.pop_front();
  }
}

void LogStore::append(Level level, QString source, QString message)
{
  const QString ts = QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss.zzz"));
  const QString line = QStringLiteral("%1 [%2] %3: %4").arg(ts, levelTag(level), source, message);

  if (QThread::currentThread() == thread()) {
    appendLine(line);
    return;
  }

  QMetaObject::invokeMethod(this, [this, line]() { appendLine(line); }, Qt::QueuedConnection);
}

QStringList LogStore::lines() const
{
  return m_lines;
}

void LogStore::clear()
{
  if (QThread::currentThread() != thread()) {
    QMetaObject::invokeMethod(this, [this]() { clear(); }, Qt::QueuedConnection);
    return;
  }
  m_lines.clear();
  emit cleared();
}

bool LogStore::saveToFile(const QString& path, QString* errorOut) const
{
  QSaveFile f(path);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
    if (errorOut) {
      *errorOut = QStringLiteral("open failed: %1").arg(f.errorString());
    }
    return false;
  }

  const QByteArray data = m_lines.join(QLatin1Char('\n')).toUtf8() + "\n";
  if (f.write(data) != data.size()) {
    if (errorOut) {
      *errorOut = QStringLiteral("write failed: %1").arg(f.errorString());
    }
    return false;
  }
  if (!f.commit()) {
    if (errorOut) {
      *errorOut = QStringLiteral("commit failed: %1").arg(f.errorString());
    }
    return false;
  }
  return true;
}

void LogStore::appendLine(QString line)
{
  m_lines.push_back(std::move(line));
  while (m_lines.size() > m_maxLines) {
    m_lines.pop_front();
  }
  emit lineAdded(m_lines.back());
}
