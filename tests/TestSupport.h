#pragma once

#include "backend/LifecycleEvent.h"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QString>
#include <QThread>

#include <ostream>
#include <vector>

// Readable QString values in gtest failure messages.
inline void PrintTo(const QString& s, std::ostream* os)
{
  *os << '"' << s.toStdString() << '"';
}

namespace pairmirror::test {

// Spins the caller's event loop until `done` holds or `timeoutMs` passes.
template <typename Pred>
bool waitUntil(Pred done, int timeoutMs = 5000)
{
  QElapsedTimer t;
  t.start();
  while (!done()) {
    if (t.elapsed() > timeoutMs) {
      return false;
    }
    QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    QThread::msleep(1);
  }
  return true;
}

class RecordingSink final : public LifecycleEventSink
{
public:
  void post(const LifecycleEvent& event) override { events.push_back(event); }

  std::vector<LifecycleEvent::Kind> kinds() const
  {
    std::vector<LifecycleEvent::Kind> out;
    for (const auto& e : events) {
      out.push_back(e.kind);
    }
    return out;
  }

  // Everything except Log and PhaseChanged, which interleave freely.
  std::vector<LifecycleEvent> outcomes() const
  {
    std::vector<LifecycleEvent> out;
    for (const auto& e : events) {
      if (e.kind != LifecycleEvent::Kind::Log && e.kind != LifecycleEvent::Kind::PhaseChanged) {
        out.push_back(e);
      }
    }
    return out;
  }

  std::vector<LifecycleEvent> ofKind(LifecycleEvent::Kind kind) const
  {
    std::vector<LifecycleEvent> out;
    for (const auto& e : events) {
      if (e.kind == kind) {
        out.push_back(e);
      }
    }
    return out;
  }

  int count(LifecycleEvent::Kind kind) const { return static_cast<int>(ofKind(kind).size()); }

  std::vector<Phase> phases() const
  {
    std::vector<Phase> out;
    for (const auto& e : ofKind(LifecycleEvent::Kind::PhaseChanged)) {
      out.push_back(e.state.phase);
    }
    return out;
  }

  std::vector<LifecycleEvent> events;
};

} // namespace pairmirror::test
