#pragma once

#include "backend/LifecycleController.h"

#include <QObject>

#include <memory>
#include <utility>

// Lives on the session's worker thread. Requests arrive as queued invocations and
// run one at a time; events leave through eventReady().
class ControllerWorker final : public QObject, public LifecycleEventSink
{
  Q_OBJECT

public:
  ControllerWorker(std::unique_ptr<ProcessRunner> runner, const BridgeConfig& config, QObject* parent = nullptr);
  ~ControllerWorker() override;

  ControllerWorker(const ControllerWorker&) = delete;
  ControllerWorker& operator=(const ControllerWorker&) = delete;

  LifecycleController& controller() { return m_controller; }

  void post(const LifecycleEvent& event) override;

signals:
  void eventReady(LifecycleEvent event);

private:
  LifecycleController m_controller;
};
