#include "ControllerWorker.h"

ControllerWorker::ControllerWorker(std::unique_ptr<ProcessRunner> runner, const BridgeConfig& config, QObject* parent)
    : QObject(parent)
    , m_controller(std::move(runner), this, config)
{
}

ControllerWorker::~ControllerWorker() = default;

void ControllerWorker::post(const LifecycleEvent& event)
{
  emit eventReady(event);
}
