#include <gtest/gtest.h>

#include "TestSupport.h"
#include "backend/LogStore.h"
#include "backend/PairingSession.h"
#include "fakes/FakeProcessRunner.h"

#include <QElapsedTimer>

#include <memory>

using namespace pairmirror::test;
using Kind = LifecycleEvent::Kind;

namespace {

class PairingSessionTest : public ::testing::Test
{
protected:
  std::unique_ptr<PairingSession> makeSession(BridgeConfig cfg = {})
  {
    auto s = std::make_unique<PairingSession>(std::make_unique<FakeProcessRunner>(script), cfg);
    s->addSink(&sink);
    return s;
  }

  bool waitForOutcomes(size_t n, int timeoutMs = 5000)
  {
    return waitUntil([&]() { return sink.outcomes().size() >= n; }, timeoutMs);
  }

  std::shared_ptr<FakeAdbScript> script = std::make_shared<FakeAdbScript>();
  RecordingSink sink;
};

} // namespace

TEST_F(PairingSessionTest, RequestsReturnBeforeTheCommandRuns)
{
  script->delay(QStringLiteral("version"), 300);
  auto session = makeSession();

  QElapsedTimer t;
  t.start();
  session->checkBridge();
  EXPECT_LT(t.elapsed(), 150);
  EXPECT_TRUE(sink.events.empty());

  ASSERT_TRUE(waitForOutcomes(1));
  EXPECT_EQ(sink.outcomes().front().kind, Kind::BridgeReady);
  EXPECT_TRUE(session->state().bridgeAvailable);
}

TEST_F(PairingSessionTest, QueuedRequestsRunOneAtATimeInOrder)
{
  script->delay(QStringLiteral("pair"), 40);
  script->delay(QStringLiteral("connect"), 40);
  script->respondAlways(QStringLiteral("pair"), exited(0, QStringLiteral("Successfully paired to 192.168.1.102:39083")));
  script->respondAlways(QStringLiteral("connect"), exited(0, QStringLiteral("connected to 192.168.1.102:5555")));
  auto session = makeSession();

  session->checkBridge();
  session->pair(QStringLiteral("192.168.1.102"), QStringLiteral("39083"), QStringLiteral("123456"));
  session->connectDevice(QStringLiteral("192.168.1.102"), QStringLiteral("5555"));
  session->pair(QStringLiteral("192.168.1.102"), QStringLiteral("39084"), QStringLiteral("654321"));

  ASSERT_TRUE(waitForOutcomes(4));
  std::vector<Kind> kinds;
  for (const auto& e : sink.outcomes()) {
    kinds.push_back(e.kind);
  }
  EXPECT_EQ(kinds, (std::vector<Kind>{Kind::BridgeReady, Kind::Paired, Kind::Connected, Kind::Paired}));
  EXPECT_EQ(script->peakInFlight(), 1);
}

TEST_F(PairingSessionTest, EventsArriveInEmissionOrder)
{
  script->respondAlways(QStringLiteral("pair"), exited(0, QStringLiteral("Successfully paired")));
  auto session = makeSession();
  session->checkBridge();
  session->pair(QStringLiteral("10.0.0.4"), QStringLiteral("40000"), QString());
  session->regenerate();
  ASSERT_TRUE(waitForOutcomes(3));

  for (size_t i = 1; i < sink.events.size(); ++i) {
    EXPECT_EQ(sink.events.at(i).sequence, sink.events.at(i - 1).sequence + 1);
  }
}

TEST_F(PairingSessionTest, ConnectIssuedFromPairedSignalUsesWellKnownPort)
{
  script->respondAlways(QStringLiteral("pair"), exited(0, QStringLiteral("Successfully paired to 192.168.1.102:39083")));
  script->respondAlways(QStringLiteral("connect"), exited(0, QStringLiteral("connected to 192.168.1.102:5555")));
  auto session = makeSession();
  PairingSession* s = session.get();
  QObject::connect(s, &PairingSession::paired, s, [s](const QString& host, const QString& port) { s->connectDevice(host, port); });

  session->checkBridge();
  session->pair(QStringLiteral("192.168.1.102"), QStringLiteral("39083"), QStringLiteral("123456"));
  ASSERT_TRUE(waitUntil([&]() { return sink.count(Kind::Connected) == 1; }));

  const QStringList lines = script->commandLines();
  ASSERT_EQ(lines.size(), 4);
  EXPECT_EQ(lines.at(2), QStringLiteral("adb pair 192.168.1.102:39083 123456"));
  EXPECT_EQ(lines.at(3), QStringLiteral("adb connect 192.168.1.102:5555"));
  ASSERT_TRUE(session->state().connectedAddress.has_value());
  EXPECT_EQ(session->state().connectedAddress->target(), QStringLiteral("192.168.1.102:5555"));
}

TEST_F(PairingSessionTest, TypedSignalsFollowEventDelivered)
{
  auto session = makeSession();
  QStringList order;
  QObject::connect(session.get(), &PairingSession::eventDelivered, session.get(), [&](const LifecycleEvent& e) {
    if (e.kind == Kind::BridgeReady) {
      order << QStringLiteral("event");
    }
  });
  QObject::connect(session.get(), &PairingSession::bridgeReady, session.get(), [&](const QString& version) {
    order << QStringLiteral("signal:") + version;
  });

  session->checkBridge();
  ASSERT_TRUE(waitForOutcomes(1));
  EXPECT_EQ(order, (QStringList{QStringLiteral("event"), QStringLiteral("signal:Android Debug Bridge version 1.0.41")}));
}

TEST_F(PairingSessionTest, RemovedSinkStopsReceiving)
{
  auto session = makeSession();
  RecordingSink second;
  session->addSink(&second);
  session->checkBridge();
  ASSERT_TRUE(waitForOutcomes(1));
  EXPECT_EQ(second.count(Kind::BridgeReady), 1);

  session->removeSink(&second);
  session->regenerate();
  ASSERT_TRUE(waitForOutcomes(2));
  EXPECT_EQ(second.count(Kind::CredentialChanged), 0);
}

TEST_F(PairingSessionTest, RegenerateUpdatesCachedCredential)
{
  auto session = makeSession();
  const PairingCredential initial = session->credential();
  EXPECT_TRUE(initial.isValid());

  PairingCredential announced;
  QObject::connect(session.get(), &PairingSession::credentialChanged, session.get(), [&](const PairingCredential& c) {
    announced = c;
  });
  session->regenerate();
  ASSERT_TRUE(waitForOutcomes(1));

  EXPECT_TRUE(announced.isValid());
  EXPECT_EQ(session->credential(), announced);
  EXPECT_NE(session->credential(), initial);
}

TEST_F(PairingSessionTest, ControllerOutputReachesLogStore)
{
  LogStore logs;
  auto session = makeSession();
  session->attachLogStore(&logs);

  session->checkBridge();
  ASSERT_TRUE(waitForOutcomes(1));

  bool found = false;
  for (const QString& line : logs.lines()) {
    found = found || line.contains(QStringLiteral("[I] bridge: adb ready: Android Debug Bridge version 1.0.41"));
  }
  EXPECT_TRUE(found);
  session->shutdown();
}

TEST_F(PairingSessionTest, ShutdownOfIdleWorkerIsPrompt)
{
  auto session = makeSession();
  session->checkBridge();
  ASSERT_TRUE(waitForOutcomes(1));

  EXPECT_TRUE(session->shutdown());
  EXPECT_FALSE(session->isRunning());

  // Requests after shutdown are dropped.
  session->regenerate();
  QCoreApplication::processEvents();
  EXPECT_EQ(sink.count(Kind::CredentialChanged), 0);
  EXPECT_TRUE(session->shutdown());
}

TEST_F(PairingSessionTest, ShutdownAbandonsWorkerStuckInCommand)
{
  BridgeConfig cfg;
  cfg.shutdownGraceMs = 50;
  script->delay(QStringLiteral("version"), 600);
  auto session = makeSession(cfg);
  session->checkBridge();
  ASSERT_TRUE(waitUntil([&]() { return script->callCount(QStringLiteral("version")) == 1; }));

  QElapsedTimer t;
  t.start();
  EXPECT_FALSE(session->shutdown());
  EXPECT_LT(t.elapsed(), 400);

  // The abandoned command still finishes on its own; its events go nowhere.
  ASSERT_TRUE(waitUntil([&]() { return script->callCount(QStringLiteral("start-server")) == 1; }, 3000));
  QThread::msleep(50);
  QCoreApplication::processEvents();
  EXPECT_EQ(sink.count(Kind::BridgeReady), 0);
}
