#include "NetworkSuggestion.h"

#include <QAbstractSocket>
#include <QHostAddress>
#include <QNetworkAddressEntry>
#include <QNetworkInterface>
#include <QStringList>
#include <QUdpSocket>

namespace {

constexpr int kRouteLookupTimeoutMs = 300;

std::optional<QString> addressFromRouteLookup()
{
  // Connecting a UDP socket only selects a route; no datagram is written.
  QUdpSocket s;
  s.connectToHost(QHostAddress(QStringLiteral("8.8.8.8")), 80);
  if (!s.waitForConnected(kRouteLookupTimeoutMs)) {
    return std::nullopt;
  }
  const QHostAddress local = s.localAddress();
  s.close();
  if (local.protocol() != QAbstractSocket::IPv4Protocol || local.isLoopback() || local.isNull()) {
    return std::nullopt;
  }
  return local.toString();
}

std::optional<QString> addressFromInterfaces()
{
  for (const QNetworkInterface& iface : QNetworkInterface::allInterfaces()) {
    if (!(iface.flags() & QNetworkInterface::IsUp) || (iface.flags() & QNetworkInterface::IsLoopBack)) {
      continue;
    }
    for (const QNetworkAddressEntry& entry : iface.addressEntries()) {
      if (entry.ip().protocol() == QAbstractSocket::IPv4Protocol && !entry.ip().isLoopback()) {
        return entry.ip().toString();
      }
    }
  }
  return std::nullopt;
}

} // namespace

QString suggestedHostFor(const QString& localIPv4)
{
  const QHostAddress addr(localIPv4.trimmed());
  if (addr.isNull() || addr.protocol() != QAbstractSocket::IPv4Protocol) {
    return {};
  }
  QStringList parts = addr.toString().split(QLatin1Char('.'));
  if (parts.size() != 4) {
    return {};
  }
  parts[3] = QString::number(NetworkSuggestion::kSuggestedLastOctet);
  return parts.join(QLatin1Char('.'));
}

std::optional<QString> detectLocalIPv4()
{
  if (auto a = addressFromRouteLookup()) {
    return a;
  }
  return addressFromInterfaces();
}

std::optional<NetworkSuggestion> suggestNetworkTarget(const QString& connectPort)
{
  const std::optional<QString> local = detectLocalIPv4();
  if (!local) {
    return std::nullopt;
  }

  NetworkSuggestion s;
  s.localAddress = *local;
  s.suggestedHost = suggestedHostFor(*local);
  s.connectPort = connectPort;
  if (s.suggestedHost.isEmpty()) {
    return std::nullopt;
  }
  return s;
}
