#pragma once

#include <QString>

#include <optional>

struct NetworkSuggestion final {
  static constexpr int kSuggestedLastOctet = 102;

  QString localAddress;
  QString suggestedHost;
  QString pairingPort = QStringLiteral("39083");
  QString connectPort = QStringLiteral("5555");
};

// Replaces the last octet of a dotted IPv4 address with the common phone
// address. Returns an empty string for anything that is not IPv4.
QString suggestedHostFor(const QString& localIPv4);

// Best effort: prefers the address the default route would use, then the first
// up, non-loopback IPv4 interface. Never sends a packet.
std::optional<QString> detectLocalIPv4();

std::optional<NetworkSuggestion> suggestNetworkTarget(const QString& connectPort = QStringLiteral("5555"));
