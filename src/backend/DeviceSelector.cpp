#include "DeviceSelector.h"

bool identifierMatchesHost(const QString& identifier, const QString& host)
{
  // Prefix match only. An empty host would claim every identifier.
  return !host.isEmpty() && identifier.startsWith(host);
}

std::optional<QString> selectWirelessDevice(const QStringList& identifiers, const QString& targetHost)
{
  const QString host = targetHost.trimmed();
  for (const auto& id : identifiers) {
    if (identifierMatchesHost(id, host)) {
      return id;
    }
  }
  for (const auto& id : identifiers) {
    if (id.contains(kWirelessPortSuffix)) {
      return id;
    }
  }
  return std::nullopt;
}
