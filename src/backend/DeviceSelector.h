#pragma once

#include <QString>
#include <QStringList>

#include <optional>

inline const QString kWirelessPortSuffix = QStringLiteral(":5555");

bool identifierMatchesHost(const QString& identifier, const QString& host);

// First identifier beginning with `targetHost` wins; failing that, the first one on the standard
// wireless port. Enumeration order is the tie-break.
std::optional<QString> selectWirelessDevice(const QStringList& identifiers, const QString& targetHost);
