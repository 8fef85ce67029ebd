#pragma once

#include <QMetaType>
#include <QString>

struct PairingCredential final {
  static constexpr int kNameLength = 5;
  static constexpr int kPasswordLength = 6;

  QString name;
  QString password;

  static PairingCredential generate();

  // WIFI:T:ADB;S:<name>;P:<password>;; as scanned by Android's wireless debugging.
  QString qrPayload() const;
  QString manualPairHint() const;

  bool isValid() const;

  bool operator==(const PairingCredential& other) const { return name == other.name && password == other.password; }
  bool operator!=(const PairingCredential& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(PairingCredential)
