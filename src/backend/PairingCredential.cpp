#include "PairingCredential.h"

#include <QRandomGenerator>

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr quint32 kAlphabetSize = sizeof(kAlphabet) - 1;

QString randomText(QRandomGenerator& rng, int length)
{
  QString out;
  out.reserve(length);
  for (int i = 0; i < length; ++i) {
    out.append(QLatin1Char(kAlphabet[rng.bounded(kAlphabetSize)]));
  }
  return out;
}

bool isAlphanumericAscii(const QString& s)
{
  if (s.isEmpty()) {
    return false;
  }
  for (const QChar ch : s) {
    const char16_t c = ch.unicode();
    const bool ok = (c >= u'A' && c <= u'Z') || (c >= u'a' && c <= u'z') || (c >= u'0' && c <= u'9');
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace

PairingCredential PairingCredential::generate()
{
  QRandomGenerator rng = QRandomGenerator::securelySeeded();

  PairingCredential c;
  c.name = randomText(rng, kNameLength);
  c.password = randomText(rng, kPasswordLength);
  return c;
}

QString PairingCredential::qrPayload() const
{
  return QStringLiteral("WIFI:T:ADB;S:%1;P:%2;;").arg(name, password);
}

QString PairingCredential::manualPairHint() const
{
  return QStringLiteral("adb pair IP:PORT %1").arg(password);
}

bool PairingCredential::isValid() const
{
  return isAlphanumericAscii(name) && isAlphanumericAscii(password);
}
