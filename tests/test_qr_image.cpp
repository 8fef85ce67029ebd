#include <gtest/gtest.h>

#include "TestSupport.h"
#include "backend/PairingCredential.h"
#include "ui/QrImage.h"

namespace {

bool isDark(const QImage& img, int x, int y)
{
  return qGray(img.pixel(x, y)) < 128;
}

} // namespace

TEST(QrImage, CredentialPayloadRendersScannableSymbol)
{
  const PairingCredential cred = PairingCredential::generate();
  constexpr int kModule = 4;

  QString error;
  const QImage img = renderQrImage(cred.qrPayload(), kModule, &error);
  ASSERT_FALSE(img.isNull()) << error.toStdString();
  EXPECT_TRUE(error.isEmpty());
  EXPECT_EQ(img.width(), img.height());
  ASSERT_EQ(img.width() % kModule, 0);

  // QR symbols are 21 + 4k modules wide.
  const int symbol = img.width() / kModule - 2 * kQrQuietZoneModules;
  EXPECT_GE(symbol, 21);
  EXPECT_EQ((symbol - 21) % 4, 0);

  const int origin = kQrQuietZoneModules * kModule;
  EXPECT_FALSE(isDark(img, 0, 0));
  EXPECT_FALSE(isDark(img, origin - 1, origin - 1));
  // Top-left finder pattern: dark ring, light ring, dark centre.
  EXPECT_TRUE(isDark(img, origin, origin));
  EXPECT_FALSE(isDark(img, origin + kModule, origin + kModule));
  EXPECT_TRUE(isDark(img, origin + 3 * kModule, origin + 3 * kModule));
}

TEST(QrImage, RegeneratedCredentialChangesImage)
{
  const QImage a = renderQrImage(PairingCredential::generate().qrPayload(), 2);
  const QImage b = renderQrImage(PairingCredential::generate().qrPayload(), 2);
  ASSERT_FALSE(a.isNull());
  ASSERT_FALSE(b.isNull());
  EXPECT_NE(a, b);
}

TEST(QrImage, RejectsUnencodableInput)
{
  QString error;
  EXPECT_TRUE(renderQrImage(QString(), 4, &error).isNull());
  EXPECT_FALSE(error.isEmpty());

  error.clear();
  EXPECT_TRUE(renderQrImage(QStringLiteral("WIFI:T:ADB;S:x;P:y;;"), 0, &error).isNull());
  EXPECT_FALSE(error.isEmpty());
}
