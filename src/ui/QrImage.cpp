#include "QrImage.h"

#include <qrencode.h>

#include <QByteArray>

#include <cerrno>
#include <cstring>
#include <memory>

namespace {

void setError(QString* errorOut, const QString& message)
{
  if (errorOut) {
    *errorOut = message;
  }
}

} // namespace

QImage renderQrImage(const QString& payload, int moduleSize, QString* errorOut)
{
  if (payload.isEmpty()) {
    setError(errorOut, QStringLiteral("nothing to encode"));
    return {};
  }
  if (moduleSize <= 0) {
    setError(errorOut, QStringLiteral("module size must be positive"));
    return {};
  }

  const QByteArray utf8 = payload.toUtf8();
  std::unique_ptr<QRcode, decltype(&QRcode_free)> code(
      QRcode_encodeString(utf8.constData(), 0, QR_ECLEVEL_M, QR_MODE_8, 1), &QRcode_free);
  if (!code) {
    setError(errorOut, QStringLiteral("QR encoding failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno))));
    return {};
  }

  const int width = code->width;
  const int side = width + 2 * kQrQuietZoneModules;
  QImage modules(side, side, QImage::Format_RGB32);
  modules.fill(Qt::white);
  for (int y = 0; y < width; ++y) {
    for (int x = 0; x < width; ++x) {
      // Bit 0 of each module byte is set for dark modules.
      if (code->data[y * width + x] & 0x01) {
        modules.setPixel(x + kQrQuietZoneModules, y + kQrQuietZoneModules, qRgb(0, 0, 0));
      }
    }
  }

  return modules.scaled(side * moduleSize, side * moduleSize, Qt::IgnoreAspectRatio, Qt::FastTransformation);
}
