#pragma once

#include <QImage>
#include <QString>

// Margin around the symbol, in modules, so phone scanners can find it.
constexpr int kQrQuietZoneModules = 4;

// Encodes `payload` as a QR symbol (error correction level M) and draws it black on
// white, `moduleSize` pixels per module, including the quiet zone. Returns a null image
// and fills `errorOut` when the payload cannot be encoded.
QImage renderQrImage(const QString& payload, int moduleSize, QString* errorOut = nullptr);
