#pragma once

#include <QByteArray>
#include <QMetaType>
#include <cstdint>

class QDBusArgument;

namespace ngd {

/// Raster icon that has passed ImageSanitizer. Only ImageSanitizer produces
/// populated descriptors; fields hold the validated copies of the caller's values.
///
/// Guarantees for a validated descriptor:
///   data.size() / height >= rowStride  (height full rows are present)
///   rowStride / channels >= width      (each row holds width pixels)
struct ImageDescriptor {
    int32_t width = 0;
    int32_t height = 0;
    int32_t rowStride = 0;
    bool hasAlpha = false;
    int32_t bitsPerSample = 0;
    int32_t channels = 0;
    QByteArray data;

    bool operator==(const ImageDescriptor& other) const;
    bool operator!=(const ImageDescriptor& other) const { return !(*this == other); }
};

/// D-Bus image hint layout, signature (iiibiiay). Field order is a format
/// contract with the notification server and must not change.
QDBusArgument& operator<<(QDBusArgument& arg, const ImageDescriptor& image);
const QDBusArgument& operator>>(const QDBusArgument& arg, ImageDescriptor& image);

/// Registers ImageDescriptor with the Qt D-Bus type system. Safe to call repeatedly.
void registerImageDescriptorMetaType();

} // namespace ngd

Q_DECLARE_METATYPE(ngd::ImageDescriptor)
