#include <ngd/Image/ImageDescriptor.hpp>
#include <QDBusArgument>
#include <QDBusMetaType>

namespace ngd {

bool ImageDescriptor::operator==(const ImageDescriptor& other) const
{
    return width == other.width
        && height == other.height
        && rowStride == other.rowStride
        && hasAlpha == other.hasAlpha
        && bitsPerSample == other.bitsPerSample
        && channels == other.channels
        && data == other.data;
}

QDBusArgument& operator<<(QDBusArgument& arg, const ImageDescriptor& image)
{
    arg.beginStructure();
    arg << image.width
        << image.height
        << image.rowStride
        << image.hasAlpha
        << image.bitsPerSample
        << image.channels
        << image.data;
    arg.endStructure();
    return arg;
}

const QDBusArgument& operator>>(const QDBusArgument& arg, ImageDescriptor& image)
{
    arg.beginStructure();
    arg >> image.width
        >> image.height
        >> image.rowStride
        >> image.hasAlpha
        >> image.bitsPerSample
        >> image.channels
        >> image.data;
    arg.endStructure();
    return arg;
}

void registerImageDescriptorMetaType()
{
    qDBusRegisterMetaType<ImageDescriptor>();
}

} // namespace ngd
