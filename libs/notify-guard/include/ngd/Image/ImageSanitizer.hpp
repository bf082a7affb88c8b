#pragma once

#include <ngd/Image/ImageDescriptor.hpp>
#include <ngd/Request/Rejection.hpp>
#include <QByteArray>
#include <cstdint>

namespace ngd {

using ImageValidation = Validated<ImageDescriptor>;

/// Validates untrusted raster geometry and pixel data before it may be
/// handed to the notification server.
///
/// Checks run in a fixed order and stop at the first failure. Structural
/// checks come first so that height >= 1 and channels >= 3 hold before any
/// division is performed.
class ImageSanitizer {
public:
    static constexpr int64_t MAX_SIZE = int64_t(1) << 21; // 2 MiB
    static constexpr int32_t MAX_WIDTH = 255;
    static constexpr int32_t MAX_HEIGHT = 255;
    static constexpr int32_t MIN_ROW_STRIDE = 3;
    static constexpr int32_t BITS_PER_SAMPLE = 8;

    /// Pixel data is taken by value; pass it with std::move to hand over the
    /// buffer without copying. On success the descriptor owns it.
    static ImageValidation validate(int32_t untrustedWidth,
                                    int32_t untrustedHeight,
                                    int32_t untrustedRowStride,
                                    bool untrustedHasAlpha,
                                    int32_t untrustedBitsPerSample,
                                    int32_t untrustedChannels,
                                    QByteArray untrustedData);
};

} // namespace ngd
