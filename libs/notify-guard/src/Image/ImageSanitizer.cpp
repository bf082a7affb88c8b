#include <ngd/Image/ImageSanitizer.hpp>
#include <boost/log/trivial.hpp>
#include <utility>

namespace ngd {

namespace {

ImageValidation reject(RejectionReason reason)
{
    BOOST_LOG_TRIVIAL(debug) << "ImageSanitizer: rejected (" << rejectionName(reason) << ")";
    return ImageValidation::reject(reason);
}

} // namespace

ImageValidation ImageSanitizer::validate(int32_t untrustedWidth,
                                         int32_t untrustedHeight,
                                         int32_t untrustedRowStride,
                                         bool untrustedHasAlpha,
                                         int32_t untrustedBitsPerSample,
                                         int32_t untrustedChannels,
                                         QByteArray untrustedData)
{
    const bool hasAlpha = untrustedHasAlpha;

    if (untrustedWidth < 1 || untrustedHeight < 1 || untrustedRowStride < MIN_ROW_STRIDE)
        return reject(RejectionReason::GeometryTooSmall);

    const int64_t size = untrustedData.size();
    if (size > MAX_SIZE)
        return reject(RejectionReason::PayloadTooLarge);

    if (untrustedBitsPerSample != BITS_PER_SAMPLE)
        return reject(RejectionReason::UnsupportedSampleDepth);

    const int32_t channels = 3 + (hasAlpha ? 1 : 0);
    if (untrustedChannels != channels)
        return reject(RejectionReason::ChannelCountMismatch);

    if (untrustedWidth > MAX_WIDTH || untrustedHeight > MAX_HEIGHT)
        return reject(RejectionReason::DimensionTooLarge);

    if (size / untrustedHeight < untrustedRowStride)
        return reject(RejectionReason::BufferTooSmallForHeight);

    if (untrustedRowStride / channels < untrustedWidth)
        return reject(RejectionReason::RowStrideTooSmallForWidth);

    ImageDescriptor image;
    image.width = untrustedWidth;
    image.height = untrustedHeight;
    image.rowStride = untrustedRowStride;
    image.hasAlpha = hasAlpha;
    image.bitsPerSample = untrustedBitsPerSample;
    image.channels = channels;
    image.data = std::move(untrustedData);
    return ImageValidation::accept(std::move(image));
}

} // namespace ngd
