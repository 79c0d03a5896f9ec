// SPDX-License-Identifier: Apache-2.0
#include "SpritePacketizer.hpp"

#include <sprite/Quantizer.hpp>

#include <opencv2/imgproc.hpp>

#include <format>

namespace framecast
{

SpritePacketizer::SpritePacketizer(SpriteGeometry geometry, const Palette& palette):
    _geometry(geometry), _palette(palette)
{
}

auto SpritePacketizer::quantizeFrame(const RawFrame& frame) const -> Result<QuantizedSprite>
{
    if (frame.empty())
        return makeError(ErrorCode::EncodingError,
                         std::format("Frame {} has no pixels ({}x{})", frame.ordinal, frame.width, frame.height));
    if (!frame.consistent())
        return makeError(ErrorCode::EncodingError,
                         std::format("Frame {} carries {} bytes for {}x{} pixels",
                                     frame.ordinal,
                                     frame.pixels.size(),
                                     frame.width,
                                     frame.height));
    if (_geometry.width <= 0 || _geometry.height <= 0)
        return makeError(ErrorCode::EncodingError,
                         std::format("Invalid sprite size {}x{}", _geometry.width, _geometry.height));

    // The Mat header borrows the frame buffer; nothing below writes through it.
    auto const gray = cv::Mat(frame.height,
                              frame.width,
                              CV_8UC1,
                              const_cast<std::uint8_t*>(frame.pixels.data()),
                              static_cast<std::size_t>(frame.width));

    auto resized = cv::Mat {};
    auto rgb = cv::Mat {};
    try
    {
        cv::resize(gray, resized, cv::Size(_geometry.width, _geometry.height), 0.0, 0.0, cv::INTER_NEAREST);
        // The wire palette is made of RGB triples, so quantization happens in RGB space.
        cv::cvtColor(resized, rgb, cv::COLOR_GRAY2RGB);
    }
    catch (const cv::Exception& e)
    {
        return makeError(ErrorCode::EncodingError, std::format("Resizing frame {} failed: {}", frame.ordinal, e.what()));
    }

    if (rgb.cols != _geometry.width || rgb.rows != _geometry.height || !rgb.isContinuous())
        return makeError(ErrorCode::EncodingError,
                         std::format("Resize produced {}x{}, expected {}x{}",
                                     rgb.cols,
                                     rgb.rows,
                                     _geometry.width,
                                     _geometry.height));

    auto sprite = quantize(rgb, _palette);
    if (!sprite)
        return sprite;

    if (sprite->width != _geometry.width || sprite->height != _geometry.height
        || sprite->pixelData.size()
               != QuantizedSprite::packedSize(_geometry.width, _geometry.height, sprite->bitsPerPixel))
        return makeError(ErrorCode::EncodingError,
                         std::format("Quantized frame {} does not match {}x{}",
                                     frame.ordinal,
                                     _geometry.width,
                                     _geometry.height));

    return sprite;
}

auto SpritePacketizer::encode(const RawFrame& frame) const -> Result<SpriteBlockMessage>
{
    auto sprite = quantizeFrame(frame);
    if (!sprite)
        return std::unexpected(sprite.error());

    return makeSpriteBlock(*sprite, _geometry.lineHeight);
}

} // namespace framecast
