// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <video/VideoDecoder.hpp>

#include <opencv2/videoio.hpp>

#include <format>
#include <string>

namespace framecast
{

namespace
{

    /// @brief VideoDecoder backed by cv::VideoCapture.
    class OpenCvDecoder: public VideoDecoder
    {
      public:
        OpenCvDecoder() = default;
        ~OpenCvDecoder() override { release(); }

        OpenCvDecoder(const OpenCvDecoder&) = delete;
        OpenCvDecoder& operator=(const OpenCvDecoder&) = delete;

        [[nodiscard]] auto open(std::string_view path) -> VoidResult
        {
            try
            {
                if (!_capture.open(std::string(path)))
                    return makeError(ErrorCode::SourceUnavailable,
                                     std::format("Could not open video file {}", path));
            }
            catch (const cv::Exception& e)
            {
                return makeError(ErrorCode::SourceUnavailable,
                                 std::format("Could not open video file {}: {}", path, e.what()));
            }

            log::debug("Opened {} with the {} backend", path, _capture.getBackendName());
            return {};
        }

        [[nodiscard]] auto frameRate() const -> double override
        {
            return _capture.get(cv::CAP_PROP_FPS);
        }

        [[nodiscard]] auto read(cv::Mat& frame) -> bool override
        {
            if (!_capture.isOpened())
                return false;

            try
            {
                return _capture.read(frame) && !frame.empty();
            }
            catch (const cv::Exception& e)
            {
                log::warning("Video read failed: {}", e.what());
                return false;
            }
        }

        void release() override
        {
            if (!_capture.isOpened())
                return;
            _capture.release();
            log::debug("Video capture released");
        }

      private:
        cv::VideoCapture _capture;
    };

} // namespace

auto openVideoFile(std::string_view path) -> Result<std::unique_ptr<VideoDecoder>>
{
    auto decoder = std::make_unique<OpenCvDecoder>();
    if (auto result = decoder->open(path); !result)
        return std::unexpected(result.error());

    return decoder;
}

} // namespace framecast
