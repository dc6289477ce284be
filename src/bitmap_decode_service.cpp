#include "core/bitmap_decode_service.hpp"
#include "core/intake_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace
{
    const std::vector<std::string> decodable_types_ = {
        "image/png",
        "image/jpeg",
        "image/bmp",
        "image/webp",
        "image/tiff",
        "image/gif",
        "image/x-portable-pixmap"};
}

BitmapDecodeService::BitmapDecodeService()
    : channel_(WorkerChannel::create(&BitmapDecodeService::decodeEntryPoint, "bitmap-decode"))
{
}

BitmapDecodeService::~BitmapDecodeService() = default;

void BitmapDecodeService::terminate()
{
    channel_->terminate();
}

bool BitmapDecodeService::isDecodable(const FileDescriptor &file)
{
    std::string type = file.type();
    std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return std::find(decodable_types_.begin(), decodable_types_.end(), type) != decodable_types_.end();
}

void BitmapDecodeService::decode(const FileDescriptor &file, std::function<void(DecodeResult &&)> on_done)
{
    if (!file.hasContent())
    {
        DecodeResult result;
        result.status = CallStatus::FAILED;
        result.error_message = "no content attached to " + file.name();
        on_done(std::move(result));
        return;
    }

    nlohmann::json message = {{"name", file.name()}, {"type", file.type()}};
    channel_->post(
        std::move(message),
        [name = file.name(), on_done = std::move(on_done)](CallResult &&call_result)
        {
            DecodeResult result;
            result.call_id = call_result.id;
            result.status = call_result.status;
            result.error_message = call_result.error_message;
            if (call_result.success())
            {
                try
                {
                    result.bitmap = bitmapFromReply(std::move(call_result.reply));
                }
                catch (const std::exception &e)
                {
                    result.status = CallStatus::FAILED;
                    result.error_message = e.what();
                }
            }
            if (result.status == CallStatus::FAILED)
            {
                Logger::warn("Decode of " + name + " failed: " + result.error_message);
            }
            on_done(std::move(result));
        },
        {file.content()});
}

std::future<DecodedBitmap> BitmapDecodeService::decode(const FileDescriptor &file)
{
    auto promise = std::make_shared<std::promise<DecodedBitmap>>();
    std::future<DecodedBitmap> future = promise->get_future();

    decode(file, [promise, name = file.name()](DecodeResult &&result)
           {
               switch (result.status)
               {
               case CallStatus::COMPLETED:
                   promise->set_value(std::move(result.bitmap));
                   break;
               case CallStatus::FAILED:
                   promise->set_exception(std::make_exception_ptr(DecodeFailure(name, result.error_message)));
                   break;
               case CallStatus::CANCELLED:
                   promise->set_exception(std::make_exception_ptr(AbandonedCallError(result.call_id)));
                   break;
               }
           });

    return future;
}

void BitmapDecodeService::decodeEntryPoint(WorkerRequest &&request, WorkerScope &scope)
{
    if (request.transfer.empty() || !request.transfer.front() || request.transfer.front().empty())
    {
        scope.postMessage(WorkerResponse::failure(request.id, "empty image buffer"));
        return;
    }

    const Transferable &bytes = request.transfer.front();
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        scope.postMessage(WorkerResponse::failure(request.id, "image buffer of " + std::to_string(bytes.size()) +
                                                                  " bytes exceeds the decoder limit"));
        return;
    }

    // Wraps the transferred bytes without copying them
    cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t *>(bytes.data()));
    cv::Mat image = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);
    if (image.empty())
    {
        scope.postMessage(WorkerResponse::failure(request.id, "unsupported or corrupt image data"));
        return;
    }

    if (!image.isContinuous())
    {
        image = image.clone();
    }

    nlohmann::json message = {
        {"width", image.cols},
        {"height", image.rows},
        {"channels", image.channels()},
        {"bytes_per_pixel", static_cast<int>(image.elemSize())}};

    Logger::debug("Decoded " + request.message.value("name", std::string("image")) + " to " +
                  std::to_string(image.cols) + "x" + std::to_string(image.rows));

    // The pixels stay in the decoder's buffer; the handle keeps the Mat alive
    auto holder = std::make_shared<const cv::Mat>(std::move(image));
    Transferable pixels(holder, holder->ptr<uint8_t>(0), holder->total() * holder->elemSize());
    scope.postMessage(WorkerResponse::reply(request.id, std::move(message), {std::move(pixels)}));
}

DecodedBitmap BitmapDecodeService::bitmapFromReply(WorkerReply &&reply)
{
    DecodedBitmap bitmap;
    bitmap.dimensions.width = reply.message.at("width").get<uint32_t>();
    bitmap.dimensions.height = reply.message.at("height").get<uint32_t>();
    bitmap.channels = reply.message.at("channels").get<int>();
    bitmap.bytes_per_pixel = reply.message.at("bytes_per_pixel").get<int>();
    if (!reply.transfer.empty())
    {
        bitmap.pixels = std::move(reply.transfer.front());
    }
    return bitmap;
}
