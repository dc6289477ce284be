#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include "core/file_descriptor.hpp"
#include "core/image_types.hpp"
#include "core/worker_channel.hpp"

/**
 * @brief Decoded pixels handed back from the decode context
 */
struct DecodedBitmap
{
    ImageDimensions dimensions;
    int channels = 0;
    int bytes_per_pixel = 0;
    Transferable pixels; // row-major, tightly packed
};

/**
 * @brief Outcome of a callback-style decode
 */
struct DecodeResult
{
    std::string call_id; // empty when the decode never reached the context
    CallStatus status = CallStatus::FAILED;
    DecodedBitmap bitmap;
    std::string error_message;

    bool success() const { return status == CallStatus::COMPLETED; }
};

/**
 * @brief Decodes image files into bitmaps on a dedicated worker context
 *
 * The file's bytes travel to the context by handle and the decoded pixels
 * travel back the same way. OpenCV does the decoding.
 */
class BitmapDecodeService
{
public:
    BitmapDecodeService();
    ~BitmapDecodeService();

    BitmapDecodeService(const BitmapDecodeService &) = delete;
    BitmapDecodeService &operator=(const BitmapDecodeService &) = delete;

    /**
     * @brief Decode a file and report through a callback
     * @param file Image file with content attached
     * @param on_done Invoked exactly once, on the decode thread or on the
     * thread that terminates the service
     * @throws ChannelTerminatedError if the service was terminated
     */
    void decode(const FileDescriptor &file, std::function<void(DecodeResult &&)> on_done);

    /**
     * @brief Decode a file and receive the bitmap through a future
     *
     * The future throws DecodeFailure when the bytes cannot be decoded and
     * AbandonedCallError when the service is terminated first.
     * @throws ChannelTerminatedError if the service was terminated
     */
    std::future<DecodedBitmap> decode(const FileDescriptor &file);

    /**
     * @brief Stop the decode context; outstanding decodes are cancelled
     */
    void terminate();

    bool isTerminated() const { return channel_->isTerminated(); }

    /**
     * @brief Whether OpenCV can be expected to decode this file's type
     */
    static bool isDecodable(const FileDescriptor &file);

    /**
     * @brief Entry point run inside the decode context
     */
    static void decodeEntryPoint(WorkerRequest &&request, WorkerScope &scope);

private:
    static DecodedBitmap bitmapFromReply(WorkerReply &&reply);

    std::unique_ptr<WorkerChannel> channel_;
};
