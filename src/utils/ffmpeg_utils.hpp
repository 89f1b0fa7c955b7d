#ifndef FFMPEG_UTILS_HPP
#define FFMPEG_UTILS_HPP

#include <memory>
#include <string>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

namespace capture_bench {

// RAII deleter for a demuxer opened with avformat_open_input()
struct AVFormatContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (ctx) {
            avformat_close_input(&ctx);
        }
    }
};

using UniqueAVFormatContext = std::unique_ptr<AVFormatContext, AVFormatContextDeleter>;

// Convert FFmpeg error code to human-readable string
inline std::string ffmpegErrorString(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, buf, sizeof(buf));
    return std::string(buf);
}

} // namespace capture_bench

#endif // FFMPEG_UTILS_HPP
