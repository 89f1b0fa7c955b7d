#include "media/media_info.hpp"
#include "utils/ffmpeg_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace capture_bench {

std::string MediaInfo::getResolutionString() const {
    if (height >= 2160) {
        return "4K";
    } else if (height >= 1440) {
        return "1440p";
    } else if (height >= 1080) {
        return "1080p";
    } else if (height >= 720) {
        return "720p";
    } else if (height >= 480) {
        return "480p";
    } else {
        return std::to_string(height) + "p";
    }
}

std::string MediaInfo::describe() const {
    std::ostringstream oss;
    oss << codec_name << " " << getResolutionString() << ", "
        << std::fixed << std::setprecision(1) << duration_seconds << "s";
    return oss.str();
}

std::optional<MediaInfo> MediaProbe::probe(const std::string& file_path,
                                           std::string& error_message) {
    AVFormatContext* raw_ctx = nullptr;

    int ret = avformat_open_input(&raw_ctx, file_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        error_message = "Failed to open file: " + ffmpegErrorString(ret);
        return std::nullopt;
    }
    UniqueAVFormatContext format_ctx(raw_ctx);

    ret = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (ret < 0) {
        error_message = "Failed to find stream info: " + ffmpegErrorString(ret);
        return std::nullopt;
    }

    ret = av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (ret < 0) {
        error_message = "No video stream found in file";
        return std::nullopt;
    }

    AVStream* video_stream = format_ctx->streams[ret];
    AVCodecParameters* codec_params = video_stream->codecpar;

    double fps = 0.0;
    if (video_stream->avg_frame_rate.den != 0) {
        fps = av_q2d(video_stream->avg_frame_rate);
    } else if (video_stream->r_frame_rate.den != 0) {
        fps = av_q2d(video_stream->r_frame_rate);
    }

    double duration = 0.0;
    if (format_ctx->duration != AV_NOPTS_VALUE) {
        duration = static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
    } else if (video_stream->duration != AV_NOPTS_VALUE) {
        duration = static_cast<double>(video_stream->duration) *
                   av_q2d(video_stream->time_base);
    }

    int64_t total_frames = video_stream->nb_frames;
    if (total_frames <= 0 && duration > 0 && fps > 0) {
        total_frames = static_cast<int64_t>(std::round(duration * fps));
    }

    MediaInfo info;
    info.file_path = file_path;
    info.container_name = format_ctx->iformat ? format_ctx->iformat->name : "";
    info.codec_name = avcodec_get_name(codec_params->codec_id);
    info.width = codec_params->width;
    info.height = codec_params->height;
    info.fps = fps;
    info.duration_seconds = duration;
    info.total_frames = total_frames;

    return info;
}

} // namespace capture_bench
