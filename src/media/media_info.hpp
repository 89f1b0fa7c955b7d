#ifndef MEDIA_INFO_HPP
#define MEDIA_INFO_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace capture_bench {

// Video stream of a captured media file
struct MediaInfo {
    std::string file_path;
    std::string container_name;   // e.g. "mov,mp4,m4a,3gp,3g2,mj2"
    std::string codec_name;       // e.g. "h264", "mjpeg"
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration_seconds = 0.0;
    int64_t total_frames = 0;

    // Format resolution as string (e.g., "1080p", "4K")
    std::string getResolutionString() const;

    // "h264 1080p, 10.0s"
    std::string describe() const;
};

class MediaProbe {
public:
    // Open a media file and describe its first video stream, or nullopt
    // if it cannot be opened or holds no video
    static std::optional<MediaInfo> probe(const std::string& file_path,
                                          std::string& error_message);

private:
    MediaProbe() = delete;
};

} // namespace capture_bench

#endif // MEDIA_INFO_HPP
