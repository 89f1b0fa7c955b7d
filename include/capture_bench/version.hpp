#ifndef CAPTURE_BENCH_VERSION_HPP
#define CAPTURE_BENCH_VERSION_HPP

namespace capture_bench {

#ifndef CAPTURE_BENCH_VERSION
#define CAPTURE_BENCH_VERSION "1.0.0"
#endif

constexpr const char* VERSION = CAPTURE_BENCH_VERSION;
constexpr const char* PROGRAM_NAME = "hdmi-capture-bench";

} // namespace capture_bench

#endif // CAPTURE_BENCH_VERSION_HPP
