#include "test_framework.hpp"
#include "fakes.hpp"

#include "scenecast/capture/probe.hpp"
#include "scenecast/capture/screen.hpp"
#include "scenecast/capture/screencast.hpp"
#include "scenecast/common/fs.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

namespace {

bool contains(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

// Value following `flag` in argv, or "".
std::string arg_after(const std::vector<std::string> &args, const std::string &flag) {
  const auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) {
    return "";
  }
  return *(it + 1);
}

const char *kInspectOutput = R"(Input #0, matroska,webm, from 'pane-0.raw.webm':
  Metadata:
    ENCODER         : Lavf60.3.100
  Duration: 00:01:02.50, start: 0.000000, bitrate: 1180 kb/s
  Stream #0:0: Video: vp8, yuv420p(tv, progressive), 2560x1440, SAR 1:1 DAR 16:9, 30 fps
At least one output file must be specified
)";

const char *kDecodeOutput = R"(Output #0, null, to 'pipe:':
frame=  120 fps=0.0 q=-0.0 size=N/A time=00:00:04.00 bitrate=N/A speed=8.01x
frame=  305 fps=0.0 q=-0.0 Lsize=N/A time=00:00:10.16 bitrate=N/A speed=8.3x
)";

} // namespace

void register_capture_tests(std::vector<scenecast::tests::TestCase> &tests) {
  using scenecast::tests::require;
  namespace c = scenecast::capture;
  namespace t = scenecast::tests;

  tests.push_back({"capture_parse_ffmpeg_diagnostics", [] {
                     const auto duration = c::parse_container_duration(kInspectOutput);
                     require(duration.has_value() && std::fabs(*duration - 62.5) < 1e-9,
                             "container duration");
                     const auto size = c::parse_video_size(kInspectOutput);
                     require(size.has_value() && size->width == 2560 && size->height == 1440,
                             "video size");
                     const auto frames = c::parse_last_frame_count(kDecodeOutput);
                     require(frames.value_or(0) == 305, "last frame count wins");
                     const auto progress = c::parse_last_progress_time(kDecodeOutput);
                     require(progress.has_value() && std::fabs(*progress - 10.16) < 1e-9,
                             "last progress time wins");

                     require(!c::parse_container_duration("Duration: N/A").has_value(),
                             "unknown duration");
                     require(!c::parse_last_frame_count("").has_value(), "no frames");
                     require(!c::parse_video_size("Stream #0:1: Audio: opus").has_value(),
                             "audio only");
                   }});

  tests.push_back({"capture_display_size_parsing", [] {
                     const auto size = c::try_parse_display_size(" 2560x720 ");
                     require(size.has_value() && size->width == 2560 && size->height == 720,
                             "valid size");
                     require(c::try_parse_display_size("1920X1080").has_value(),
                             "uppercase separator");
                     require(!c::try_parse_display_size("0x720").has_value(), "zero width");
                     require(!c::try_parse_display_size("wide").has_value(), "garbage");
                     require(!c::try_parse_display_size("").has_value(), "empty");
                   }});

  tests.push_back({"capture_linux_screen_args", [] {
                     c::ScreenCaptureOptions options;
                     options.platform = c::Platform::Linux;
                     options.display = ":99";
                     options.output = "/tmp/out/run.screen.mp4";
                     auto args = c::build_screen_capture_args(options);
                     require(args.ok(), args.error());
                     const auto &argv = args.value();
                     require(argv.front() == "ffmpeg", "binary first");
                     require(arg_after(argv, "-f") == "x11grab", "x11grab input");
                     require(arg_after(argv, "-i") == ":99.0", "display screen input");
                     require(arg_after(argv, "-video_size") == "1920x1080", "default size");
                     require(arg_after(argv, "-vf") == "format=yuv420p", "pixel format filter");
                     require(arg_after(argv, "-c:v") == "libx264", "x264 encoder");
                     require(arg_after(argv, "-preset") == "ultrafast", "fast preset");
                     require(arg_after(argv, "-r") == "30", "output rate");
                     require(arg_after(argv, "-vsync") == "cfr", "constant frame rate");
                     require(arg_after(argv, "-level") == "4.2", "level 4.2 fits 1080p30");
                     require(argv.back() == "/tmp/out/run.screen.mp4", "output last");

                     options.display_size = "2560x1440";
                     options.fps = 60;
                     auto big = c::build_screen_capture_args(options);
                     require(big.ok(), big.error());
                     require(!contains(big.value(), "-level"), "1440p60 exceeds level 4.2");
                   }});

  tests.push_back({"capture_linux_requires_display", [] {
                     c::ScreenCaptureOptions options;
                     options.platform = c::Platform::Linux;
                     options.output = "/tmp/x.mp4";
                     auto args = c::build_screen_capture_args(options);
                     require(!args.ok(), "missing DISPLAY should fail");
                     require(args.error() ==
                                 "screen recording on Linux requires DISPLAY (e.g. run via xvfb-run)",
                             args.error());
                   }});

  tests.push_back({"capture_macos_screen_args", [] {
                     c::ScreenCaptureOptions options;
                     options.platform = c::Platform::MacOS;
                     options.output = "/tmp/x.mp4";
                     require(!c::build_screen_capture_args(options).ok(),
                             "macOS needs a screen index");

                     options.screen_index = 2;
                     options.crop = c::CropRect{10, 0, 640, 480};
                     auto args = c::build_screen_capture_args(options);
                     require(args.ok(), args.error());
                     require(arg_after(args.value(), "-f") == "avfoundation", "avfoundation input");
                     require(arg_after(args.value(), "-i") == "2:none", "screen index input");
                     require(arg_after(args.value(), "-vf") == "crop=640:480:10:0,fps=30,format=yuv420p",
                             "crop then fps filter: " + arg_after(args.value(), "-vf"));
                   }});

  tests.push_back({"capture_windows_screen_args", [] {
                     c::ScreenCaptureOptions options;
                     options.platform = c::Platform::Windows;
                     options.output = "C:/out.mp4";
                     auto args = c::build_screen_capture_args(options);
                     require(args.ok(), args.error());
                     require(arg_after(args.value(), "-f") == "gdigrab", "gdigrab input");
                     require(arg_after(args.value(), "-i") == "desktop", "desktop input");
                   }});

  tests.push_back({"capture_zero_frame_message", [] {
                     const auto linux_message =
                         c::zero_frame_message(c::Platform::Linux, "x11grab: cannot open display");
                     require(linux_message.rfind("ffmpeg screen capture produced no frames (output "
                                                 "has no video stream). ",
                                                 0) == 0,
                             "message prefix");
                     require(linux_message.find("Xvfb") != std::string::npos, "linux remedy");
                     require(linux_message.find("\nLast ffmpeg logs:\nx11grab: cannot open display") !=
                                 std::string::npos,
                             "logs appended");

                     const auto mac_message = c::zero_frame_message(c::Platform::MacOS, "");
                     require(mac_message.find("Screen Recording") != std::string::npos,
                             "macOS remedy");
                     require(mac_message.find("Last ffmpeg logs") == std::string::npos,
                             "no empty log section");
                   }});

  tests.push_back({"capture_ffmpeg_probe_runs_ffmpeg", [] {
                     t::RecordingProcessRunner runner;
                     runner.handler = [](const std::vector<std::string> &argv) {
                       const bool decode = std::find(argv.begin(), argv.end(), "null") != argv.end();
                       return scenecast::common::Result<scenecast::common::ProcessOutput>::success(
                           scenecast::common::ProcessOutput{1, decode ? kDecodeOutput : kInspectOutput});
                     };
                     c::FfmpegProbe probe(runner, "/opt/ffmpeg");
                     require(probe.frame_count("/tmp/a.webm").value_or(0) == 305, "frame count");
                     require(std::fabs(probe.duration_seconds("/tmp/a.webm").value_or(0) - 62.5) < 1e-9,
                             "duration from header");
                     require(probe.video_size("/tmp/a.webm").has_value(), "video size");
                     require(runner.calls.front().front() == "/opt/ffmpeg", "configured binary");
                     require(runner.calls.front()[2] == "-i", "input flag");
                   }});

  tests.push_back({"capture_probe_falls_back_to_progress_time", [] {
                     t::RecordingProcessRunner runner;
                     runner.handler = [](const std::vector<std::string> &argv) {
                       const bool decode = std::find(argv.begin(), argv.end(), "null") != argv.end();
                       return scenecast::common::Result<scenecast::common::ProcessOutput>::success(
                           scenecast::common::ProcessOutput{0, decode ? kDecodeOutput : "Duration: N/A"});
                     };
                     c::FfmpegProbe probe(runner, "ffmpeg");
                     const auto duration = probe.duration_seconds("/tmp/raw.webm");
                     require(duration.has_value() && std::fabs(*duration - 10.16) < 1e-9,
                             "progress time fallback");
                     require(runner.calls.size() == 2, "header probe then decode");
                   }});

  tests.push_back({"capture_screencast_encoder_args", [] {
                     const auto argv = c::build_screencast_encoder_args("ffmpeg", "/tmp/p.raw.webm");
                     require(arg_after(argv, "-f") == "image2pipe", "frames from stdin");
                     require(arg_after(argv, "-i") == "-", "stdin input");
                     require(contains(argv, "libvpx"), "vp8 encoder");
                     require(arg_after(argv, "-use_wallclock_as_timestamps") == "1",
                             "frames stamped on arrival");
                     require(argv.back() == "/tmp/p.raw.webm", "output last");

                     // Constant frame rate output options sit between the input and the output.
                     const auto input = std::find(argv.begin(), argv.end(), "-");
                     const auto rate = std::find(argv.begin(), argv.end(), "-r");
                     const auto mode = std::find(argv.begin(), argv.end(), "-fps_mode");
                     require(rate != argv.end() && *(rate + 1) == "25", "25 fps output");
                     require(mode != argv.end() && *(mode + 1) == "cfr", "cfr output");
                     require(input < rate && input < mode, "rate applies to the output");
                     require(mode + 2 == argv.end() - 1, "rate set right before the output path");

                     const auto legacy = c::with_vsync_fallback(argv);
                     require(arg_after(legacy, "-vsync") == "cfr", "vsync fallback keeps cfr");
                     require(!contains(legacy, "-fps_mode"), "fps_mode dropped for old ffmpeg");
                   }});

  tests.push_back({"capture_vsync_fallback", [] {
                     require(c::fps_mode_unsupported(
                                 "Unrecognized option 'fps_mode'.\nError splitting the argument list"),
                             "old ffmpeg detected");
                     require(c::fps_mode_unsupported("fps_mode: Option not found"),
                             "option not found detected");
                     require(!c::fps_mode_unsupported("Unrecognized option 'foo'"),
                             "other options ignored");

                     const std::vector<std::string> args{"ffmpeg", "-i", "in", "-r", "60",
                                                         "-fps_mode", "cfr", "out.mp4"};
                     const auto fallback = c::with_vsync_fallback(args);
                     const std::vector<std::string> expected{"ffmpeg", "-i", "in", "-r", "60",
                                                             "-vsync", "cfr", "out.mp4"};
                     require(fallback == expected, "fps_mode replaced by vsync");
                   }});

  tests.push_back({"capture_screencast_retries_with_vsync", [] {
                     const auto dir = t::make_temp_dir("capture-vsync");
                     const auto script = dir / "old-ffmpeg";
                     const auto seen = dir / "argv.txt";
                     require(scenecast::common::write_file(
                                 script, "#!/bin/sh\n"
                                         "for a in \"$@\"; do\n"
                                         "  if [ \"$a\" = \"-fps_mode\" ]; then\n"
                                         "    echo \"Unrecognized option 'fps_mode'.\"\n"
                                         "    exit 1\n"
                                         "  fi\n"
                                         "done\n"
                                         "echo \"$@\" > \"" + seen.string() + "\"\n"
                                         "cat > /dev/null\n")
                                 .ok(),
                             "write encoder script");
                     std::filesystem::permissions(script, std::filesystem::perms::owner_all,
                                                  std::filesystem::perm_options::add);

                     t::FakePage page;
                     c::ScreencastRecorder recorder(page, dir / "pane.raw.webm", script.string());
                     auto started = recorder.start();
                     require(started.ok(), started.error());
                     auto stopped = recorder.stop();
                     require(stopped.ok(), stopped.error());

                     auto argv = scenecast::common::read_file(seen);
                     require(argv.ok(), "retried encoder ran");
                     require(argv.value().find("-r 25 -vsync cfr") != std::string::npos,
                             argv.value());
                     require(argv.value().find("-fps_mode") == std::string::npos, argv.value());
                   }});

  tests.push_back({"capture_screencast_recorder_lifecycle", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     c::ScreencastRecorder recorder(page, "/tmp/scenecast-rec.webm", "true");
                     auto started = recorder.start();
                     require(started.ok(), started.error());
                     require(recorder.running(), "recorder running");
                     require(!recorder.start().ok(), "second start rejected");
                     auto stopped = recorder.stop();
                     require(stopped.ok(), stopped.error());
                     require(!recorder.running(), "recorder stopped");
                     const auto &calls = log->calls;
                     require(std::find(calls.begin(), calls.end(), "start_screencast") != calls.end(),
                             "screencast started");
                     require(std::find(calls.begin(), calls.end(), "stop_screencast") != calls.end(),
                             "screencast stopped");
                   }});

  tests.push_back({"capture_screencast_encoder_failure", [] {
                     t::FakePage page;
                     c::ScreencastRecorder recorder(page, "/tmp/scenecast-rec-fail.webm", "false");
                     require(recorder.start().ok(), "start should spawn");
                     auto stopped = recorder.stop();
                     require(!stopped.ok(), "non-zero encoder exit should fail");
                     require(stopped.error().rfind("screencast encoder exited with code 1", 0) == 0,
                             stopped.error());
                   }});
}
