#include "scenecast/narration/mixer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scenecast::narration {

std::filesystem::path narrated_output_path(const std::filesystem::path &video) {
  auto output = video;
  if (video.extension() == ".mp4") {
    output.replace_extension(".narrated.mp4");
  } else {
    output += ".narrated.mp4";
  }
  return output;
}

std::string build_mix_filter(const std::vector<AudioEvent> &events) {
  std::ostringstream graph;
  std::string labels;
  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto &event = events[i];
    const std::int64_t delay = std::max<std::int64_t>(0, event.start_ms);
    const std::string label = "[a" + std::to_string(i) + "]";
    graph << "[" << i + 1 << ":a]adelay=" << delay << "|" << delay;
    if (event.volume != 1.0) {
      graph << ",volume=" << std::fixed << std::setprecision(2) << event.volume;
    }
    graph << ",apad" << label << ";";
    labels += label;
  }
  graph << labels << "amix=inputs=" << events.size() << ":normalize=0[mixed]";
  return graph.str();
}

std::vector<std::string> build_mix_args(const std::string &ffmpeg_path,
                                        const std::filesystem::path &video,
                                        const std::vector<AudioEvent> &events,
                                        const std::filesystem::path &output) {
  std::vector<std::string> args{ffmpeg_path, "-y", "-i", video.string()};
  for (const auto &event : events) {
    args.push_back("-i");
    args.push_back(event.audio_path.string());
  }
  args.insert(args.end(),
              {"-filter_complex", build_mix_filter(events), "-map", "0:v", "-map", "[mixed]",
               "-c:v", "copy", "-c:a", "aac", "-b:a", "192k", "-shortest", output.string()});
  return args;
}

std::filesystem::path mix_audio_into_video(common::IProcessRunner &runner,
                                           const std::string &ffmpeg_path,
                                           const std::filesystem::path &video,
                                           const std::vector<AudioEvent> &events) {
  if (events.empty()) {
    return video;
  }
  const auto output = narrated_output_path(video);
  std::cerr << "[narration] mixing " << events.size() << " audio clip(s) into " << video << "\n";

  auto out = runner.run(build_mix_args(ffmpeg_path, video, events, output));
  if (!out.ok()) {
    std::cerr << "[narration] audio mixing failed: " << out.error() << "\n";
    return video;
  }
  if (out.value().exit_code != 0) {
    std::cerr << "[narration] audio mixing failed with code " << out.value().exit_code << "\n";
    std::error_code ec;
    std::filesystem::remove(output, ec);
    return video;
  }

  std::error_code ec;
  std::filesystem::rename(output, video, ec);
  if (ec) {
    std::cerr << "[narration] could not replace " << video << ": " << ec.message() << "\n";
    return video;
  }
  std::cerr << "[narration] replaced original video with narrated version\n";
  return video;
}

} // namespace scenecast::narration
