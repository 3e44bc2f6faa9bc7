#pragma once

#include <string>
#include <vector>

namespace sounddeck {

// Settings taken from the command line.
//
//   --assets=<dir>     directory holding the track files
//   --manifest=<file>  text manifest (see TrackManifest.h)
//   --no-audio         do not open an audio device
//
// The last positional argument, when present, is treated as the asset
// directory unless --assets was given. Unknown options are collected in
// `ignored` so the caller can log them.
struct LaunchOptions {
    std::string assetsDirectory;
    std::string manifestPath;
    bool audioEnabled{true};
    std::vector<std::string> ignored;
};

// Parses already tokenised arguments. Tokens wrapped in matching single
// or double quotes have the quotes stripped.
[[nodiscard]] LaunchOptions ParseLaunchOptions(
    const std::vector<std::string>& tokens);

}  // namespace sounddeck
