#pragma once

#include <string>
#include <vector>

namespace sounddeck {

// One bundled audio file and the instrument label shown for it.
struct TrackEntry {
    std::string filename;
    std::string name;
};

using TrackManifest = std::vector<TrackEntry>;

// The four stems shipped with the application.
[[nodiscard]] TrackManifest DefaultTrackManifest();

// Line-based textual manifest.
//
// Format (version 1):
//   sounddeck_tracks_v1
//   track <filename>|<instrument name>
//
// Blank lines and lines starting with '#' are ignored. Filenames may
// contain spaces; the '|' separates the filename from the label.
[[nodiscard]] std::string SerializeTrackManifest(const TrackManifest& manifest);

// Parses the format above into `out`. On failure returns false, leaves
// `out` untouched and, when `error_message` is not null, writes a short
// description including the offending line number.
bool ParseTrackManifest(const std::string& text, TrackManifest& out,
                        std::string* error_message = nullptr);

}  // namespace sounddeck
