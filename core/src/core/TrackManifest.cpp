#include "core/TrackManifest.h"

#include <sstream>

namespace sounddeck {

namespace {

constexpr const char* kManifestHeader = "sounddeck_tracks_v1";
constexpr const char* kTrackKeyword = "track ";

std::string Trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool Fail(std::string* error_message, const int line_number,
          const std::string& what)
{
    if (error_message != nullptr) {
        *error_message =
            "line " + std::to_string(line_number) + ": " + what;
    }
    return false;
}

}  // namespace

TrackManifest DefaultTrackManifest()
{
    return {
        {"syn_34.wav", "Synthesizer"},
        {"Audio 10_07.wav", "Lead Synth"},
        {"Audio 11_06.wav", "Pad"},
        {"bs_10.wav", "Bass"},
    };
}

std::string SerializeTrackManifest(const TrackManifest& manifest)
{
    std::ostringstream out;
    out << kManifestHeader << '\n';
    for (const auto& entry : manifest) {
        out << kTrackKeyword << entry.filename << '|' << entry.name << '\n';
    }
    return out.str();
}

bool ParseTrackManifest(const std::string& text, TrackManifest& out,
                        std::string* const error_message)
{
    std::istringstream in(text);
    std::string raw;
    int line_number = 0;
    bool seen_header = false;
    TrackManifest parsed;

    while (std::getline(in, raw)) {
        ++line_number;
        const std::string line = Trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (!seen_header) {
            if (line != kManifestHeader) {
                return Fail(error_message, line_number,
                            "expected '" + std::string(kManifestHeader) +
                                "' header");
            }
            seen_header = true;
            continue;
        }

        if (line.rfind(kTrackKeyword, 0) != 0) {
            return Fail(error_message, line_number,
                        "unknown directive '" + line + "'");
        }

        const std::string body =
            line.substr(std::string(kTrackKeyword).size());
        const auto separator = body.find('|');
        if (separator == std::string::npos) {
            return Fail(error_message, line_number,
                        "missing '|' between filename and name");
        }

        TrackEntry entry;
        entry.filename = Trim(body.substr(0, separator));
        entry.name = Trim(body.substr(separator + 1));
        if (entry.filename.empty()) {
            return Fail(error_message, line_number, "empty filename");
        }
        if (entry.name.empty()) {
            entry.name = entry.filename;
        }
        parsed.push_back(std::move(entry));
    }

    if (!seen_header) {
        return Fail(error_message, line_number, "empty manifest");
    }

    out = std::move(parsed);
    if (error_message != nullptr) {
        error_message->clear();
    }
    return true;
}

}  // namespace sounddeck
