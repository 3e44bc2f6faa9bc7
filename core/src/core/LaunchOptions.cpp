#include "core/LaunchOptions.h"

namespace sounddeck {

namespace {

std::string StripQuotes(const std::string& token)
{
    if (token.size() >= 2) {
        const char first = token.front();
        const char last = token.back();
        if ((first == '"' && last == '"') ||
            (first == '\'' && last == '\'')) {
            return token.substr(1, token.size() - 2);
        }
    }
    return token;
}

bool ConsumeValue(const std::string& token, const std::string& prefix,
                  std::string& value)
{
    if (token.rfind(prefix, 0) != 0) {
        return false;
    }
    value = StripQuotes(token.substr(prefix.size()));
    return true;
}

}  // namespace

LaunchOptions ParseLaunchOptions(const std::vector<std::string>& tokens)
{
    LaunchOptions options;
    std::string lastPositional;
    bool assetsFromOption = false;

    for (const auto& raw : tokens) {
        const std::string token = StripQuotes(raw);
        if (token.empty()) {
            continue;
        }

        if (token.front() != '-') {
            lastPositional = token;
            continue;
        }

        std::string value;
        if (ConsumeValue(token, "--assets=", value)) {
            options.assetsDirectory = value;
            assetsFromOption = true;
        } else if (ConsumeValue(token, "--manifest=", value)) {
            options.manifestPath = value;
        } else if (token == "--no-audio") {
            options.audioEnabled = false;
        } else {
            options.ignored.push_back(token);
        }
    }

    if (!assetsFromOption && !lastPositional.empty()) {
        options.assetsDirectory = lastPositional;
    }

    return options;
}

}  // namespace sounddeck
