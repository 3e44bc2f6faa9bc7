#include <memory>
#include <string>
#include <vector>

#include <juce_gui_extra/juce_gui_extra.h>

#include "AudioEngine.h"
#include "MainComponent.h"
#include "SoundDeckLookAndFeel.h"
#include "core/LaunchOptions.h"
#include "core/TrackManifest.h"

namespace {

// Bundled stems live under resources/tracks (or tracks/) either next to
// the executable or one level up when running from a build directory.
[[nodiscard]] juce::File findDefaultAssetsDirectory()
{
    const auto appFile = juce::File::getSpecialLocation(
        juce::File::currentApplicationFile);
    const auto binDir = appFile.getParentDirectory();

    const juce::File roots[] = {binDir, binDir.getParentDirectory()};
    for (const auto& root : roots) {
        for (const auto* relative : {"resources/tracks", "tracks"}) {
            const auto candidate = root.getChildFile(relative);
            if (candidate.isDirectory()) {
                return candidate;
            }
        }
    }

    return binDir.getChildFile("resources/tracks");
}

// Falls back to the built-in manifest when no file was given or the
// file cannot be read or parsed.
[[nodiscard]] sounddeck::TrackManifest loadManifest(const std::string& path)
{
    if (path.empty()) {
        return sounddeck::DefaultTrackManifest();
    }

    const auto file = juce::File::getCurrentWorkingDirectory().getChildFile(
        juce::String(path));
    if (!file.existsAsFile()) {
        juce::Logger::writeToLog("[sounddeck] Manifest not found: " +
                                 file.getFullPathName() +
                                 "; using the built-in track list.");
        return sounddeck::DefaultTrackManifest();
    }

    sounddeck::TrackManifest manifest;
    std::string error;
    if (!sounddeck::ParseTrackManifest(file.loadFileAsString().toStdString(),
                                       manifest, &error)) {
        juce::Logger::writeToLog("[sounddeck] Invalid manifest " +
                                 file.getFileName() + ": " +
                                 juce::String(error) +
                                 "; using the built-in track list.");
        return sounddeck::DefaultTrackManifest();
    }

    juce::Logger::writeToLog("[sounddeck] Manifest " + file.getFileName() +
                             " lists " +
                             juce::String(static_cast<int>(manifest.size())) +
                             " tracks.");
    return manifest;
}

}  // namespace

class MainWindow : public juce::DocumentWindow {
public:
    MainWindow(juce::String name, AudioEngine& audioEngine,
               sounddeck::TrackManifest manifest, std::string assetsDirectory)
        : juce::DocumentWindow(name,
                               SoundDeckLookAndFeel::kBackgroundColour,
                               juce::DocumentWindow::allButtons)
    {
        setUsingNativeTitleBar(true);
        setResizable(true, true);
        setContentOwned(new MainComponent(audioEngine, std::move(manifest),
                                          std::move(assetsDirectory)),
                        true);
        centreWithSize(getWidth(), getHeight());
        setVisible(true);
    }

    void closeButtonPressed() override
    {
        juce::JUCEApplicationBase::quit();
    }

    bool keyPressed(const juce::KeyPress& key) override
    {
        // Escape closes the application.
        if (key.getKeyCode() == juce::KeyPress::escapeKey) {
            juce::JUCEApplicationBase::quit();
            return true;
        }

        return juce::DocumentWindow::keyPressed(key);
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainWindow)
};

class SoundDeckApplication : public juce::JUCEApplication {
public:
    SoundDeckApplication() = default;

    const juce::String getApplicationName() override { return "SoundDeck"; }
    const juce::String getApplicationVersion() override { return "0.1.0"; }

    void initialise(const juce::String& commandLineParameters) override
    {
        juce::LookAndFeel::setDefaultLookAndFeel(&lookAndFeel_);

        juce::StringArray tokens;
        tokens.addTokens(commandLineParameters, true);
        tokens.trim();
        tokens.removeEmptyStrings();

        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(tokens.size()));
        for (const auto& token : tokens) {
            args.push_back(token.toStdString());
        }

        const auto options = sounddeck::ParseLaunchOptions(args);
        for (const auto& ignored : options.ignored) {
            juce::Logger::writeToLog("[sounddeck] Ignoring unknown option " +
                                     juce::String(ignored));
        }

        std::string assetsDirectory;
        if (!options.assetsDirectory.empty()) {
            // Relative paths are taken from the working directory.
            assetsDirectory =
                juce::File::getCurrentWorkingDirectory()
                    .getChildFile(juce::String(options.assetsDirectory))
                    .getFullPathName()
                    .toStdString();
        } else {
            assetsDirectory =
                findDefaultAssetsDirectory().getFullPathName().toStdString();
        }
        juce::Logger::writeToLog("[sounddeck] Track directory: " +
                                 juce::String(assetsDirectory));

        auto manifest = loadManifest(options.manifestPath);

        audioEngine_ = std::make_unique<AudioEngine>(options.audioEnabled);

        mainWindow_ = std::make_unique<MainWindow>(
            getApplicationName(), *audioEngine_, std::move(manifest),
            std::move(assetsDirectory));
    }

    void shutdown() override
    {
        // The window (and its conductors) go before the engine whose
        // graphs they reference.
        mainWindow_.reset();
        if (audioEngine_ != nullptr) {
            audioEngine_->shutdown();
        }
        audioEngine_.reset();
        juce::LookAndFeel::setDefaultLookAndFeel(nullptr);
    }

private:
    SoundDeckLookAndFeel lookAndFeel_;
    std::unique_ptr<AudioEngine> audioEngine_;
    std::unique_ptr<MainWindow> mainWindow_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SoundDeckApplication)
};

START_JUCE_APPLICATION(SoundDeckApplication)
