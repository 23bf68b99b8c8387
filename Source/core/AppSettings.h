#pragma once
#include <JuceHeader.h>

namespace masterdesk
{
    // Preferences kept in a plain key=value file under the user's application data folder.
    struct AppSettings
    {
        juce::String masteringToolPath;
        juce::String masteringToolInterpreter { "python3" };
        juce::String defaultBitDepth { "24" };
        bool logToFile = true;

        static juce::File getAppDataDirectory();
        static juce::File getDefaultSettingsFile();

        // Resets to defaults, then applies every recognised line of the file.
        // A missing file leaves the defaults in place.
        void loadFrom(const juce::File& settingsFile);
        bool saveTo(const juce::File& settingsFile) const;
    };
} // namespace masterdesk
