#pragma once
#include <JuceHeader.h>
#include "AppSettings.h"
#include "MasteringJob.h"

namespace masterdesk
{
    struct MasteringToolLocation
    {
        juce::File toolFile;
        ToolLauncher launcher;

        bool isAvailable() const { return toolFile.existsAsFile(); }
    };

    // Lookup order: command line override, settings, matchering-cli/mg_cli.py beside the
    // executable, then ~/matchering-cli/mg_cli.py. The returned file may not exist; callers
    // check isAvailable() so the error can name the path that was tried.
    MasteringToolLocation locateMasteringTool(const AppSettings& settings,
                                              const juce::String& commandLineOverride);

    // Python scripts go through the configured interpreter, anything else runs directly.
    ToolLauncher makeToolLauncher(const juce::File& toolFile, const juce::String& interpreter);
}
