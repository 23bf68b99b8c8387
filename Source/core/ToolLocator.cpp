#include "ToolLocator.h"

namespace masterdesk
{
    namespace
    {
        static juce::File bundledToolBeside(const juce::File& directory)
        {
            return directory.getChildFile("matchering-cli").getChildFile("mg_cli.py");
        }
    }

    ToolLauncher makeToolLauncher(const juce::File& toolFile, const juce::String& interpreter)
    {
        ToolLauncher launcher;
        if (toolFile.hasFileExtension("py"))
            launcher.prefix.add(interpreter.trim().isNotEmpty() ? interpreter.trim() : juce::String("python3"));
        launcher.prefix.add(toolFile.getFullPathName());
        return launcher;
    }

    MasteringToolLocation locateMasteringTool(const AppSettings& settings,
                                              const juce::String& commandLineOverride)
    {
        juce::File toolFile;
        if (commandLineOverride.trim().isNotEmpty())
        {
            toolFile = resolveUserPath(commandLineOverride.trim().unquoted());
        }
        else if (settings.masteringToolPath.trim().isNotEmpty())
        {
            toolFile = resolveUserPath(settings.masteringToolPath.trim());
        }
        else
        {
            const auto executableDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile)
                                           .getParentDirectory();
            toolFile = bundledToolBeside(executableDir);
            if (!toolFile.existsAsFile())
                toolFile = bundledToolBeside(juce::File::getSpecialLocation(juce::File::userHomeDirectory));
        }

        MasteringToolLocation location;
        location.toolFile = toolFile;
        location.launcher = makeToolLauncher(toolFile, settings.masteringToolInterpreter);
        return location;
    }
}
