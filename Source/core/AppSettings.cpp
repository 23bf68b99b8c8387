#include "AppSettings.h"
#include "AppMetadata.h"
#include "MasteringJob.h"

namespace masterdesk
{
    juce::File AppSettings::getAppDataDirectory()
    {
        return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
            .getChildFile(meta::companyName);
    }

    juce::File AppSettings::getDefaultSettingsFile()
    {
        return getAppDataDirectory().getChildFile(meta::settingsFileName);
    }

    void AppSettings::loadFrom(const juce::File& settingsFile)
    {
        *this = AppSettings();
        if (settingsFile == juce::File() || !settingsFile.existsAsFile())
            return;

        juce::StringArray lines;
        lines.addLines(settingsFile.loadFileAsString());
        for (auto line : lines)
        {
            line = line.trim();
            if (line.isEmpty() || line.startsWithChar('#'))
                continue;

            const auto value = line.fromFirstOccurrenceOf("=", false, false).trim();

            if (line.startsWithIgnoreCase("mastering_tool_path="))
            {
                masteringToolPath = value.unquoted();
                continue;
            }

            if (line.startsWithIgnoreCase("mastering_tool_interpreter="))
            {
                if (value.isNotEmpty())
                    masteringToolInterpreter = value.unquoted();
                continue;
            }

            if (line.startsWithIgnoreCase("default_bit_depth="))
            {
                if (parseBitDepth(value).has_value())
                    defaultBitDepth = value;
                continue;
            }

            if (line.startsWithIgnoreCase("log_to_file="))
                logToFile = value.getIntValue() != 0;
        }
    }

    bool AppSettings::saveTo(const juce::File& settingsFile) const
    {
        if (settingsFile == juce::File())
            return false;

        const auto parentResult = settingsFile.getParentDirectory().createDirectory();
        if (parentResult.failed())
        {
            juce::Logger::writeToLog("Settings folder unavailable: " + parentResult.getErrorMessage());
            return false;
        }

        juce::StringArray lines;
        lines.add("# " + juce::String(meta::productName) + " preferences");
        lines.add("mastering_tool_path=" + masteringToolPath);
        lines.add("mastering_tool_interpreter=" + masteringToolInterpreter);
        lines.add("default_bit_depth=" + defaultBitDepth);
        lines.add("log_to_file=" + juce::String(logToFile ? 1 : 0));
        return settingsFile.replaceWithText(lines.joinIntoString("\n") + "\n");
    }
} // namespace masterdesk
