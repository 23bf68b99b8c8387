#include "AudioFileScanner.h"

namespace masterdesk
{
    const juce::StringArray& AudioFileScanner::getSupportedExtensions()
    {
        static const juce::StringArray extensions { ".wav", ".flac", ".aiff", ".mp3" };
        return extensions;
    }

    juce::String AudioFileScanner::getFileChooserPattern()
    {
        juce::StringArray patterns;
        for (const auto& extension : getSupportedExtensions())
            patterns.add("*" + extension);
        return patterns.joinIntoString(";");
    }

    bool AudioFileScanner::isSupportedAudioFile(const juce::File& file)
    {
        const auto name = file.getFileName();
        for (const auto& extension : getSupportedExtensions())
        {
            if (name.endsWithIgnoreCase(extension))
                return true;
        }
        return false;
    }

    juce::Array<juce::File> AudioFileScanner::scanDirectory(const juce::File& directory)
    {
        juce::Array<juce::File> found;
        if (!directory.isDirectory())
            return found;

        for (const auto& entry : juce::RangedDirectoryIterator(directory, false, "*", juce::File::findFiles))
        {
            const auto file = entry.getFile();
            if (isSupportedAudioFile(file))
                found.add(file);
        }

        return found;
    }
}
