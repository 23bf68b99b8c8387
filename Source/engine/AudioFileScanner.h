#pragma once
#include <JuceHeader.h>

namespace masterdesk
{
    // Finds the audio files a batch run can feed to the mastering tool.
    class AudioFileScanner final
    {
    public:
        // ".wav", ".flac", ".aiff", ".mp3"
        static const juce::StringArray& getSupportedExtensions();

        // Wildcard list for file choosers, e.g. "*.wav;*.flac;*.aiff;*.mp3".
        static juce::String getFileChooserPattern();

        // Case-insensitive match on the file name's ending.
        static bool isSupportedAudioFile(const juce::File& file);

        // Non-recursive. Keeps the order the filesystem reports entries in.
        static juce::Array<juce::File> scanDirectory(const juce::File& directory);

    private:
        AudioFileScanner() = delete;
    };
}
