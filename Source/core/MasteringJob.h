#pragma once
#include <JuceHeader.h>
#include <optional>

namespace masterdesk
{
    enum class BitDepth : int
    {
        Bits16 = 16,
        Bits24 = 24,
        Bits32 = 32
    };

    // Accepts exactly "16", "24" or "32"; anything else (including whitespace) is rejected.
    std::optional<BitDepth> parseBitDepth(const juce::String& text);
    juce::String bitDepthToString(BitDepth depth);

    // How the external mastering CLI is started. The prefix holds everything that
    // comes before the tool's own arguments, e.g. { "python3", "/path/mg_cli.py" }.
    struct ToolLauncher
    {
        juce::StringArray prefix;

        // <prefix...> -b <bits> <target> <reference> <output>
        juce::StringArray buildCommand(BitDepth bitDepth,
                                       const juce::File& target,
                                       const juce::File& reference,
                                       const juce::File& output) const;
    };

    struct SingleMasteringJob
    {
        juce::File reference;
        juce::File target;
        juce::File output;
        BitDepth bitDepth = BitDepth::Bits24;
    };

    // Exactly one input source is used: inputFiles when non-empty, otherwise inputDirectory.
    struct BatchMasteringJob
    {
        juce::File reference;
        juce::Array<juce::File> inputFiles;
        juce::File inputDirectory;
        juce::File outputDirectory;
        BitDepth bitDepth = BitDepth::Bits24;
    };

    struct ValidationError
    {
        juce::String title;
        juce::String message;
    };

    // Raw widget contents, exactly as the user left them.
    struct SingleFormFields
    {
        juce::String referencePath;
        juce::String targetPath;
        juce::String outputPath;
        juce::String bitDepthText;
    };

    struct BatchFormFields
    {
        juce::String referencePath;
        juce::String inputText;
        juce::StringArray selectedFiles;
        juce::String outputDirectoryPath;
        juce::String bitDepthText;
    };

    bool validateSingleForm(const SingleFormFields& fields,
                            SingleMasteringJob& outJob,
                            ValidationError& outError);

    bool validateBatchForm(const BatchFormFields& fields,
                           BatchMasteringJob& outJob,
                           ValidationError& outError);

    // Creates the directory (and parents) when missing.
    bool ensureOutputDirectory(const juce::File& directory, juce::String& outError);

    juce::File resolveUserPath(const juce::String& path);

    // track1.wav -> <outputDirectory>/track1 (Mastered).flac
    juce::File deriveMasteredOutputFile(const juce::File& input, const juce::File& outputDirectory);
    juce::File suggestSingleOutputFile(const juce::File& target);
    juce::File suggestBatchOutputDirectory(const juce::File& inputParent);
    juce::String withFlacExtension(const juce::String& path);

    static constexpr const char* masteredSuffix = " (Mastered)";
    static constexpr const char* masteredExtension = ".flac";
    static constexpr const char* batchOutputFolderName = "Mastered";
}
