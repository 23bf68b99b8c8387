#include "MasteringJob.h"

namespace masterdesk
{
    std::optional<BitDepth> parseBitDepth(const juce::String& text)
    {
        if (text == "16")
            return BitDepth::Bits16;
        if (text == "24")
            return BitDepth::Bits24;
        if (text == "32")
            return BitDepth::Bits32;
        return std::nullopt;
    }

    juce::String bitDepthToString(BitDepth depth)
    {
        return juce::String(static_cast<int>(depth));
    }

    juce::StringArray ToolLauncher::buildCommand(BitDepth bitDepth,
                                                 const juce::File& target,
                                                 const juce::File& reference,
                                                 const juce::File& output) const
    {
        juce::StringArray command(prefix);
        command.add("-b");
        command.add(bitDepthToString(bitDepth));
        command.add(target.getFullPathName());
        command.add(reference.getFullPathName());
        command.add(output.getFullPathName());
        return command;
    }

    juce::File resolveUserPath(const juce::String& path)
    {
        if (path.isEmpty())
            return {};

        // getChildFile() returns absolute paths untouched and anchors relative ones.
        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }

    bool validateSingleForm(const SingleFormFields& fields,
                            SingleMasteringJob& outJob,
                            ValidationError& outError)
    {
        if (fields.referencePath.isEmpty()
            || fields.targetPath.isEmpty()
            || fields.outputPath.isEmpty()
            || fields.bitDepthText.isEmpty())
        {
            outError = { "Missing Info", "Please fill in all fields." };
            return false;
        }

        const auto bitDepth = parseBitDepth(fields.bitDepthText);
        if (!bitDepth.has_value())
        {
            outError = { "Invalid Bit-depth", "Please enter 16, 24, or 32 for bit-depth." };
            return false;
        }

        outJob.reference = resolveUserPath(fields.referencePath);
        outJob.target = resolveUserPath(fields.targetPath);
        outJob.output = resolveUserPath(fields.outputPath);
        outJob.bitDepth = *bitDepth;
        return true;
    }

    bool validateBatchForm(const BatchFormFields& fields,
                           BatchMasteringJob& outJob,
                           ValidationError& outError)
    {
        juce::Array<juce::File> inputFiles;
        juce::File inputDirectory;

        if (!fields.selectedFiles.isEmpty())
        {
            for (const auto& path : fields.selectedFiles)
                inputFiles.add(resolveUserPath(path));
        }
        else if (fields.inputText.isNotEmpty() && resolveUserPath(fields.inputText).isDirectory())
        {
            inputDirectory = resolveUserPath(fields.inputText);
        }
        else
        {
            outError = { "Missing Info", "Please select an input directory OR input files." };
            return false;
        }

        if (fields.referencePath.isEmpty()
            || fields.outputDirectoryPath.isEmpty()
            || fields.bitDepthText.isEmpty())
        {
            outError = { "Missing Info", "Please fill in all fields (Reference, Output Dir, Bit-depth)." };
            return false;
        }

        const auto bitDepth = parseBitDepth(fields.bitDepthText);
        if (!bitDepth.has_value())
        {
            outError = { "Invalid Bit-depth", "Please enter 16, 24, or 32 for bit-depth." };
            return false;
        }

        outJob.reference = resolveUserPath(fields.referencePath);
        outJob.inputFiles = std::move(inputFiles);
        outJob.inputDirectory = inputDirectory;
        outJob.outputDirectory = resolveUserPath(fields.outputDirectoryPath);
        outJob.bitDepth = *bitDepth;
        return true;
    }

    bool ensureOutputDirectory(const juce::File& directory, juce::String& outError)
    {
        outError.clear();
        if (directory == juce::File())
        {
            outError = "Could not create output directory:\nNo directory given.";
            return false;
        }

        if (directory.isDirectory())
            return true;

        if (directory.exists())
        {
            outError = "Could not create output directory:\n"
                     + directory.getFullPathName() + " exists and is not a folder.";
            return false;
        }

        const auto result = directory.createDirectory();
        if (result.failed())
        {
            outError = "Could not create output directory:\n" + result.getErrorMessage();
            return false;
        }

        juce::Logger::writeToLog("Created output directory: " + directory.getFullPathName());
        return true;
    }

    juce::File deriveMasteredOutputFile(const juce::File& input, const juce::File& outputDirectory)
    {
        return outputDirectory.getChildFile(input.getFileNameWithoutExtension()
                                            + masteredSuffix
                                            + masteredExtension);
    }

    juce::File suggestSingleOutputFile(const juce::File& target)
    {
        return deriveMasteredOutputFile(target, target.getParentDirectory());
    }

    juce::File suggestBatchOutputDirectory(const juce::File& inputParent)
    {
        return inputParent.getChildFile(batchOutputFolderName);
    }

    juce::String withFlacExtension(const juce::String& path)
    {
        if (path.endsWithIgnoreCase(masteredExtension))
            return path;
        return path + masteredExtension;
    }
}
