#include <JuceHeader.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include "MasteringJob.h"
#include "AppSettings.h"
#include "ToolLocator.h"
#include "AudioFileScanner.h"

using namespace masterdesk;

namespace
{
    void expect(bool condition, const std::string& message)
    {
        if (!condition)
            throw std::runtime_error(message);
    }

    juce::File makeScratchDirectory(const juce::String& name)
    {
        const auto dir = juce::File::getSpecialLocation(juce::File::tempDirectory)
            .getNonexistentChildFile("masterdesk_" + name, {}, false);
        expect(dir.createDirectory().wasOk(), "Expected scratch directory to be created");
        return dir;
    }

    void writeFixture(const juce::File& file)
    {
        expect(file.replaceWithText("fixture"), "Expected fixture file write to succeed");
    }

    SingleFormFields makeValidSingleFields()
    {
        SingleFormFields fields;
        fields.referencePath = "/music/reference.wav";
        fields.targetPath = "/music/song.wav";
        fields.outputPath = "/music/song (Mastered).flac";
        fields.bitDepthText = "24";
        return fields;
    }

    void runBitDepthParsing()
    {
        expect(parseBitDepth("16") == BitDepth::Bits16, "16 should parse");
        expect(parseBitDepth("24") == BitDepth::Bits24, "24 should parse");
        expect(parseBitDepth("32") == BitDepth::Bits32, "32 should parse");
        expect(!parseBitDepth("20").has_value(), "20 should be rejected");
        expect(!parseBitDepth(" 24").has_value(), "Padded input should be rejected");
        expect(!parseBitDepth("").has_value(), "Empty input should be rejected");
        expect(bitDepthToString(BitDepth::Bits32) == "32", "Bit depth should print as its number");
    }

    void runSingleValidation()
    {
        SingleMasteringJob job;
        ValidationError error;

        expect(validateSingleForm(makeValidSingleFields(), job, error), "Complete form should validate");
        expect(job.bitDepth == BitDepth::Bits24, "Validated job should carry the bit depth");
        expect(job.target.getFullPathName() == "/music/song.wav", "Validated job should carry the target");

        auto missingTarget = makeValidSingleFields();
        missingTarget.targetPath.clear();
        expect(!validateSingleForm(missingTarget, job, error), "Missing target should be rejected");
        expect(error.title == "Missing Info", "Missing field should report Missing Info");

        auto badDepth = makeValidSingleFields();
        badDepth.bitDepthText = "20";
        expect(!validateSingleForm(badDepth, job, error), "Bit depth 20 should be rejected locally");
        expect(error.title == "Invalid Bit-depth", "Bad bit depth should report Invalid Bit-depth");
    }

    void runBatchValidation()
    {
        const auto inputDir = makeScratchDirectory("batch_input");
        BatchMasteringJob job;
        ValidationError error;

        BatchFormFields fields;
        fields.referencePath = "/music/reference.wav";
        fields.inputText = "2 files selected";
        fields.selectedFiles = { "/music/a.wav", "/music/b.flac" };
        fields.outputDirectoryPath = inputDir.getChildFile("Mastered").getFullPathName();
        fields.bitDepthText = "16";

        expect(validateBatchForm(fields, job, error), "Batch with selected files should validate");
        expect(job.inputFiles.size() == 2, "Selected files should be carried over");
        expect(job.inputDirectory == juce::File(), "Selected files should take precedence over a directory");

        fields.selectedFiles.clear();
        fields.inputText = inputDir.getFullPathName();
        expect(validateBatchForm(fields, job, error), "Batch with an existing directory should validate");
        expect(job.inputFiles.isEmpty() && job.inputDirectory == inputDir, "Directory should be the input source");

        fields.inputText = inputDir.getChildFile("missing").getFullPathName();
        expect(!validateBatchForm(fields, job, error), "Nonexistent directory should be rejected");
        expect(error.message.contains("input directory OR input files"), "No input source should be explained");

        fields.inputText.clear();
        expect(!validateBatchForm(fields, job, error), "Empty input should be rejected");

        fields.inputText = inputDir.getFullPathName();
        fields.bitDepthText = "20";
        expect(!validateBatchForm(fields, job, error), "Batch bit depth 20 should be rejected");
        expect(error.title == "Invalid Bit-depth", "Batch bad bit depth should report Invalid Bit-depth");

        fields.bitDepthText = "24";
        fields.outputDirectoryPath.clear();
        expect(!validateBatchForm(fields, job, error), "Missing output directory should be rejected");

        inputDir.deleteRecursively();
    }

    void runOutputNaming()
    {
        const juce::File outputDir("/music/out");
        const auto derived = deriveMasteredOutputFile(juce::File("/music/in/track1.wav"), outputDir);
        expect(derived.getFullPathName() == "/music/out/track1 (Mastered).flac", "track1.wav should map to track1 (Mastered).flac");

        expect(suggestSingleOutputFile(juce::File("/music/song.mp3")).getFullPathName() == "/music/song (Mastered).flac",
               "Single output should sit next to the target");
        expect(suggestBatchOutputDirectory(juce::File("/music/in")).getFullPathName() == "/music/in/Mastered",
               "Batch output should default to a Mastered subfolder");

        expect(withFlacExtension("/music/out") == "/music/out.flac", "Missing .flac should be appended");
        expect(withFlacExtension("/music/out.FLAC") == "/music/out.FLAC", "Existing .flac should be kept");
    }

    void runCommandConstruction()
    {
        ToolLauncher launcher;
        launcher.prefix = { "python3", "/opt/matchering-cli/mg_cli.py" };
        const auto command = launcher.buildCommand(BitDepth::Bits16,
                                                   juce::File("/music/target.wav"),
                                                   juce::File("/music/reference.wav"),
                                                   juce::File("/music/out.flac"));

        const juce::StringArray expected { "python3", "/opt/matchering-cli/mg_cli.py", "-b", "16",
                                           "/music/target.wav", "/music/reference.wav", "/music/out.flac" };
        expect(command == expected, "Command should be <tool> -b <bits> <target> <reference> <output>");

        const auto direct = makeToolLauncher(juce::File("/usr/local/bin/mastering-tool"), "python3");
        expect(direct.prefix.size() == 1, "Non-python tools should run without an interpreter");

        const auto script = makeToolLauncher(juce::File("/opt/mg_cli.py"), "  ");
        expect(script.prefix[0] == "python3", "Blank interpreter should fall back to python3");
    }

    void runDirectoryScan()
    {
        const auto dir = makeScratchDirectory("scan");
        writeFixture(dir.getChildFile("a.WAV"));
        writeFixture(dir.getChildFile("b.txt"));
        writeFixture(dir.getChildFile("c.flac"));
        expect(dir.getChildFile("nested").createDirectory().wasOk(), "Expected nested folder");
        writeFixture(dir.getChildFile("nested").getChildFile("d.wav"));

        const auto found = AudioFileScanner::scanDirectory(dir);
        expect(found.size() == 2, "Scan should find exactly a.WAV and c.flac");
        expect(found.contains(dir.getChildFile("a.WAV")), "Scan should match extensions case-insensitively");
        expect(found.contains(dir.getChildFile("c.flac")), "Scan should include flac files");

        expect(AudioFileScanner::scanDirectory(dir.getChildFile("missing")).isEmpty(), "Missing folder should scan empty");
        expect(AudioFileScanner::getFileChooserPattern() == "*.wav;*.flac;*.aiff;*.mp3", "Chooser pattern should list all extensions");

        dir.deleteRecursively();
    }

    void runOutputDirectoryCreation()
    {
        const auto root = makeScratchDirectory("output");
        juce::String error;

        const auto nested = root.getChildFile("deep").getChildFile("Mastered");
        expect(ensureOutputDirectory(nested, error), "Missing output directory should be created");
        expect(nested.isDirectory(), "Output directory should exist afterwards");
        expect(ensureOutputDirectory(nested, error), "Existing output directory should be accepted");

        const auto blocker = root.getChildFile("occupied");
        writeFixture(blocker);
        expect(!ensureOutputDirectory(blocker, error), "A file in the way should be an environment fault");
        expect(error.startsWith("Could not create output directory"), "Environment fault should be explained");

        root.deleteRecursively();
    }

    void runSettingsAndToolLookup()
    {
        const auto dir = makeScratchDirectory("settings");
        const auto settingsFile = dir.getChildFile("settings.txt");
        expect(settingsFile.replaceWithText("# comment\n"
                                            "mastering_tool_path=" + dir.getChildFile("tool.py").getFullPathName() + "\n"
                                            "mastering_tool_interpreter=/usr/bin/python3\n"
                                            "default_bit_depth=20\n"
                                            "log_to_file=0\n"
                                            "unknown_key=1\n"),
               "Expected settings fixture write");

        AppSettings settings;
        settings.loadFrom(settingsFile);
        expect(settings.masteringToolInterpreter == "/usr/bin/python3", "Interpreter should load");
        expect(settings.defaultBitDepth == "24", "Invalid default bit depth should keep the default");
        expect(!settings.logToFile, "log_to_file=0 should disable the file logger");

        auto location = locateMasteringTool(settings, {});
        expect(location.toolFile == dir.getChildFile("tool.py"), "Settings path should be used");
        expect(!location.isAvailable(), "Tool that does not exist should be reported unavailable");
        writeFixture(location.toolFile);
        expect(location.isAvailable(), "Existing tool should be available");
        expect(location.launcher.prefix[0] == "/usr/bin/python3", "Python tool should use the configured interpreter");

        const auto overridden = locateMasteringTool(settings, dir.getChildFile("other").getFullPathName());
        expect(overridden.toolFile == dir.getChildFile("other"), "Command line override should win");

        expect(settings.saveTo(settingsFile), "Settings should save");
        AppSettings reloaded;
        reloaded.loadFrom(settingsFile);
        expect(reloaded.masteringToolPath == settings.masteringToolPath, "Saved tool path should reload");
        expect(!reloaded.logToFile, "Saved logging flag should reload");

        dir.deleteRecursively();
    }
}

int main()
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    try
    {
        runBitDepthParsing();
        runSingleValidation();
        runBatchValidation();
        runOutputNaming();
        runCommandConstruction();
        runDirectoryScan();
        runOutputDirectoryCreation();
        runSettingsAndToolLookup();
        std::cout << "MasteringJobStaticTests: PASS" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "MasteringJobStaticTests: FAIL: " << e.what() << std::endl;
        return 1;
    }
}
