#include "ToolProcessRunner.h"

namespace masterdesk
{
    juce::String ProcessOutcome::describeFailure() const
    {
        if (!launched)
            return launchError.isNotEmpty() ? launchError : juce::String("Unable to launch the mastering tool.");

        const auto trimmed = errorOutput.trim();
        if (trimmed.isNotEmpty())
            return trimmed;

        return "The mastering tool exited with code " + juce::String(exitCode) + ".";
    }

    ProcessOutcome ChildProcessRunner::run(const juce::StringArray& command)
    {
        ProcessOutcome outcome;
        if (command.isEmpty() || command[0].trim().isEmpty())
        {
            outcome.launchError = "No mastering command to run.";
            return outcome;
        }

        // A bare program name is resolved through PATH by the child; an explicit path can be checked here.
        const auto& program = command[0];
        if (juce::File::isAbsolutePath(program) && !juce::File(program).existsAsFile())
        {
            outcome.launchError = "Unable to launch " + program.quoted() + ": file not found.";
            return outcome;
        }

        juce::Logger::writeToLog("Running command: " + command.joinIntoString(" "));

        juce::ChildProcess process;
        // Only the error stream is piped back; the tool's standard output is discarded.
        if (!process.start(command, juce::ChildProcess::wantStdErr))
        {
            outcome.launchError = "Unable to launch " + program.quoted() + ".";
            return outcome;
        }

        outcome.launched = true;
        outcome.errorOutput = process.readAllProcessOutput();
        juce::ignoreUnused(process.waitForProcessToFinish(-1));
        outcome.exitCode = static_cast<int>(process.getExitCode());

        if (outcome.errorOutput.trim().isNotEmpty())
            juce::Logger::writeToLog("Tool error stream:\n" + outcome.errorOutput.trim());
        juce::Logger::writeToLog("Tool exited with code " + juce::String(outcome.exitCode));
        return outcome;
    }
}
