#pragma once
#include <JuceHeader.h>

namespace masterdesk
{
    struct ProcessOutcome
    {
        bool launched = false;
        int exitCode = -1;
        juce::String errorOutput;   // the tool's error stream; its standard output is discarded
        juce::String launchError;

        bool succeeded() const noexcept { return launched && exitCode == 0; }

        // Text shown to the user when the run did not succeed.
        juce::String describeFailure() const;
    };

    // Runs one external command to completion. Implementations block the calling thread.
    class ToolProcessRunner
    {
    public:
        virtual ~ToolProcessRunner() = default;
        virtual ProcessOutcome run(const juce::StringArray& command) = 0;
    };

    class ChildProcessRunner final : public ToolProcessRunner
    {
    public:
        ChildProcessRunner() = default;

        ProcessOutcome run(const juce::StringArray& command) override;

    private:
        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ChildProcessRunner)
    };
}
