#pragma once
#include <JuceHeader.h>

namespace masterdesk
{
    // One notification from a mastering job to the display thread.
    // Finished is always the last report a job produces.
    struct WorkerReport
    {
        enum class Type : int
        {
            Status = 0,
            Progress,
            Error,
            Finished
        };

        Type type = Type::Status;
        juce::String text;
        int percent = 0;

        static WorkerReport status(const juce::String& message)  { return { Type::Status, message, 0 }; }
        static WorkerReport progress(int value)                   { return { Type::Progress, {}, juce::jlimit(0, 100, value) }; }
        static WorkerReport error(const juce::String& message)   { return { Type::Error, message, 0 }; }
        static WorkerReport finished()                            { return { Type::Finished, {}, 0 }; }
    };

    namespace statusText
    {
        static constexpr const char* processing     = "Processing... (this can take a while)";
        static constexpr const char* singleSuccess  = "Success! File mastered.";
        static constexpr const char* failure        = "Error! Check terminal for details.";
        static constexpr const char* batchCompleteLead = "Batch complete!";

        inline juce::String batchProgress(int index, int total, const juce::String& fileName)
        {
            return "Processing " + juce::String(index) + "/" + juce::String(total) + ": " + fileName;
        }

        inline juce::String batchComplete(int total)
        {
            return juce::String(batchCompleteLead) + " " + juce::String(total) + " files mastered.";
        }

        inline bool isSuccess(const juce::String& text)
        {
            return text == singleSuccess || text.startsWith(batchCompleteLead);
        }
    }
} // namespace masterdesk
