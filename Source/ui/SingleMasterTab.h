#pragma once
#include <JuceHeader.h>
#include <functional>
#include <memory>
#include "FormRow.h"
#include "StatusPanel.h"
#include "MasteringWorker.h"

namespace masterdesk
{
    // "Single Song" tab: one reference, one target, one output file.
    class SingleMasterTab final : public juce::Component
    {
    public:
        SingleMasterTab(MasteringWorkerPool& pool, const juce::String& defaultBitDepth);
        ~SingleMasterTab() override;

        void paint(juce::Graphics& g) override;
        void resized() override;

        // Replaces the warning dialog when set.
        std::function<void(const juce::String& title, const juce::String& message)> onWarning;

        void setFormForTesting(const juce::String& reference,
                               const juce::String& target,
                               const juce::String& output,
                               const juce::String& bitDepth);
        bool clickRunForTesting();
        bool isRunEnabledForTesting() const { return runButton.isEnabled(); }
        const StatusPanel& getStatusPanelForTesting() const noexcept { return statusPanel; }

    private:
        void chooseReference();
        void chooseTarget();
        void chooseOutput();
        void startMastering();
        void handleReport(const WorkerReport& report);
        void showWarning(const juce::String& title, const juce::String& message);

        MasteringWorkerPool& workerPool;
        std::shared_ptr<ReportChannel> reports;
        std::unique_ptr<juce::FileChooser> fileChooser;

        FormRow referenceRow { "Reference:", "Path to your reference track...", true };
        FormRow targetRow { "Target:", "Path to the song you want to master...", true };
        FormRow outputRow { "Output:", "Where to save the mastered file...", false };
        FormRow bitDepthRow { "Bit-depth (16, 24, 32):", {}, false, 50 };
        juce::TextButton runButton { "MASTER SINGLE SONG" };
        StatusPanel statusPanel;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SingleMasterTab)
    };
}
