#pragma once
#include <JuceHeader.h>
#include "AppSettings.h"
#include "ToolLocator.h"
#include "MasteringWorker.h"
#include "SingleMasterTab.h"
#include "BatchMasterTab.h"
#include "Theme.h"

namespace masterdesk
{
    class MainComponent final : public juce::Component
    {
    public:
        MainComponent(const MasteringToolLocation& toolLocation, const AppSettings& settings);
        ~MainComponent() override;

        void paint(juce::Graphics& g) override;
        void resized() override;

    private:
        // Declared first so it is destroyed last. The tabs detach from their shared report channels
        // on destruction, so a job still running here finishes without touching them.
        MasteringWorkerPool workerPool;

        SingleMasterTab singleTab;
        BatchMasterTab batchTab;
        juce::TabbedComponent tabs { juce::TabbedButtonBar::TabsAtTop };
        juce::Label toolLabel;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainComponent)
    };
}
