#include "MainComponent.h"

namespace masterdesk
{
    MainComponent::MainComponent(const MasteringToolLocation& toolLocation, const AppSettings& settings)
        : workerPool(toolLocation.launcher, std::make_shared<ChildProcessRunner>()),
          singleTab(workerPool, settings.defaultBitDepth),
          batchTab(workerPool, settings.defaultBitDepth)
    {
        setLookAndFeel(&theme::ThemeManager::instance().lookAndFeel());

        tabs.setTabBarDepth(32);
        tabs.addTab("Single Song", theme::Colours::header(), &singleTab, false);
        tabs.addTab("Batch Master", theme::Colours::header(), &batchTab, false);
        addAndMakeVisible(tabs);

        toolLabel.setText("Mastering tool: " + toolLocation.toolFile.getFullPathName(), juce::dontSendNotification);
        toolLabel.setFont(theme::Typography::label(0.9f));
        toolLabel.setColour(juce::Label::textColourId, theme::Colours::text().withAlpha(0.55f));
        toolLabel.setJustificationType(juce::Justification::centredLeft);
        addAndMakeVisible(toolLabel);

        setSize(640, 380);
    }

    MainComponent::~MainComponent()
    {
        tabs.clearTabs();
        setLookAndFeel(nullptr);
    }

    void MainComponent::paint(juce::Graphics& g)
    {
        g.fillAll(theme::Colours::background());
    }

    void MainComponent::resized()
    {
        auto r = getLocalBounds();
        toolLabel.setBounds(r.removeFromBottom(22).reduced(10, 0));
        tabs.setBounds(r.reduced(4));
    }
}
