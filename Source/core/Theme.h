#pragma once
#include <JuceHeader.h>

namespace masterdesk
{
    namespace theme
    {
        struct Colours
        {
            // Backgrounds
            static juce::Colour background()      { return juce::Colour::fromRGB(24, 27, 32); }
            static juce::Colour panel()           { return juce::Colour::fromRGB(38, 44, 52); }
            static juce::Colour header()          { return juce::Colour::fromRGB(49, 57, 68); }
            static juce::Colour field()           { return juce::Colour::fromRGB(30, 35, 42); }

            // Accents
            static juce::Colour accent()          { return juce::Colour::fromRGB(255, 166, 41); }

            // Elements
            static juce::Colour text()            { return juce::Colour::fromRGB(235, 240, 245); }

            // Status panel backgrounds
            static juce::Colour statusIdle()       { return juce::Colour::fromRGB(58, 62, 70); }
            static juce::Colour statusInProgress() { return juce::Colour::fromRGB(52, 66, 120); }
            static juce::Colour statusSuccess()    { return juce::Colour::fromRGB(46, 112, 72); }
            static juce::Colour statusError()      { return juce::Colour::fromRGB(134, 48, 52); }
        };

        struct Dimensions
        {
            static constexpr int rowHeight = 30;
            static constexpr int rowGap = 8;
            static constexpr int labelWidth = 84;
            static constexpr int buttonWidth = 128;
            static constexpr int runButtonHeight = 40;
            static constexpr int statusHeight = 34;
        };

        struct Typography
        {
            static juce::Font label(float scale = 1.0f)   { return juce::Font(juce::FontOptions(13.0f * scale, juce::Font::plain)); }
        };

        class ModernLookAndFeel : public juce::LookAndFeel_V4
        {
        public:
            ModernLookAndFeel()
            {
                setColour(juce::ResizableWindow::backgroundColourId, Colours::background());

                setColour(juce::TextButton::buttonColourId, juce::Colour::fromRGB(66, 74, 88));
                setColour(juce::TextButton::buttonOnColourId, Colours::accent().withSaturation(0.9f));
                setColour(juce::TextButton::textColourOffId, Colours::text().withAlpha(0.92f));
                setColour(juce::TextButton::textColourOnId, juce::Colours::black.withAlpha(0.86f));

                setColour(juce::TextEditor::backgroundColourId, Colours::field());
                setColour(juce::TextEditor::textColourId, Colours::text());
                setColour(juce::TextEditor::outlineColourId, juce::Colours::white.withAlpha(0.12f));
                setColour(juce::TextEditor::focusedOutlineColourId, Colours::accent().withAlpha(0.75f));
                setColour(juce::Label::textColourId, Colours::text().withAlpha(0.9f));

                setColour(juce::TabbedButtonBar::tabOutlineColourId, juce::Colours::transparentBlack);
                setColour(juce::TabbedComponent::backgroundColourId, Colours::panel());
                setColour(juce::TabbedComponent::outlineColourId, juce::Colours::transparentBlack);

                setColour(juce::ProgressBar::backgroundColourId, Colours::field());
                setColour(juce::ProgressBar::foregroundColourId, Colours::accent().withAlpha(0.85f));
            }

            void drawButtonBackground(juce::Graphics& g,
                                      juce::Button& button,
                                      const juce::Colour& backgroundColour,
                                      bool isMouseOverButton,
                                      bool isButtonDown) override
            {
                auto bounds = button.getLocalBounds().toFloat().reduced(0.5f);
                auto base = backgroundColour;
                if (!button.isEnabled())
                    base = base.withMultipliedAlpha(0.45f);
                else if (isButtonDown)
                    base = base.darker(0.16f);
                else if (isMouseOverButton)
                    base = base.brighter(0.11f);

                g.setColour(base);
                g.fillRoundedRectangle(bounds, 8.0f);
                g.setColour(juce::Colours::white.withAlpha(isMouseOverButton ? 0.24f : 0.14f));
                g.drawRoundedRectangle(bounds, 8.0f, 1.0f);
            }
        };

        class ThemeManager
        {
        public:
            static ThemeManager& instance()
            {
                static ThemeManager manager;
                return manager;
            }

            ModernLookAndFeel& lookAndFeel() noexcept { return lookAndFeelImpl; }

        private:
            ModernLookAndFeel lookAndFeelImpl;
        };
    }
}
