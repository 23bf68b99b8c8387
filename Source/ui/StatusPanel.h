#pragma once
#include <JuceHeader.h>
#include "Theme.h"

namespace masterdesk
{
    class StatusPanel final : public juce::Component
    {
    public:
        enum class State : int
        {
            Idle = 0,
            InProgress,
            Success,
            Error
        };

        StatusPanel()
        {
            setInterceptsMouseClicks(false, false);
        }

        void setText(const juce::String& newText)
        {
            if (text == newText)
                return;
            text = newText;
            repaint();
        }

        const juce::String& getText() const noexcept { return text; }

        void setState(State newState)
        {
            if (state == newState)
                return;
            state = newState;
            repaint();
        }

        State getState() const noexcept { return state; }

        void paint(juce::Graphics& g) override
        {
            auto bounds = getLocalBounds().toFloat().reduced(1.0f);
            g.setColour(colourFor(state));
            g.fillRoundedRectangle(bounds, 6.0f);
            g.setColour(juce::Colours::white.withAlpha(0.18f));
            g.drawRoundedRectangle(bounds, 6.0f, 1.0f);

            g.setColour(theme::Colours::text());
            g.setFont(theme::Typography::label());
            g.drawFittedText(text, getLocalBounds().reduced(8, 4), juce::Justification::centred, 2);
        }

    private:
        static juce::Colour colourFor(State s)
        {
            switch (s)
            {
                case State::InProgress: return theme::Colours::statusInProgress();
                case State::Success:    return theme::Colours::statusSuccess();
                case State::Error:      return theme::Colours::statusError();
                case State::Idle:
                default:                return theme::Colours::statusIdle();
            }
        }

        juce::String text { "Status: Idle" };
        State state = State::Idle;
    };
}
