#pragma once
#include <JuceHeader.h>
#include <functional>
#include "Theme.h"

namespace masterdesk
{
    // Caption, text field and trailing buttons laid out on one line.
    class FormRow final : public juce::Component
    {
    public:
        FormRow(const juce::String& caption,
                const juce::String& placeholder,
                bool readOnly,
                int fixedEditorWidth = 0)
            : editorWidth(fixedEditorWidth)
        {
            label.setText(caption, juce::dontSendNotification);
            label.setFont(theme::Typography::label());
            label.setJustificationType(juce::Justification::centredLeft);
            addAndMakeVisible(label);

            editor.setReadOnly(readOnly);
            editor.setCaretVisible(!readOnly);
            editor.setTextToShowWhenEmpty(placeholder, theme::Colours::text().withAlpha(0.4f));
            editor.setIndents(6, 6);
            addAndMakeVisible(editor);
        }

        juce::TextButton& addButton(const juce::String& text, std::function<void()> onClick)
        {
            auto* button = buttons.add(new juce::TextButton(text));
            button->onClick = std::move(onClick);
            addAndMakeVisible(button);
            resized();
            return *button;
        }

        void setCaptionWidth(int width)
        {
            captionWidth = width;
            resized();
        }

        void setText(const juce::String& text) { editor.setText(text, juce::dontSendNotification); }
        juce::String getText() const { return editor.getText(); }

        void resized() override
        {
            auto r = getLocalBounds();
            label.setBounds(r.removeFromLeft(captionWidth));

            for (int i = buttons.size(); --i >= 0;)
            {
                buttons[i]->setBounds(r.removeFromRight(theme::Dimensions::buttonWidth).reduced(2, 1));
                r.removeFromRight(4);
            }

            if (editorWidth > 0)
                r = r.removeFromLeft(editorWidth);
            editor.setBounds(r.reduced(0, 1));
        }

    private:
        juce::Label label;
        juce::TextEditor editor;
        juce::OwnedArray<juce::TextButton> buttons;
        int captionWidth = theme::Dimensions::labelWidth;
        int editorWidth = 0;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FormRow)
    };
}
