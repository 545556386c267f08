#pragma once

#include <string>

// Receiver of the two possible outcomes of a capture interaction
class CaptureListener
{
  public:
    virtual ~CaptureListener() = default;
    virtual void on_submit(const std::string &text) = 0;
    virtual void on_cancel() = 0;
};

// Text field shown after the hotkey fires. Implementations call exactly one
// of the listener's methods per show() and hide themselves afterwards.
class InputPrompt
{
  public:
    virtual ~InputPrompt() = default;

    virtual void show(const std::string &prompt, CaptureListener &listener) = 0;
    // Raise and re-focus the prompt while it is open
    virtual void focus() = 0;
    // Close without invoking any callback
    virtual void hide() = 0;
};

// State of one "hotkey -> text input -> submit/cancel" interaction.
// Guarantees that the wrapped listener sees exactly one outcome, however
// often the prompt reports back.
class CaptureSession : public CaptureListener
{
  public:
    explicit CaptureSession(CaptureListener &listener);

    CaptureSession(const CaptureSession &) = delete;
    CaptureSession &operator=(const CaptureSession &) = delete;

    void on_submit(const std::string &text) override;
    void on_cancel() override;

    // Ends the session without notifying anyone (process shutdown)
    void abandon();

    [[nodiscard]] bool active() const { return active_; }

  private:
    CaptureListener &listener_;
    bool active_ = true;
};
