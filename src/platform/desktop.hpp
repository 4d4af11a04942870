#pragma once

#include <chrono>
#include <functional>
#include <string>

/// OS shell integration used by the installer
class Desktop {
public:
    virtual ~Desktop() = default;

    /// Open a file with the OS default handler. Returns false with `error` set on failure.
    virtual bool open_path(const std::string& path, std::string& error) = 0;

    /// Reveal a file in the OS file manager
    virtual bool show_item_in_folder(const std::string& path, std::string& error) = 0;

    /// Ask the application to exit once `grace` has elapsed
    virtual void request_quit(std::chrono::milliseconds grace) = 0;
};

/// Desktop implementation that spawns the platform's opener
/// (xdg-open, open, ShellExecute).
class SystemDesktop : public Desktop {
public:
    /// `on_quit` runs after the grace delay; the process exits when it is empty
    explicit SystemDesktop(std::function<void()> on_quit = nullptr);

    bool open_path(const std::string& path, std::string& error) override;
    bool show_item_in_folder(const std::string& path, std::string& error) override;
    void request_quit(std::chrono::milliseconds grace) override;

    /// The user's standard downloads directory
    static std::string downloads_dir();

private:
    std::function<void()> on_quit_;
};
