#pragma once

#include "core/update_types.hpp"

#include <ftxui/dom/elements.hpp>

#include <cstdint>
#include <string>

/// Terminal rendering of a download in progress
class ProgressView {
public:
    ProgressView();
    ~ProgressView();

    ftxui::Element render(const UpdateProgress& progress) const;

    /// Redraw the gauge in place on stdout
    void update(const UpdateProgress& progress);

    /// Move past the gauge so later output starts on a fresh line
    void finish();

    /// Render to a fixed-width string
    std::string to_string(const UpdateProgress& progress, int width) const;

    static std::string format_bytes(int64_t bytes);
    static std::string format_speed(int64_t bytes_per_sec);

private:
    std::string reset_position_;
    bool drawn_ = false;
};
