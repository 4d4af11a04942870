#include "ui/progress_view.hpp"

#include <ftxui/screen/screen.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

using namespace ftxui;

ProgressView::ProgressView() = default;
ProgressView::~ProgressView() = default;

std::string ProgressView::format_bytes(int64_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1)
            << (double)bytes / 1024.0 << " KB";
    } else {
        oss << std::fixed << std::setprecision(1)
            << (double)bytes / (1024.0 * 1024.0) << " MB";
    }
    return oss.str();
}

std::string ProgressView::format_speed(int64_t bytes_per_sec) {
    return format_bytes(bytes_per_sec) + "/s";
}

Element ProgressView::render(const UpdateProgress& progress) const {
    float ratio = static_cast<float>(progress.percent) / 100.0f;

    std::string amount = format_bytes(progress.transferred);
    if (progress.total > 0) {
        amount += " / " + format_bytes(progress.total);
    }

    return hbox({
        text(" " + std::to_string(progress.percent) + "% ") | bold,
        gauge(ratio) | flex | color(Color::Green),
        text(" " + amount + "  ") | dim,
        text(format_speed(progress.bytes_per_second) + " "),
    });
}

void ProgressView::update(const UpdateProgress& progress) {
    auto document = render(progress);
    auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(document));
    Render(screen, document);
    std::cout << reset_position_ << screen.ToString() << std::flush;
    reset_position_ = screen.ResetPosition();
    drawn_ = true;
}

void ProgressView::finish() {
    if (drawn_) {
        std::cout << "\n";
        drawn_ = false;
        reset_position_.clear();
    }
}

std::string ProgressView::to_string(const UpdateProgress& progress, int width) const {
    auto document = render(progress);
    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fixed(1));
    Render(screen, document);
    return screen.ToString();
}
