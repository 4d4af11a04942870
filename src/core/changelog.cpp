#include "core/changelog.hpp"

#include <cctype>
#include <ctime>
#include <regex>
#include <sstream>

namespace {

enum class Section { None, Added, Changed, Fixed, Removed };

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool istarts_with(const std::string& s, size_t pos, const char* word) {
    for (size_t i = 0; word[i] != '\0'; ++i) {
        if (pos + i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != word[i]) return false;
    }
    return true;
}

/// "## Added", "# 🚀 Added", "### fixed" -> section; anything else -> None.
/// Up to three '#' markers, then an optional emoji glyph before the keyword.
Section match_section_header(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && line[pos] == '#') ++pos;
    if (pos == 0 || pos > 3) return Section::None;

    // Whitespace and non-ASCII bytes (emoji, variation selectors)
    while (pos < line.size()) {
        unsigned char c = static_cast<unsigned char>(line[pos]);
        if (c == ' ' || c == '\t' || c >= 0x80) {
            ++pos;
        } else {
            break;
        }
    }

    static const struct {
        const char* word;
        Section section;
    } keywords[] = {
        {"added", Section::Added},
        {"changed", Section::Changed},
        {"fixed", Section::Fixed},
        {"removed", Section::Removed},
    };

    for (const auto& k : keywords) {
        if (!istarts_with(line, pos, k.word)) continue;
        size_t after = pos + std::char_traits<char>::length(k.word);
        if (after < line.size() && std::isalpha(static_cast<unsigned char>(line[after]))) {
            continue;
        }
        return k.section;
    }
    return Section::None;
}

std::vector<std::string>* section_list(ChangelogSection& sections, Section s) {
    switch (s) {
        case Section::Added:   return &sections.added;
        case Section::Changed: return &sections.changed;
        case Section::Fixed:   return &sections.fixed;
        case Section::Removed: return &sections.removed;
        case Section::None:    break;
    }
    return nullptr;
}

class SectionScanner {
public:
    void feed(const std::string& raw_line) {
        std::string line = trim(raw_line);

        Section header = match_section_header(line);
        if (header != Section::None) {
            current_ = header;
            return;
        }

        auto* list = section_list(sections_, current_);
        if (!list || line.rfind("- ", 0) != 0) return;

        std::string item = trim(line.substr(2));
        // "- **Bold**" lines are sub-headings inside a section
        if (item.empty() || item.rfind("**", 0) == 0) return;
        list->push_back(std::move(item));
    }

    ChangelogSection take() { return std::move(sections_); }

private:
    Section current_ = Section::None;
    ChangelogSection sections_;
};

}  // namespace

ChangelogSection parse_changelog_sections(const std::string& body) {
    SectionScanner scanner;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        scanner.feed(line);
    }
    return scanner.take();
}

std::vector<ChangelogEntry> parse_multi_version(const std::string& body) {
    static const std::regex version_header(
        R"(^#{1,2}\s*\[v?(\d+(?:\.\d+)*)\](?:\s*-\s*(\d{4}-\d{2}-\d{2}))?)");

    std::vector<ChangelogEntry> entries;
    ChangelogEntry current;
    SectionScanner scanner;
    bool in_block = false;

    auto flush = [&] {
        if (!in_block) return;
        current.sections = scanner.take();
        if (!current.sections.empty()) {
            entries.push_back(std::move(current));
        }
        current = ChangelogEntry{};
        scanner = SectionScanner{};
    };

    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        std::smatch match;
        if (std::regex_search(trimmed, match, version_header)) {
            flush();
            in_block = true;
            current.version = match[1].str();
            current.date = match[2].matched ? match[2].str() : "";
            continue;
        }
        if (in_block) {
            scanner.feed(trimmed);
        }
    }
    flush();

    return entries;
}

std::string iso8601_now() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}
