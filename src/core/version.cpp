#include "core/version.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string strip_version_prefix(const std::string& tag) {
    std::string t = trim(tag);
    if (!t.empty() && (t[0] == 'v' || t[0] == 'V')) {
        return t.substr(1);
    }
    return t;
}

/// Split into segments reduced to canonical digit strings ("007" -> "7").
/// Anything that is not purely digits becomes "0".
static std::vector<std::string> split_segments(const std::string& version) {
    std::vector<std::string> segments;
    std::string v = strip_version_prefix(version);

    size_t start = 0;
    while (true) {
        size_t dot = v.find('.', start);
        std::string seg = v.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        bool numeric = !seg.empty() &&
            std::all_of(seg.begin(), seg.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!numeric) {
            seg = "0";
        } else {
            auto nz = seg.find_first_not_of('0');
            seg = (nz == std::string::npos) ? "0" : seg.substr(nz);
        }
        segments.push_back(seg);

        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

static int compare_digits(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int compare_versions(const std::string& a, const std::string& b) {
    auto pa = split_segments(a);
    auto pb = split_segments(b);

    size_t n = std::max(pa.size(), pb.size());
    for (size_t i = 0; i < n; ++i) {
        const std::string& sa = i < pa.size() ? pa[i] : std::string("0");
        const std::string& sb = i < pb.size() ? pb[i] : std::string("0");
        int c = compare_digits(sa, sb);
        if (c != 0) return c;
    }
    return 0;
}

bool is_newer_version(const std::string& current, const std::string& candidate) {
    return compare_versions(candidate, current) == 1;
}
