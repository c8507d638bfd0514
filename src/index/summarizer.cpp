#include <archive_mcp/index/summarizer.hpp>

#include <array>
#include <cctype>

namespace archive_mcp {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
    return s;
}

// Cut at n bytes, backing off so a UTF-8 sequence is never split.
std::string_view Head(std::string_view s, std::size_t n) {
    if (s.size() <= n) return s;
    while (n > 0 && IsUtf8Continuation(s[n])) --n;
    return s.substr(0, n);
}

std::string CollapseWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (IsSpace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

constexpr std::array<std::string_view, 3> kSentenceTerminators = {". ", "! ", "? "};

} // anonymous namespace

std::string GenerateSummary(std::string_view content, std::size_t max_length) {
    auto summary = CollapseWhitespace(Head(Trim(content), max_length));

    if (content.size() <= max_length) {
        return summary;
    }

    std::size_t cut = std::string::npos;
    for (auto terminator : kSentenceTerminators) {
        auto pos = summary.rfind(terminator);
        if (pos != std::string::npos && (cut == std::string::npos || pos > cut)) {
            cut = pos;
        }
    }

    if (cut != std::string::npos &&
        static_cast<double>(cut) > static_cast<double>(max_length) * 0.5) {
        summary.resize(cut + 1);  // keep the punctuation, drop the space
    } else {
        summary += "...";
    }
    return summary;
}

std::size_t CountWords(std::string_view content) {
    std::size_t count = 0;
    bool in_word = false;
    for (char c : content) {
        if (IsSpace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

} // namespace archive_mcp
