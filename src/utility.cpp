#include "kiln/utility.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace kiln {

namespace {

bool is_ident(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

} // namespace

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parse:
        return "ParseError";
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::ComplexityExceeded:
        return "ComplexityExceededError";
    case ErrorKind::CircularDependency:
        return "CircularDependencyError";
    case ErrorKind::MissingDependency:
        return "MissingDependencyError";
    case ErrorKind::Generation:
        return "GenerationError";
    case ErrorKind::TestFailure:
        return "TestFailureError";
    case ErrorKind::Review:
        return "ReviewError";
    case ErrorKind::QualityGate:
        return "QualityGateFailure";
    case ErrorKind::Compliance:
        return "ComplianceError";
    case ErrorKind::SelfHosting:
        return "SelfHostingError";
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::Config:
        return "ConfigError";
    }
    return "Error";
}

bool is_structural(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parse:
    case ErrorKind::Validation:
    case ErrorKind::ComplexityExceeded:
    case ErrorKind::CircularDependency:
    case ErrorKind::MissingDependency:
    case ErrorKind::Config:
        return true;
    default:
        return false;
    }
}

int exit_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parse:
    case ErrorKind::Validation:
    case ErrorKind::ComplexityExceeded:
    case ErrorKind::CircularDependency:
    case ErrorKind::MissingDependency:
    case ErrorKind::Config:
        return 2;
    case ErrorKind::Generation:
    case ErrorKind::TestFailure:
    case ErrorKind::Review:
    case ErrorKind::QualityGate:
    case ErrorKind::Compliance:
    case ErrorKind::SelfHosting:
        return 3;
    case ErrorKind::Io:
        return 1;
    }
    return 1;
}

std::string to_hex(uint64_t value) {
    return std::format("{:016x}", value);
}

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string to_lower(std::string_view sv) {
    std::string out(sv);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::vector<std::string_view> split_words(std::string_view sv) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i])))
            ++i;
        size_t start = i;
        while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i])))
            ++i;
        if (i > start)
            words.push_back(sv.substr(start, i - start));
    }
    return words;
}

std::vector<std::string_view> split_lines(std::string_view sv) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < sv.size()) {
        size_t end = sv.find('\n', start);
        if (end == std::string_view::npos)
            end = sv.size();
        std::string_view line = sv.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool contains_word(std::string_view haystack, std::string_view word, bool ignore_case) {
    if (word.empty() || haystack.size() < word.size())
        return false;
    const std::string hay = ignore_case ? to_lower(haystack) : std::string(haystack);
    const std::string needle = ignore_case ? to_lower(word) : std::string(word);
    size_t pos = hay.find(needle);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !is_ident(hay[pos - 1]) || !is_ident(needle.front());
        size_t after = pos + needle.size();
        bool right_ok = after >= hay.size() || !is_ident(hay[after]) || !is_ident(needle.back());
        if (left_ok && right_ok)
            return true;
        pos = hay.find(needle, pos + 1);
    }
    return false;
}

std::vector<std::string> significant_keywords(std::string_view text, size_t limit) {
    static constexpr std::array<std::string_view, 40> kStopwords = {
        "that",  "this",  "with",  "from",  "into",  "must",   "should", "could", "shall", "will",
        "have",  "been",  "when",  "then",  "than",  "each",   "every",  "only",  "also",  "more",
        "such",  "they",  "their", "there", "which", "where",  "while",  "what",  "them",  "these",
        "those", "other", "some",  "able",  "being", "system", "provide", "support", "ensure", "without"};

    std::vector<std::string> out;
    std::string word;
    auto flush = [&] {
        if (word.size() > 3 && std::ranges::find(kStopwords, word) == kStopwords.end() &&
            std::ranges::find(out, word) == out.end()) {
            out.push_back(word);
        }
        word.clear();
    };
    for (unsigned char c : text) {
        if (limit != 0 && out.size() >= limit)
            break;
        if (is_ident(c))
            word += static_cast<char>(std::tolower(c));
        else
            flush();
    }
    if (limit == 0 || out.size() < limit)
        flush();
    return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i != 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

std::string slugify(std::string_view sv) {
    std::string out;
    bool pending_dash = false;
    for (unsigned char c : sv) {
        if (std::isalnum(c)) {
            if (pending_dash && !out.empty())
                out += '-';
            out += static_cast<char>(std::tolower(c));
            pending_dash = false;
        } else {
            pending_dash = true;
        }
    }
    return out;
}

Result<std::string> read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return fail(ErrorKind::Io, std::format("Could not open {}", path.string()));
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

Result<void> write_file_atomic(const fs::path &path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(ErrorKind::Io,
                        std::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
        }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail(ErrorKind::Io, std::format("Failed to open {} for writing", tmp.string()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            return fail(ErrorKind::Io, std::format("Failed to write {}", tmp.string()));
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        return fail(ErrorKind::Io, std::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
    return {};
}

} // namespace kiln
