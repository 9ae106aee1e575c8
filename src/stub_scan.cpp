#include "kiln/stub_scan.hpp"

#include "kiln/utility.hpp"

#include <array>
#include <format>
#include <string_view>

namespace kiln {

namespace {

constexpr std::array<std::string_view, 5> kCommentMarkers = {"TODO", "FIXME", "XXX", "HACK", "STUB"};

bool is_empty_function_body(std::string_view line) {
    if (!line.ends_with("{}"))
        return false;
    std::string_view head = trim(line.substr(0, line.size() - 2));
    for (std::string_view qualifier : {"const", "override", "noexcept", "final"}) {
        while (head.ends_with(qualifier))
            head = trim(head.substr(0, head.size() - qualifier.size()));
    }
    return head.ends_with(')');
}

} // namespace

std::vector<StubMarker> scan_for_stubs(const ArtifactSet &artifacts) {
    std::vector<StubMarker> found;
    for (const auto &[path, content] : artifacts.files) {
        if (is_test_path(path))
            continue;
        const auto lines = split_lines(content);
        for (size_t i = 0; i < lines.size(); ++i) {
            const std::string_view line = trim(lines[i]);
            auto add = [&](std::string_view marker) { found.push_back({path, i + 1, std::string(marker)}); };

            if (line.find("NotImplemented") != std::string_view::npos || line.find("unimplemented!") != std::string_view::npos)
                add("not implemented");
            else if (contains_word(line, "not implemented"))
                add("not implemented");
            for (std::string_view marker : kCommentMarkers) {
                if (contains_word(line, marker, false))
                    add(marker);
            }
            if (line == "pass" || line == "...")
                add(std::format("empty body '{}'", line));
            else if (is_empty_function_body(line))
                add("empty function body");
        }
    }
    return found;
}

FailureReport stub_failure_report(const std::vector<StubMarker> &markers) {
    FailureReport report;
    report.summary = std::format("{} unfinished-work marker(s) in the implementation", markers.size());
    for (const auto &m : markers) {
        report.failures.push_back(
            {.name = std::format("{}:{}", m.path, m.line), .passed = false, .message = m.marker});
        report.raw_output += std::format("{}:{}: {}\n", m.path, m.line, m.marker);
    }
    return report;
}

} // namespace kiln
