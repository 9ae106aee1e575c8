#pragma once

#include "kiln/domain.hpp"

#include <string>
#include <vector>

namespace kiln {

struct StubMarker {
    std::string path;
    size_t line = 0;
    std::string marker;
};

/**
 * @brief Finds unfinished-work markers in non-test files.
 *
 * Flags not-implemented signals, TODO-class comments (TODO, FIXME, XXX, HACK, STUB), bodies that
 * consist of a lone `pass` or `...`, and one-line empty function bodies such as `f() {}`.
 */
std::vector<StubMarker> scan_for_stubs(const ArtifactSet &artifacts);

/** @brief Turns scan results into a failure report the oracle can repair against. */
FailureReport stub_failure_report(const std::vector<StubMarker> &markers);

} // namespace kiln
