#include "kiln/artifacts.hpp"

#include <chrono>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace kiln {

Result<void> write_artifacts(const fs::path &dir, const ArtifactSet &artifacts) {
    for (const auto &[relative, content] : artifacts.files) {
        const fs::path rel = fs::path(relative).lexically_normal();
        if (rel.empty() || rel.is_absolute() || *rel.begin() == "..")
            return fail(ErrorKind::Io, std::format("Refusing to write artifact outside {}: {}", dir.string(), relative));
        if (auto res = write_file_atomic(dir / rel, content); !res)
            return res;
    }
    return {};
}

Result<ArtifactSet> read_artifacts(const fs::path &dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return fail(ErrorKind::Io, std::format("Artifact directory {} does not exist", dir.string()));

    ArtifactSet set;
    set.generated_at = std::chrono::system_clock::now();
    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        auto content = read_file(it->path());
        if (!content)
            return std::unexpected(content.error());
        set.files.emplace(it->path().lexically_relative(dir).generic_string(), std::move(*content));
    }
    if (ec)
        return fail(ErrorKind::Io, std::format("Failed to read {}: {}", dir.string(), ec.message()));
    return set;
}

Result<void> remove_tree(const fs::path &dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        return fail(ErrorKind::Io, std::format("Failed to remove {}: {}", dir.string(), ec.message()));
    return {};
}

} // namespace kiln
