#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class ErrorKind : uint8_t {
    Parse,
    Validation,
    ComplexityExceeded,
    CircularDependency,
    MissingDependency,
    Generation,
    TestFailure,
    Review,
    QualityGate,
    Compliance,
    SelfHosting,
    Io,
    Config,
};

/**
 * @brief Structured error carried through every `Result`.
 *
 * `subjects` holds the ordered payload of the error when it has one: the cycle path of a
 * `CircularDependency`, the unmet requirement ids of a `Compliance` error, the missing names of a
 * `MissingDependency` or `SelfHosting` error.
 */
struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    std::string recipe;
    std::string phase;
    std::string diagnostic; ///< Raw tool or oracle output, if any.
    std::vector<std::string> subjects;
    bool timed_out = false; ///< Set when an external call exceeded its deadline.

    Error &in_recipe(std::string name) & {
        if (recipe.empty())
            recipe = std::move(name);
        return *this;
    }
    Error &&in_recipe(std::string name) && {
        if (recipe.empty())
            recipe = std::move(name);
        return std::move(*this);
    }
    Error &in_phase(std::string name) & {
        if (phase.empty())
            phase = std::move(name);
        return *this;
    }
    Error &&in_phase(std::string name) && {
        if (phase.empty())
            phase = std::move(name);
        return std::move(*this);
    }
};

template <typename T> using Result = std::expected<T, Error>;

std::string_view to_string(ErrorKind kind);

/** @brief Errors that must stop a collection build before any generation work starts. */
bool is_structural(ErrorKind kind);

/**
 * @brief Maps an error kind to the process exit code.
 * @return 2 for parse, validation and graph errors, 3 for build failures, 1 otherwise.
 */
int exit_code(ErrorKind kind);

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

inline std::unexpected<Error> fail(Error error) {
    return std::unexpected(std::move(error));
}

} // namespace kiln

template <> struct std::formatter<kiln::Error> : std::formatter<std::string> {
    auto format(const kiln::Error &err, std::format_context &ctx) const {
        std::string out = std::format("{}: {}", kiln::to_string(err.kind), err.message);
        if (!err.recipe.empty())
            out += std::format(" [recipe={}", err.recipe);
        if (!err.phase.empty())
            out += std::format("{}phase={}", err.recipe.empty() ? " [" : " ", err.phase);
        if (!err.recipe.empty() || !err.phase.empty())
            out += "]";
        if (!err.subjects.empty()) {
            out += " (";
            for (size_t i = 0; i < err.subjects.size(); ++i) {
                if (i != 0)
                    out += ", ";
                out += err.subjects[i];
            }
            out += ")";
        }
        return std::formatter<std::string>::format(out, ctx);
    }
};
