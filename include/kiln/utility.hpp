#pragma once

#include "kiln/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/** @brief 64-bit FNV-1a, chainable through `seed`. */
constexpr uint64_t fnv1a(std::string_view data, uint64_t seed = 14695981039346656037ULL) {
    uint64_t hash = seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

/** @brief Renders a hash as 16 lowercase hex digits. */
std::string to_hex(uint64_t value);

std::string_view trim(std::string_view sv);
std::string to_lower(std::string_view sv);

/** @brief Splits on ASCII whitespace, dropping empty pieces. */
std::vector<std::string_view> split_words(std::string_view sv);

/** @brief Splits `sv` into lines, stripping a trailing '\r' from each. */
std::vector<std::string_view> split_lines(std::string_view sv);

/** @brief Search for `word` delimited by non-identifier characters; case-insensitive by default. */
bool contains_word(std::string_view haystack, std::string_view word, bool ignore_case = true);

/**
 * @brief Lowercased words longer than three letters that are not stopwords, in order of first
 *        appearance, at most `limit` of them (0 for no limit).
 */
std::vector<std::string> significant_keywords(std::string_view text, size_t limit = 0);

std::string join(const std::vector<std::string> &parts, std::string_view sep);

/** @brief Lowercases and replaces every run of non-alphanumerics with '-'. */
std::string slugify(std::string_view sv);

/**
 * @brief Reads a whole file.
 * @return The file contents, or an `Io` error naming the path.
 */
Result<std::string> read_file(const std::filesystem::path &path);

/**
 * @brief Writes `content` to `path` through a temporary sibling and a rename.
 *
 * Parent directories are created as needed.
 */
Result<void> write_file_atomic(const std::filesystem::path &path, std::string_view content);

} // namespace kiln
