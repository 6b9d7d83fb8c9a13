#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace parley {

/// Sanitised wake phrase: lowercase, letters-only words in order
using KeyPhrase = std::vector<std::string>;

/**
 * @brief Turn configured phrase text into a KeyPhrase
 *
 * Splits on spaces, strips every non-letter and lowercases. Words that end up
 * empty are dropped, so "Hey, Computer!" gives {"hey", "computer"} and "123"
 * gives an empty phrase, which never matches.
 */
KeyPhrase parse_key_phrase(const std::string& phrase);

/**
 * @brief Find the start of a contiguous, ordered sublist
 * @param list Words to search
 * @param sublist Words to look for (empty never matches)
 * @param start First index of list to consider
 * @return Index of the first occurrence at or after start, or nullopt
 */
std::optional<size_t> list_index(const std::vector<std::string>& list,
                                 const std::vector<std::string>& sublist,
                                 size_t start = 0);

/**
 * @brief Where the command starts once a key-phrase has been heard
 *
 * Every phrase is tried in order and each match overwrites the result, so the
 * last matching phrase decides the offset.
 *
 * @return Index just past the matched phrase, or nullopt if none matched
 */
std::optional<size_t> find_command_offset(const std::vector<std::string>& words,
                                          const std::vector<KeyPhrase>& phrases);

} // namespace parley
