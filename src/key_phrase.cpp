#include "key_phrase.h"
#include "utils.h"
#include <algorithm>

namespace parley {

KeyPhrase parse_key_phrase(const std::string& phrase) {
    KeyPhrase result;
    size_t pos = 0;
    while (pos <= phrase.size()) {
        size_t end = phrase.find(' ', pos);
        if (end == std::string::npos) {
            end = phrase.size();
        }
        std::string word = utils::to_letters(phrase.substr(pos, end - pos));
        if (!word.empty()) {
            result.push_back(std::move(word));
        }
        pos = end + 1;
    }
    return result;
}

std::optional<size_t> list_index(const std::vector<std::string>& list,
                                 const std::vector<std::string>& sublist,
                                 size_t start) {
    if (sublist.empty() || start >= list.size()) {
        return std::nullopt;
    }

    size_t offset = start;
    while (offset < list.size()) {
        auto first = std::find(list.begin() + offset, list.end(), sublist.front());
        if (first == list.end()) {
            return std::nullopt;
        }
        size_t index = static_cast<size_t>(first - list.begin());

        // The rest of the sublist has to follow immediately
        if (list.size() - index >= sublist.size() &&
            std::equal(sublist.begin() + 1, sublist.end(), first + 1)) {
            return index;
        }

        // Look again after this tentative start
        offset = index + 1;
    }
    return std::nullopt;
}

std::optional<size_t> find_command_offset(const std::vector<std::string>& words,
                                          const std::vector<KeyPhrase>& phrases) {
    std::optional<size_t> offset;
    for (const auto& phrase : phrases) {
        auto index = list_index(words, phrase);
        if (index) {
            offset = *index + phrase.size();
        }
    }
    return offset;
}

} // namespace parley
