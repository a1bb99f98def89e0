#pragma once
#include "../core/Discovery.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iperf_discovery {

inline constexpr char PAIR_DELIMITER = ';';
inline constexpr char KEY_VALUE_SEPARATOR = '=';

// Grammar:  reply   := segment (';' segment)*
//           segment := ws* key '=' value ws*   (anything else is ignored)
// key is non-empty, value runs to the next ';' and may be empty or contain '='.
// Duplicate keys: last value wins, position of the first occurrence is kept.
namespace response_grammar {
    std::vector<std::string_view> tokenize(std::string_view text);
    std::optional<std::pair<std::string, std::string>> build_pair(std::string_view segment);
}

// nullopt == MalformedResponse (no valid pair at all).
std::optional<Attributes> parse_response(std::string_view bytes);

// Rewrites raw accessory firmware text into the grammar above (label renames, literal "\n"
// separators, collapsed whitespace). nullopt if the bytes are not valid UTF-8.
std::optional<std::string> normalize_firmware_reply(std::string_view raw);

bool is_valid_utf8(std::string_view bytes);

}
