#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace facegate::vision {

//! True if the text only holds base64 alphabet characters, '=' padding and whitespace.
bool looksLikeBase64(std::string_view text);

//! Strict base64 decode. Whitespace is skipped, '=' padding is optional.
//! \returns std::nullopt for characters outside the alphabet, misplaced padding or an impossible length.
std::optional<std::vector<unsigned char>> decodeBase64(std::string_view text);

} // namespace facegate::vision
