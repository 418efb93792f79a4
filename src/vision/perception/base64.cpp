#include "base64.hpp"

#include <array>
#include <cctype>

namespace facegate::vision {

namespace {

constexpr std::string_view Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> makeLookup() {
	std::array<int, 256> table{};
	table.fill(-1);
	for (std::size_t i = 0; i < Alphabet.size(); ++i) {
		table[static_cast<unsigned char>(Alphabet[i])] = static_cast<int>(i);
	}
	return table;
}

constexpr std::array<int, 256> Lookup = makeLookup();

bool isSpace(const char c) {
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool looksLikeBase64(const std::string_view text) {
	bool any = false;
	for (const char c : text) {
		if (isSpace(c) || c == '=') {
			continue;
		}
		if (Lookup[static_cast<unsigned char>(c)] < 0) {
			return false;
		}
		any = true;
	}
	return any;
}

std::optional<std::vector<unsigned char>> decodeBase64(const std::string_view text) {
	std::vector<unsigned char> decoded;
	decoded.reserve(text.size() / 4 * 3);

	unsigned value      = 0;
	int bits            = -8;
	std::size_t count   = 0;
	std::size_t padding = 0;
	for (const char c : text) {
		if (isSpace(c)) {
			continue;
		}
		if (c == '=') {
			++padding;
			continue;
		}
		const int index = Lookup[static_cast<unsigned char>(c)];
		if (index < 0 || padding > 0) {
			return std::nullopt; // Foreign character or data after padding.
		}

		value = ((value << 6) | static_cast<unsigned>(index)) & 0xFFFFFFu;
		bits += 6;
		++count;
		if (bits >= 0) {
			decoded.push_back(static_cast<unsigned char>((value >> bits) & 0xFFu));
			bits -= 8;
		}
	}

	if (count % 4 == 1 || padding > 2) {
		return std::nullopt;
	}
	if (padding > 0 && (count + padding) % 4 != 0) {
		return std::nullopt;
	}
	return decoded;
}

} // namespace facegate::vision
