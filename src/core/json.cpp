#include "marketlink/json.hpp"

#include <charconv>
#include <cstdio>
#include <system_error>

namespace marketlink::json {

namespace {

constexpr int kMaxDepth = 64;

std::size_t skip_ws(std::string_view text, std::size_t pos) {
	while (pos < text.size() &&
		   (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
		pos++;
	}
	return pos;
}

bool is_hex(char c) {
	return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_digit(char c) {
	return c >= '0' && c <= '9';
}

// pos points at the opening quote
std::optional<std::size_t> skip_string(std::string_view text, std::size_t pos) {
	pos++;
	while (pos < text.size()) {
		char c = text[pos];
		if (c == '"') {
			return pos + 1;
		}
		if (c == '\\') {
			pos++;
			if (pos >= text.size()) {
				return std::nullopt;
			}
			char esc = text[pos];
			if (esc == 'u') {
				if (pos + 4 >= text.size()) {
					return std::nullopt;
				}
				for (std::size_t i = 1; i <= 4; ++i) {
					if (!is_hex(text[pos + i])) {
						return std::nullopt;
					}
				}
				pos += 4;
			} else if (std::string_view("\"\\/bfnrt").find(esc) == std::string_view::npos) {
				return std::nullopt;
			}
		} else if (static_cast<unsigned char>(c) < 0x20) {
			return std::nullopt;
		}
		pos++;
	}
	return std::nullopt;
}

std::optional<std::size_t> skip_number(std::string_view text, std::size_t pos) {
	if (pos < text.size() && text[pos] == '-') {
		pos++;
	}
	if (pos >= text.size()) {
		return std::nullopt;
	}
	if (text[pos] == '0') {
		pos++;
	} else if (is_digit(text[pos])) {
		while (pos < text.size() && is_digit(text[pos])) {
			pos++;
		}
	} else {
		return std::nullopt;
	}

	if (pos < text.size() && text[pos] == '.') {
		pos++;
		if (pos >= text.size() || !is_digit(text[pos])) {
			return std::nullopt;
		}
		while (pos < text.size() && is_digit(text[pos])) {
			pos++;
		}
	}

	if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
		pos++;
		if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
			pos++;
		}
		if (pos >= text.size() || !is_digit(text[pos])) {
			return std::nullopt;
		}
		while (pos < text.size() && is_digit(text[pos])) {
			pos++;
		}
	}
	return pos;
}

std::optional<std::size_t> skip_literal(std::string_view text, std::size_t pos,
										std::string_view literal) {
	if (text.substr(pos, literal.size()) != literal) {
		return std::nullopt;
	}
	return pos + literal.size();
}

std::optional<std::size_t> skip_value_at(std::string_view text, std::size_t pos, int depth);

std::optional<std::size_t> skip_container(std::string_view text, std::size_t pos, int depth,
										  bool is_object_container) {
	const char close = is_object_container ? '}' : ']';
	pos = skip_ws(text, pos + 1);
	if (pos < text.size() && text[pos] == close) {
		return pos + 1;
	}

	while (pos < text.size()) {
		if (is_object_container) {
			if (text[pos] != '"') {
				return std::nullopt;
			}
			std::optional<std::size_t> key_end = skip_string(text, pos);
			if (!key_end) {
				return std::nullopt;
			}
			pos = skip_ws(text, *key_end);
			if (pos >= text.size() || text[pos] != ':') {
				return std::nullopt;
			}
			pos++;
		}

		std::optional<std::size_t> value_end = skip_value_at(text, pos, depth + 1);
		if (!value_end) {
			return std::nullopt;
		}
		pos = skip_ws(text, *value_end);
		if (pos >= text.size()) {
			return std::nullopt;
		}
		if (text[pos] == close) {
			return pos + 1;
		}
		if (text[pos] != ',') {
			return std::nullopt;
		}
		pos = skip_ws(text, pos + 1);
	}
	return std::nullopt;
}

std::optional<std::size_t> skip_value_at(std::string_view text, std::size_t pos, int depth) {
	if (depth > kMaxDepth) {
		return std::nullopt;
	}
	pos = skip_ws(text, pos);
	if (pos >= text.size()) {
		return std::nullopt;
	}

	switch (text[pos]) {
		case '{':
			return skip_container(text, pos, depth, true);
		case '[':
			return skip_container(text, pos, depth, false);
		case '"':
			return skip_string(text, pos);
		case 't':
			return skip_literal(text, pos, "true");
		case 'f':
			return skip_literal(text, pos, "false");
		case 'n':
			return skip_literal(text, pos, "null");
		default:
			return skip_number(text, pos);
	}
}

void append_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out.push_back(static_cast<char>(cp));
	} else if (cp < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
}

std::uint32_t parse_hex4(std::string_view text, std::size_t pos) {
	std::uint32_t value = 0;
	std::from_chars(text.data() + pos, text.data() + pos + 4, value, 16);
	return value;
}

} // namespace

std::optional<std::size_t> skip_value(std::string_view text, std::size_t pos) {
	return skip_value_at(text, pos, 0);
}

bool is_valid(std::string_view text) {
	std::optional<std::size_t> end = skip_value(text, 0);
	return end && skip_ws(text, *end) == text.size();
}

bool is_object(std::string_view text) {
	std::size_t start = skip_ws(text, 0);
	return start < text.size() && text[start] == '{' && is_valid(text);
}

std::optional<std::string_view> member(std::string_view object, std::string_view key) {
	std::size_t pos = skip_ws(object, 0);
	if (pos >= object.size() || object[pos] != '{') {
		return std::nullopt;
	}
	pos = skip_ws(object, pos + 1);

	while (pos < object.size() && object[pos] == '"') {
		std::optional<std::size_t> key_end = skip_string(object, pos);
		if (!key_end) {
			return std::nullopt;
		}
		std::optional<std::string> name = as_string(object.substr(pos, *key_end - pos));

		pos = skip_ws(object, *key_end);
		if (pos >= object.size() || object[pos] != ':') {
			return std::nullopt;
		}
		std::size_t value_start = skip_ws(object, pos + 1);
		std::optional<std::size_t> value_end = skip_value(object, value_start);
		if (!value_end) {
			return std::nullopt;
		}
		if (name && *name == key) {
			return object.substr(value_start, *value_end - value_start);
		}

		pos = skip_ws(object, *value_end);
		if (pos >= object.size() || object[pos] != ',') {
			return std::nullopt;
		}
		pos = skip_ws(object, pos + 1);
	}
	return std::nullopt;
}

std::optional<std::vector<std::string_view>> elements(std::string_view array) {
	std::size_t pos = skip_ws(array, 0);
	if (pos >= array.size() || array[pos] != '[') {
		return std::nullopt;
	}

	std::vector<std::string_view> items;
	pos = skip_ws(array, pos + 1);
	if (pos < array.size() && array[pos] == ']') {
		return items;
	}

	while (pos < array.size()) {
		std::optional<std::size_t> end = skip_value(array, pos);
		if (!end) {
			return std::nullopt;
		}
		items.push_back(array.substr(pos, *end - pos));

		pos = skip_ws(array, *end);
		if (pos >= array.size()) {
			return std::nullopt;
		}
		if (array[pos] == ']') {
			return items;
		}
		if (array[pos] != ',') {
			return std::nullopt;
		}
		pos = skip_ws(array, pos + 1);
	}
	return std::nullopt;
}

std::optional<std::string> as_string(std::string_view raw) {
	if (raw.empty() || raw.front() != '"') {
		return std::nullopt;
	}
	std::optional<std::size_t> end = skip_string(raw, 0);
	if (!end || *end != raw.size()) {
		return std::nullopt;
	}

	std::string out;
	out.reserve(raw.size() - 2);
	for (std::size_t pos = 1; pos + 1 < raw.size(); ++pos) {
		char c = raw[pos];
		if (c != '\\') {
			out.push_back(c);
			continue;
		}
		char esc = raw[++pos];
		switch (esc) {
			case 'b':
				out.push_back('\b');
				break;
			case 'f':
				out.push_back('\f');
				break;
			case 'n':
				out.push_back('\n');
				break;
			case 'r':
				out.push_back('\r');
				break;
			case 't':
				out.push_back('\t');
				break;
			case 'u': {
				std::uint32_t cp = parse_hex4(raw, pos + 1);
				pos += 4;
				// Surrogate pair
				if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < raw.size() && raw[pos + 1] == '\\' &&
					raw[pos + 2] == 'u') {
					std::uint32_t low = parse_hex4(raw, pos + 3);
					if (low >= 0xDC00 && low <= 0xDFFF) {
						cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
						pos += 6;
					}
				}
				append_utf8(out, cp);
				break;
			}
			default:
				out.push_back(esc); // '"', '\\' and '/'
				break;
		}
	}
	return out;
}

std::optional<std::int64_t> as_int(std::string_view raw) {
	if (raw.empty()) {
		return std::nullopt;
	}
	std::int64_t value = 0;
	std::from_chars_result res = std::from_chars(raw.data(), raw.data() + raw.size(), value);
	if (res.ec != std::errc{} || res.ptr != raw.data() + raw.size()) {
		return std::nullopt;
	}
	return value;
}

std::optional<bool> as_bool(std::string_view raw) {
	if (raw == "true") {
		return true;
	}
	if (raw == "false") {
		return false;
	}
	return std::nullopt;
}

std::optional<std::string> get_string(std::string_view object, std::string_view key) {
	std::optional<std::string_view> raw = member(object, key);
	return raw ? as_string(*raw) : std::nullopt;
}

std::optional<std::int64_t> get_int(std::string_view object, std::string_view key) {
	std::optional<std::string_view> raw = member(object, key);
	return raw ? as_int(*raw) : std::nullopt;
}

std::optional<bool> get_bool(std::string_view object, std::string_view key) {
	std::optional<std::string_view> raw = member(object, key);
	return raw ? as_bool(*raw) : std::nullopt;
}

std::string quote(std::string_view value) {
	std::string out;
	out.reserve(value.size() + 2);
	out.push_back('"');
	for (char c : value) {
		switch (c) {
			case '"':
				out += "\\\"";
				break;
			case '\\':
				out += "\\\\";
				break;
			case '\n':
				out += "\\n";
				break;
			case '\r':
				out += "\\r";
				break;
			case '\t':
				out += "\\t";
				break;
			case '\b':
				out += "\\b";
				break;
			case '\f':
				out += "\\f";
				break;
			default:
				if (static_cast<unsigned char>(c) < 0x20) {
					char buf[8];
					std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
					out += buf;
				} else {
					out.push_back(c);
				}
				break;
		}
	}
	out.push_back('"');
	return out;
}

std::string string_array(const std::vector<std::string>& values) {
	std::string out = "[";
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (i > 0) {
			out += ",";
		}
		out += quote(values[i]);
	}
	out += "]";
	return out;
}

} // namespace marketlink::json
