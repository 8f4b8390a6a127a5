// Minimal JSON string handling for the Ollama request and response bodies.
#pragma once
#include <string>

namespace autobuilder::ai {

// Escapes text for use inside a JSON string literal; control characters become \u00XX.
std::string escape_json(const std::string& in);

// First "key":"..." string value in body, unescaped (\uXXXX and surrogate pairs become
// UTF-8). found is false when the key is absent or its value is not a terminated string.
std::string extract_string_field(const std::string& body, const std::string& key, bool& found);

// First "key":<digits> value, or -1 when absent or longer than 9 digits.
int extract_int_field(const std::string& body, const std::string& key);

} // namespace autobuilder::ai
