#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Standard base64 with padding.
std::string Base64Encode(const std::uint8_t* data, size_t size);
std::string Base64Encode(const std::string& text);

std::string ToLowerAscii(const std::string& value);

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

// Returns the text of the first <name>...</name> element, or empty.
std::string ExtractXmlElement(const std::string& xml, const std::string& name);

// Returns the trimmed value of the first header with the given name
// (case-insensitive) in an HTTP-style message, or empty.
std::string GetHttpHeaderValue(const std::string& message, const std::string& name);
