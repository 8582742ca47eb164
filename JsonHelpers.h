#pragma once

#include <string>

// Looks up a member of the top-level JSON object and returns its raw text
// (strings keep their quotes, objects keep their braces).
bool FindMember(const std::string& json, const std::string& key, std::string& rawValue);

// Reads a top-level string member, unescaping it.
bool GetStringMember(const std::string& json, const std::string& key, std::string& value);

// Reads a top-level object member as raw JSON text.
bool GetObjectMember(const std::string& json, const std::string& key, std::string& objectJson);

// Returns a top-level member rendered as plain text: strings unquoted,
// numbers and literals as written. Empty when the member is absent or null.
std::string GetMemberText(const std::string& json, const std::string& key);

// Returns the first string value stored under the key at any depth, or empty.
std::string FindStringFieldAnywhere(const std::string& json, const std::string& key);

// Escapes a value for embedding inside a JSON string literal.
std::string EscapeJsonString(const std::string& value);
