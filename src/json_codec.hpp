#pragma once

#include "protocol.hpp"

#include <string>

namespace modelbridge::codec {

/// Serializes @p value; invalid UTF-8 in strings is replaced instead of throwing.
std::string to_text(const json& value);

CommandEnvelope decode_envelope(const std::string& bytes);
std::string encode_envelope(const CommandEnvelope& envelope);

json result_to_json(const CommandResult& result);
std::string encode_result(const CommandResult& result);
CommandResult decode_result(const std::string& bytes);

const json* find_key(const json& map_obj, const std::string& key);
std::string as_string(const json& obj, const std::string& fallback = "");
int64_t as_int64(const json& obj, int64_t fallback = 0);
bool as_bool(const json& obj, bool fallback = false);
double as_double(const json& obj, double fallback = 0.0);

/// Shortens a payload for log output.
std::string truncate_for_log(const std::string& text, size_t max_len = 100);

} // namespace modelbridge::codec
