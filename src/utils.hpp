#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string hex_from_bytes(const unsigned char* data, std::size_t size);
bool bytes_from_hex(std::string_view hex, std::vector<unsigned char>& out);

std::vector<unsigned char> sha256_bytes(const std::string& data);
std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size);
std::string sha256_hex(const std::string& data);

std::string base64_encode(const char* data, std::size_t size);
bool base64_decode(const std::string& encoded, std::vector<char>& out);

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
std::string format_size(uint64_t bytes);

// Strict UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool is_valid_utf8(std::string_view text);
// Copy with every byte outside a valid UTF-8 sequence written as \xNN.
std::string escape_invalid_utf8(std::string_view text);

// "host:port" -> (host, port). False when the port is missing or out of range.
bool split_host_port(const std::string& address, std::string& host, uint16_t& port);
