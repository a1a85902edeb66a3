#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

namespace {
int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}

bool bytes_from_hex(std::string_view hex, std::vector<unsigned char>& out){
    if(hex.size() % 2 != 0) return false;
    out.clear();
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if(hi < 0 || lo < 0) return false;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    return sha256_bytes(data.data(), data.size());
}

std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data), size, out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string base64_encode(const char* data, std::size_t size){
    if(size == 0) return {};
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data),
                                  static_cast<int>(size));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

bool base64_decode(const std::string& encoded, std::vector<char>& out){
    out.clear();
    if(encoded.empty()) return true;
    if(encoded.size() % 4 != 0) return false;
    out.resize(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(written < 0) return false;
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if(encoded[encoded.size() - 1] == '=') ++padding;
    if(encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return true;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string format_size(uint64_t bytes){
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) oss << bytes << " " << units[unit];
    else oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}

namespace {
// Length of the valid UTF-8 sequence starting at text[i], 0 when invalid.
std::size_t utf8_sequence_length(std::string_view text, std::size_t i){
    auto byte = [&](std::size_t k){ return static_cast<unsigned char>(text[k]); };
    unsigned char lead = byte(i);
    if(lead < 0x80) return 1;
    std::size_t length = 0;
    unsigned char low = 0x80, high = 0xBF;
    if(lead >= 0xC2 && lead <= 0xDF) length = 2;
    else if(lead >= 0xE0 && lead <= 0xEF){
        length = 3;
        if(lead == 0xE0) low = 0xA0;
        if(lead == 0xED) high = 0x9F;
    } else if(lead >= 0xF0 && lead <= 0xF4){
        length = 4;
        if(lead == 0xF0) low = 0x90;
        if(lead == 0xF4) high = 0x8F;
    } else {
        return 0;
    }
    if(i + length > text.size()) return 0;
    if(byte(i + 1) < low || byte(i + 1) > high) return 0;
    for(std::size_t k = 2; k < length; ++k){
        if(byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return length;
}
}

bool is_valid_utf8(std::string_view text){
    for(std::size_t i = 0; i < text.size();){
        std::size_t length = utf8_sequence_length(text, i);
        if(length == 0) return false;
        i += length;
    }
    return true;
}

std::string escape_invalid_utf8(std::string_view text){
    std::string out;
    out.reserve(text.size());
    for(std::size_t i = 0; i < text.size();){
        std::size_t length = utf8_sequence_length(text, i);
        if(length == 0){
            static const char digits[] = "0123456789abcdef";
            unsigned char value = static_cast<unsigned char>(text[i]);
            out += "\\x";
            out += digits[value >> 4];
            out += digits[value & 0x0F];
            ++i;
            continue;
        }
        out.append(text.substr(i, length));
        i += length;
    }
    return out;
}

bool split_host_port(const std::string& address, std::string& host, uint16_t& port){
    auto pos = address.rfind(':');
    if(pos == std::string::npos || pos == 0 || pos + 1 >= address.size()) return false;
    try {
        int value = std::stoi(address.substr(pos + 1));
        if(value <= 0 || value > 65535) return false;
        host = address.substr(0, pos);
        port = static_cast<uint16_t>(value);
        return true;
    } catch(const std::exception&) {
        return false;
    }
}
