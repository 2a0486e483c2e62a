#pragma once

#include <eosio/eosio.hpp>
#include <eosio/crypto.hpp>
#include <eosio/print.hpp>

#include <array>
#include <string>
#include <string_view>

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

#define TRANSFER(bank, to, quantity, memo) \
    {   eosio::token::transfer_action transfer_act{ bank, { {_self, active_perm} } };\
        transfer_act.send( _self, to, quantity, memo ); }

#define WASM_FUNCTION_PRINT_LENGTH 50

#define RDN_LOG( debug, ... ) {                 \
if ( debug ) {                                  \
   std::string str = std::string(__FILE__);     \
   str += std::string(":");                     \
   str += std::to_string(__LINE__);             \
   str += std::string(":[");                    \
   str += std::string(__FUNCTION__);            \
   str += std::string("]");                     \
   while(str.size() <= WASM_FUNCTION_PRINT_LENGTH) str += std::string(" ");\
   eosio::print(str);                                                      \
   eosio::print( __VA_ARGS__ ); }}

namespace rdn {

using std::string;
using std::string_view;

inline bool starts_with(string_view sv, string_view s) {
    return sv.size() >= s.size() && sv.compare(0, s.size(), s) == 0;
}

inline string to_hex(const eosio::checksum256& hash) {
    static const char* digits = "0123456789abcdef";

    auto bytes = hash.extract_as_byte_array();
    string hex;
    hex.reserve( bytes.size() * 2 );
    for (auto b : bytes) {
        hex += digits[b >> 4];
        hex += digits[b & 0x0f];
    }
    return hex;
}

inline bool hex_digit(char c, uint8_t& out) {
    if (c >= '0' && c <= '9') { out = c - '0';      return true; }
    if (c >= 'a' && c <= 'f') { out = c - 'a' + 10; return true; }
    if (c >= 'A' && c <= 'F') { out = c - 'A' + 10; return true; }
    return false;
}

/**
 *  parse 64 hex chars into a checksum256, false on any malformed input
 */
inline bool hex_to_checksum256(string_view hex, eosio::checksum256& out) {
    std::array<uint8_t, 32> bytes;
    if (hex.size() != bytes.size() * 2) return false;

    for (size_t i = 0; i < bytes.size(); i++) {
        uint8_t hi, lo;
        if (!hex_digit(hex[2 * i], hi) || !hex_digit(hex[2 * i + 1], lo))
            return false;
        bytes[i] = (hi << 4) | lo;
    }
    out = eosio::checksum256(bytes);
    return true;
}

} //rdn namespace
