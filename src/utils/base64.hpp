#ifndef BASE64_HPP
#define BASE64_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

class Base64 {
public:
    // Decodes standard base64, optionally behind a "data:<mime>;base64,"
    // prefix. Whitespace is ignored. Returns an empty vector when the input
    // holds characters outside the alphabet or is truncated.
    static std::vector<uint8_t> decode(const std::string& encoded_string) {
        static const std::string base64_chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "abcdefghijklmnopqrstuvwxyz"
            "0123456789+/";

        std::string encoded = encoded_string;

        // Remove data URL prefix if present
        size_t comma_pos = encoded.find(',');
        if (comma_pos != std::string::npos && encoded.compare(0, 5, "data:") == 0) {
            encoded = encoded.substr(comma_pos + 1);
        }

        encoded.erase(std::remove_if(encoded.begin(), encoded.end(),
                                     [](unsigned char c) { return std::isspace(c); }),
                      encoded.end());

        size_t padding = 0;
        while (!encoded.empty() && encoded.back() == '=' && padding < 2) {
            encoded.pop_back();
            ++padding;
        }
        if (encoded.size() % 4 == 1 || (padding > 0 && (encoded.size() + padding) % 4 != 0)) {
            return {};
        }

        std::vector<int> T(256, -1);
        for (int i = 0; i < 64; i++) T[static_cast<unsigned char>(base64_chars[i])] = i;

        std::vector<uint8_t> decoded;
        decoded.reserve(encoded.size() * 3 / 4);
        int val = 0, valb = -8;
        for (unsigned char c : encoded) {
            if (T[c] == -1) {
                return {};
            }
            val = (val << 6) + T[c];
            valb += 6;
            if (valb >= 0) {
                decoded.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }

        return decoded;
    }
};

#endif // BASE64_HPP
