#pragma once

#include <cmath>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// pgvector text form: "[v1,v2,...]".
inline std::string vec2pgvector(const std::vector<float>& vec) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.precision(9);
    oss << "[";
    for (size_t i = 0; i < vec.size(); ++i) {
        if (!std::isfinite(vec[i])) {
            throw std::invalid_argument("pgvector values must be finite");
        }
        if (i > 0) oss << ",";
        oss << vec[i];
    }
    oss << "]";
    return oss.str();
}

inline std::vector<float> pgvector2vec(const std::string& vec) {
    if (vec.size() < 2 || vec.front() != '[' || vec.back() != ']') {
        throw std::invalid_argument("Malformed pgvector: " + vec);
    }
    std::string clean_vec = vec.substr(1, vec.size() - 2);
    std::vector<float> result;
    if (clean_vec.empty()) {
        return result;
    }
    std::istringstream iss(clean_vec);
    iss.imbue(std::locale::classic());
    std::string token;
    while (std::getline(iss, token, ',')) {
        std::istringstream value_stream(token);
        value_stream.imbue(std::locale::classic());
        float value = 0.0f;
        value_stream >> value;
        if (value_stream.fail()) {
            throw std::invalid_argument("Malformed pgvector element: " + token);
        }
        value_stream >> std::ws;
        if (!value_stream.eof()) {
            throw std::invalid_argument("Malformed pgvector element: " + token);
        }
        result.push_back(value);
    }
    if (clean_vec.back() == ',') {
        throw std::invalid_argument("Malformed pgvector: trailing comma");
    }
    return result;
}
