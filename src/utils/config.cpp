#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    // Database defaults
    db_host = "localhost";
    db_port = 5432;
    db_name = "rollcall";
    db_user = "rollcall";
    db_password = "rollcall";
    db_connect_timeout_s = 5;

    storage_backend = "postgres";
    roster_file = "";

    // Matching defaults
    match_threshold = 0.6f;
    top_k = 5;
    embedding_dim = 512;
    registry_timeout_ms = 3000;
    registry_retries = 2;
    registry_backoff_ms = 200;
    worker_threads = 0;

    // Detector defaults
    detector_model_path = "./models/face_detection_yunet_2023mar.onnx";
    detector_score_threshold = 0.7f;
    detector_nms_threshold = 0.3f;
    detector_top_k = 5000;

    // Embedding defaults
    embedding_model_path = "./models/inception.onnx";
    embedding_input_size = 160;
    face_margin = 0;

    // Quality thresholds
    quality_check = true;
    blur_threshold = 100.0f;
    min_face_size = 60.0f;
    dark_ratio_threshold = 0.4f;
    bright_ratio_threshold = 0.3f;
    quality_threshold = 0.5f;

    // Server defaults
    server_host = "0.0.0.0";
    server_port = 8764;
}

std::string Config::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void Config::parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open config file: " << filename << std::endl;
        std::cerr << "Using default configuration." << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            configMap[key] = value;
        }
    }
}

std::string Config::getValue(const std::string& key, const std::string& defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        return it->second;
    }
    return defaultValue;
}

int Config::getValueInt(const std::string& key, int defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        try {
            size_t used = 0;
            int value = std::stoi(it->second, &used);
            if (used == it->second.size()) {
                return value;
            }
        } catch (const std::exception&) {
        }
        std::cerr << "Warning: Invalid integer value for " << key << std::endl;
    }
    return defaultValue;
}

float Config::getValueFloat(const std::string& key, float defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        try {
            size_t used = 0;
            float value = std::stof(it->second, &used);
            if (used == it->second.size()) {
                return value;
            }
        } catch (const std::exception&) {
        }
        std::cerr << "Warning: Invalid float value for " << key << std::endl;
    }
    return defaultValue;
}

bool Config::getValueBool(const std::string& key, bool defaultValue) {
    auto it = configMap.find(key);
    if (it == configMap.end()) {
        return defaultValue;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    std::cerr << "Warning: Invalid boolean value for " << key << std::endl;
    return defaultValue;
}

bool Config::load(const std::string& filename) {
    parseFile(filename);

    db_host = getValue("db_host", db_host);
    db_port = getValueInt("db_port", db_port);
    db_name = getValue("db_name", db_name);
    db_user = getValue("db_user", db_user);
    db_password = getValue("db_password", db_password);
    db_connect_timeout_s = getValueInt("db_connect_timeout_s", db_connect_timeout_s);

    storage_backend = getValue("storage_backend", storage_backend);
    roster_file = getValue("roster_file", roster_file);

    match_threshold = getValueFloat("match_threshold", match_threshold);
    top_k = getValueInt("top_k", top_k);
    embedding_dim = getValueInt("embedding_dim", embedding_dim);
    registry_timeout_ms = getValueInt("registry_timeout_ms", registry_timeout_ms);
    registry_retries = getValueInt("registry_retries", registry_retries);
    registry_backoff_ms = getValueInt("registry_backoff_ms", registry_backoff_ms);
    worker_threads = getValueInt("worker_threads", worker_threads);

    detector_model_path = getValue("detector_model_path", detector_model_path);
    detector_score_threshold = getValueFloat("detector_score_threshold", detector_score_threshold);
    detector_nms_threshold = getValueFloat("detector_nms_threshold", detector_nms_threshold);
    detector_top_k = getValueInt("detector_top_k", detector_top_k);

    embedding_model_path = getValue("embedding_model_path", embedding_model_path);
    embedding_input_size = getValueInt("embedding_input_size", embedding_input_size);
    face_margin = getValueInt("face_margin", face_margin);

    quality_check = getValueBool("quality_check", quality_check);
    blur_threshold = getValueFloat("blur_threshold", blur_threshold);
    min_face_size = getValueFloat("min_face_size", min_face_size);
    dark_ratio_threshold = getValueFloat("dark_ratio_threshold", dark_ratio_threshold);
    bright_ratio_threshold = getValueFloat("bright_ratio_threshold", bright_ratio_threshold);
    quality_threshold = getValueFloat("quality_threshold", quality_threshold);

    server_host = getValue("server_host", server_host);
    server_port = getValueInt("server_port", server_port);

    std::vector<std::string> problems = validate();
    for (const auto& p : problems) {
        std::cerr << "Config error: " << p << std::endl;
    }
    if (!problems.empty()) {
        return false;
    }

    std::cout << "Configuration loaded successfully" << std::endl;
    std::cout << "Storage: " << storage_backend;
    if (storage_backend == "postgres") {
        std::cout << " (" << db_host << ":" << db_port << "/" << db_name << ")";
    }
    std::cout << std::endl;
    std::cout << "Match threshold: " << match_threshold << ", top_k: " << top_k
              << ", registry timeout: " << registry_timeout_ms << " ms" << std::endl;

    return true;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    if (!isUnitInterval(match_threshold)) {
        problems.push_back("match_threshold must be within [0, 1]");
    }
    if (top_k < 1) {
        problems.push_back("top_k must be at least 1");
    }
    if (embedding_dim < 1) {
        problems.push_back("embedding_dim must be at least 1");
    }
    if (registry_timeout_ms < 1) {
        problems.push_back("registry_timeout_ms must be positive");
    }
    if (registry_retries < 0) {
        problems.push_back("registry_retries must not be negative");
    }
    if (registry_backoff_ms < 0) {
        problems.push_back("registry_backoff_ms must not be negative");
    }
    if (worker_threads < 0) {
        problems.push_back("worker_threads must not be negative");
    }
    if (embedding_input_size < 1) {
        problems.push_back("embedding_input_size must be positive");
    }
    if (storage_backend != "postgres" && storage_backend != "memory") {
        problems.push_back("storage_backend must be 'postgres' or 'memory'");
    }
    if (server_port < 1 || server_port > 65535) {
        problems.push_back("server_port must be within [1, 65535]");
    }
    return problems;
}

std::string Config::connectionString() const {
    return "host=" + db_host +
           " port=" + std::to_string(db_port) +
           " dbname=" + db_name +
           " user=" + db_user +
           " password=" + db_password +
           " connect_timeout=" + std::to_string(db_connect_timeout_s) +
           " options='-c statement_timeout=" + std::to_string(registry_timeout_ms) + "'";
}
