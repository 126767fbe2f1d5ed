#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <map>
#include <vector>

// False for NaN as well as for values outside [0, 1].
inline bool isUnitInterval(float value) {
    return value >= 0.0f && value <= 1.0f;
}

class Config {
public:
    // Database configuration
    std::string db_host;
    int db_port;
    std::string db_name;
    std::string db_user;
    std::string db_password;
    int db_connect_timeout_s;

    // "postgres" or "memory"
    std::string storage_backend;
    // class_id,identity_id lines seeding the in-memory rosters
    std::string roster_file;

    // Matching settings
    float match_threshold;
    int top_k;
    int embedding_dim;
    int registry_timeout_ms;
    int registry_retries;
    int registry_backoff_ms;
    int worker_threads;

    // Detector settings
    std::string detector_model_path;
    float detector_score_threshold;
    float detector_nms_threshold;
    int detector_top_k;

    // Embedding settings
    std::string embedding_model_path;
    int embedding_input_size;
    int face_margin;

    // Enrollment quality thresholds
    bool quality_check;
    float blur_threshold;
    float min_face_size;
    float dark_ratio_threshold;
    float bright_ratio_threshold;
    float quality_threshold;

    // Server settings
    std::string server_host;
    int server_port;

    Config();
    bool load(const std::string& filename);
    void setDefaults();

    // Human-readable problems with the current values; empty when valid.
    std::vector<std::string> validate() const;

    // libpq connection string built from the db_* values.
    std::string connectionString() const;

private:
    std::map<std::string, std::string> configMap;
    void parseFile(const std::string& filename);
    std::string trim(const std::string& str);
    std::string getValue(const std::string& key, const std::string& defaultValue);
    int getValueInt(const std::string& key, int defaultValue);
    float getValueFloat(const std::string& key, float defaultValue);
    bool getValueBool(const std::string& key, bool defaultValue);
};

#endif // CONFIG_HPP
