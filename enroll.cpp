#include <iostream>
#include <opencv2/imgcodecs.hpp>

#include "src/recognizer/engine_factory.hpp"
#include "src/utils/config.hpp"

//// ./build/rollcall_enroll s-1024 ./data/s-1024.jpg

int main(int argc, char **argv) {
    if (argc != 3 && argc != 5) {
        std::cerr << "Usage: " << argv[0] << " <identity_id> <image_path> [--config config.ini]" << std::endl;
        return 1;
    }
    std::string identity_id = argv[1];
    std::string image_path = argv[2];
    std::string config_path = "config.ini";
    if (argc == 5) {
        if (std::string(argv[3]) != "--config") {
            std::cerr << "Unknown option: " << argv[3] << std::endl;
            return 1;
        }
        config_path = argv[4];
    }

    cv::Mat img = cv::imread(image_path);
    if (img.empty()) {
        std::cerr << "Failed to load image" << std::endl;
        return 1;
    }

    Config config;
    if (!config.load(config_path)) {
        return 1;
    }
    if (config.storage_backend == "memory") {
        std::cerr << "Warning: memory backend selected, the signature is discarded on exit" << std::endl;
    }

    try {
        std::shared_ptr<AttendanceEngine> engine = buildEngine(config);
        EnrollmentResult result = engine->enrollImage(identity_id, img);
        if (result.success) {
            std::cout << "Face enrolled successfully: " << identity_id
                      << (result.replaced ? " (previous signature replaced)" : "") << std::endl;
            return 0;
        }
        std::cerr << "Failed to enroll face [" << result.error << "]: " << result.message << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
