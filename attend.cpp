#include <fstream>
#include <iostream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>

#include "src/dnn/annotate.hpp"
#include "src/recognizer/engine_factory.hpp"
#include "src/utils/config.hpp"
#include "src/utils/date_utils.hpp"

//// ./build/rollcall_attend CS101 ./data/class.jpg --annotate ./data/class_marked.jpg

static void usage(const char* program) {
    std::cerr << "Usage: " << program << " <class_id> <image_path> [--date YYYY-MM-DD] [--marked-by USER]"
              << " [--threshold T] [--annotate out.jpg] [--config config.ini]" << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    SessionContext session;
    session.class_id = argv[1];
    std::string image_path = argv[2];
    std::string annotate_path;
    std::string config_path = "config.ini";
    std::string threshold_arg;
    session.date = currentDate();

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            usage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--date") {
            session.date = value;
        } else if (arg == "--marked-by") {
            session.marked_by = value;
        } else if (arg == "--threshold") {
            threshold_arg = value;
        } else if (arg == "--annotate") {
            annotate_path = value;
        } else if (arg == "--config") {
            config_path = value;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (!isValidDate(session.date)) {
        std::cerr << "Invalid date: " << session.date << std::endl;
        return 1;
    }

    Config config;
    if (!config.load(config_path)) {
        return 1;
    }

    session.threshold = config.match_threshold;
    if (!threshold_arg.empty()) {
        try {
            size_t used = 0;
            session.threshold = std::stof(threshold_arg, &used);
            if (used != threshold_arg.size()) {
                throw std::invalid_argument(threshold_arg);
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid threshold: " << threshold_arg << std::endl;
            return 1;
        }
        if (!isUnitInterval(session.threshold)) {
            std::cerr << "Threshold must be within [0, 1]" << std::endl;
            return 1;
        }
    }

    std::ifstream file(image_path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open image: " << image_path << std::endl;
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    try {
        std::shared_ptr<AttendanceEngine> engine = buildEngine(config);
        SubmissionResult result = engine->submit(bytes, session);

        nlohmann::json output = result;
        std::cout << output.dump(2) << std::endl;

        if (!annotate_path.empty() && result.success) {
            cv::Mat image = decodeImage(bytes);
            cv::Mat marked = drawFaceResolutions(image, result.faces);
            if (!cv::imwrite(annotate_path, marked)) {
                std::cerr << "Failed to write annotated image: " << annotate_path << std::endl;
                return 1;
            }
            std::cout << "Annotated image written to " << annotate_path << std::endl;
        }
        return result.success ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
