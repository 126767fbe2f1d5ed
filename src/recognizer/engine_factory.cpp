#include "engine_factory.hpp"
#include "../attendance/memory_store.hpp"
#include "../dnn/onnx_embedder.hpp"
#include "../dnn/yunet_detector.hpp"
#include "../postgres/pg_registry.hpp"
#include "../postgres/pg_store.hpp"
#include "../registry/memory_registry.hpp"
#include "../utils/config.hpp"

#include <iostream>

std::shared_ptr<AttendanceEngine> buildEngine(const Config& config) {
    size_t dimension = static_cast<size_t>(config.embedding_dim);

    std::cout << "Loading face detector: " << config.detector_model_path << std::endl;
    auto detector = std::make_shared<YuNetFaceDetector>(config.detector_model_path,
                                                        config.detector_score_threshold,
                                                        config.detector_nms_threshold,
                                                        config.detector_top_k);

    std::cout << "Loading embedding model: " << config.embedding_model_path << std::endl;
    auto embedder = std::make_shared<OnnxFaceEmbedder>(config.embedding_model_path, dimension,
                                                       config.embedding_input_size, config.face_margin);

    std::shared_ptr<SignatureRegistry> registry;
    std::shared_ptr<AttendanceStore> store;
    if (config.storage_backend == "memory") {
        registry = std::make_shared<MemorySignatureRegistry>(dimension);
        auto memory_store = std::make_shared<MemoryAttendanceStore>();
        if (!config.roster_file.empty()) {
            size_t entries = memory_store->loadRosterFile(config.roster_file);
            std::cout << "Loaded " << entries << " roster entries from " << config.roster_file << std::endl;
        }
        store = memory_store;
        std::cout << "Using in-memory registry and attendance store" << std::endl;
    } else {
        auto db = std::make_shared<Postgres>(config.connectionString());
        db->ensure_schema(dimension);
        registry = std::make_shared<PgSignatureRegistry>(db, dimension);
        store = std::make_shared<PgAttendanceStore>(db);
    }

    auto quality = std::make_unique<FaceQuality>(config.blur_threshold,
                                                 config.min_face_size,
                                                 config.dark_ratio_threshold,
                                                 config.bright_ratio_threshold,
                                                 config.quality_threshold);

    return std::make_shared<AttendanceEngine>(detector, embedder, registry, store,
                                              engineSettingsFromConfig(config), std::move(quality));
}
