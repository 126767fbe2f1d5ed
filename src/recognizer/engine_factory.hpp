#pragma once

#include <memory>

#include "attendance_engine.hpp"

class Config;

// Builds the engine with the YuNet detector, the ONNX embedder and the
// storage backend named by config.storage_backend. Throws on model or
// database setup failure.
std::shared_ptr<AttendanceEngine> buildEngine(const Config& config);
