#pragma once

#include <onnxruntime_cxx_api.h>
#include <memory>
#include <vector>
#include <string>

// One ONNX Runtime session with its input/output node names resolved.
// Session::Run is safe to call from several threads at once.
class SubNet {
    public:
        SubNet(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& model_path);
        std::vector<Ort::Value> forward(Ort::Value& input_tensor) const;
        size_t inputCount() const { return input_names.size(); }
        size_t outputCount() const { return output_names.size(); }

    private:
        std::unique_ptr<Ort::Session> session;
        std::vector<Ort::AllocatedStringPtr> input_names_ptrs;
        std::vector<Ort::AllocatedStringPtr> output_names_ptrs;
        std::vector<const char*> input_names;
        std::vector<const char*> output_names;
};
