#include "onnx_module.h"

#include <stdexcept>

namespace {

void get_node_names(
    Ort::Session& session,
    bool is_input,
    std::vector<Ort::AllocatedStringPtr>& names_ptrs,
    std::vector<const char*>& names
) {
    Ort::AllocatorWithDefaultOptions allocator;
    size_t num_nodes = is_input ? session.GetInputCount() : session.GetOutputCount();

    for (size_t i = 0; i < num_nodes; i++) {
        auto name_ptr = is_input ?
            session.GetInputNameAllocated(i, allocator) :
            session.GetOutputNameAllocated(i, allocator);
        names_ptrs.push_back(std::move(name_ptr));
        names.push_back(names_ptrs.back().get());
    }
}

}  // namespace

SubNet::SubNet(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& model_path) {
    try {
        session = std::make_unique<Ort::Session>(env, model_path.c_str(), session_options);
    } catch (const Ort::Exception& e) {
        throw std::runtime_error("Error loading model " + model_path + ": " + e.what());
    }

    get_node_names(*session, true, input_names_ptrs, input_names);
    get_node_names(*session, false, output_names_ptrs, output_names);

    if (input_names.size() != 1 || output_names.empty()) {
        throw std::runtime_error("Model " + model_path + " must have one input and at least one output");
    }
}

std::vector<Ort::Value> SubNet::forward(Ort::Value& input_tensor) const {
    return session->Run(
        Ort::RunOptions{nullptr},
        input_names.data(),
        &input_tensor,
        input_names.size(),
        output_names.data(),
        output_names.size()
    );
}
