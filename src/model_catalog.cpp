#include "model_catalog.h"
#include "error.h"

#include <filesystem>
#include <utility>

namespace voiceclip {

const std::vector<ModelInfo> &model_catalog() {
    static const std::vector<ModelInfo> catalog = {
        {"Large V3 (Best Quality)", "ggml-large-v3.bin", "~3GB", "Slower"},
        {"Medium (Balanced)", "ggml-medium.bin", "~1.5GB", "Medium"},
        {"Base (Fast)", "ggml-base.bin", "~142MB", "Fast"},
        {"Tiny (Fastest)", "ggml-tiny.bin", "~75MB", "Fastest"},
    };
    return catalog;
}

const ModelInfo *find_model(const std::string &name) {
    for (const auto &model : model_catalog()) {
        if (model.name == name) return &model;
    }
    return nullptr;
}

ModelSelection::ModelSelection(std::string models_dir,
                               const std::string &initial_model)
    : models_dir_(std::move(models_dir)), current_(find_model(initial_model)) {
    if (current_ == nullptr) {
        g_warning("Unknown model '%s', using '%s'", initial_model.c_str(),
                  DEFAULT_MODEL);
        current_ = find_model(DEFAULT_MODEL);
    }
}

bool ModelSelection::select(const std::string &name, GError **error) {
    const ModelInfo *model = find_model(name);
    if (model == nullptr) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_UNKNOWN_MODEL,
                    "Unknown model '%s'", name.c_str());
        return false;
    }
    if (!is_downloaded(*model)) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_MODEL_NOT_DOWNLOADED,
                    "%s is not downloaded yet (%s)", model->name.c_str(),
                    path_for(*model).c_str());
        return false;
    }
    current_ = model;
    return true;
}

bool ModelSelection::is_downloaded(const ModelInfo &model) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(model), ec);
}

std::string ModelSelection::path_for(const ModelInfo &model) const {
    return (std::filesystem::path(models_dir_) / model.file).string();
}

std::string ModelSelection::menu_label(const ModelInfo &model) const {
    if (is_downloaded(model)) return model.name;
    return model.name + NOT_DOWNLOADED_SUFFIX;
}

} // namespace voiceclip
