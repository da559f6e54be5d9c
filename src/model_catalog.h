#ifndef VOICECLIP_MODEL_CATALOG_H
#define VOICECLIP_MODEL_CATALOG_H

#include <glib.h>

#include <string>
#include <vector>

namespace voiceclip {

struct ModelInfo {
    std::string name;
    std::string file;
    std::string size;
    std::string speed;
};

inline constexpr const char *DEFAULT_MODEL = "Base (Fast)";
inline constexpr const char *NOT_DOWNLOADED_SUFFIX = " (not downloaded)";

// Ordered best quality first, as shown in the tray menu
const std::vector<ModelInfo> &model_catalog();
const ModelInfo *find_model(const std::string &name);

// The active model. Only the tray menu changes it, always on the main loop.
class ModelSelection {
public:
    ModelSelection(std::string models_dir, const std::string &initial_model);

    bool select(const std::string &name, GError **error);

    bool is_downloaded(const ModelInfo &model) const;
    std::string path_for(const ModelInfo &model) const;
    std::string menu_label(const ModelInfo &model) const;

    const ModelInfo &current() const { return *current_; }
    std::string current_path() const { return path_for(*current_); }
    const std::string &models_dir() const { return models_dir_; }

private:
    std::string models_dir_;
    const ModelInfo *current_;
};

} // namespace voiceclip

#endif
