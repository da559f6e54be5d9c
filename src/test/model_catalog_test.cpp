#include <cassert>
#include <iostream>
#include <string>

#include "error.h"
#include "model_catalog.h"
#include "test_support.h"

using namespace voiceclip;
using namespace voiceclip::test;

static void test_catalog() {
    const auto &catalog = model_catalog();
    assert(catalog.size() == 4);
    assert(catalog[0].name == "Large V3 (Best Quality)");
    assert(catalog[0].file == "ggml-large-v3.bin");
    assert(catalog[3].name == "Tiny (Fastest)");

    const ModelInfo *base = find_model(DEFAULT_MODEL);
    assert(base != nullptr);
    assert(base->file == "ggml-base.bin");
    assert(find_model("Huge") == nullptr);
}

static void test_selection(const std::string &dir) {
    write_file(dir + "/ggml-base.bin", "model");
    ModelSelection models(dir, DEFAULT_MODEL);

    assert(models.current().name == DEFAULT_MODEL);
    assert(models.current_path() == dir + "/ggml-base.bin");

    const ModelInfo *tiny = find_model("Tiny (Fastest)");
    assert(!models.is_downloaded(*tiny));
    assert(models.menu_label(*tiny) == "Tiny (Fastest) (not downloaded)");
    assert(models.menu_label(models.current()) == DEFAULT_MODEL);

    // Missing files cannot be selected and leave the selection alone
    GError *error = nullptr;
    assert(!models.select("Tiny (Fastest)", &error));
    assert(g_error_matches(error, VOICECLIP_ERROR, ERROR_MODEL_NOT_DOWNLOADED));
    g_clear_error(&error);
    assert(models.current().name == DEFAULT_MODEL);

    assert(!models.select("Huge", &error));
    assert(g_error_matches(error, VOICECLIP_ERROR, ERROR_UNKNOWN_MODEL));
    g_clear_error(&error);
    assert(models.current().name == DEFAULT_MODEL);

    write_file(dir + "/ggml-tiny.bin", "model");
    assert(models.select("Tiny (Fastest)", &error));
    assert(models.current().name == "Tiny (Fastest)");
    assert(models.current_path() == dir + "/ggml-tiny.bin");
    assert(models.menu_label(*tiny) == "Tiny (Fastest)");
}

static void test_unknown_initial_model(const std::string &dir) {
    ModelSelection models(dir, "Huge");
    assert(models.current().name == DEFAULT_MODEL);
    assert(models.models_dir() == dir);
}

int main() {
    std::cout << "[Test] Starting Model Catalog Test..." << std::endl;

    std::string dir = make_temp_dir();

    test_catalog();
    test_selection(dir);
    test_unknown_initial_model(dir);

    remove_tree(dir);

    std::cout << "[Test] Model Catalog Test Passed!" << std::endl;
    return 0;
}
