#include <cassert>
#include <iostream>
#include <string>

#include "config.h"
#include "engine_locator.h"
#include "error.h"
#include "test_support.h"

using namespace voiceclip;
using namespace voiceclip::test;

static void test_bundled_layout(const std::string &dir) {
    std::string base = dir + "/bundled";
    std::string engine = write_script(base + "/whisper.cpp/build/bin/whisper-cli", "exit 0");
    write_file(base + "/whisper.cpp/models/ggml-base.bin", "model");

    Config config;
    EngineLocation location;
    GError *error = nullptr;
    assert(locate_engine(config, base, &location, &error));
    assert(location.engine_path == engine);
    assert(location.models_dir == base + "/whisper.cpp/models");
}

static void test_models_beside_configured_engine(const std::string &dir) {
    std::string engine = write_script(dir + "/opt/whisper/build/bin/whisper-cli", "exit 0");
    write_file(dir + "/opt/whisper/models/ggml-tiny.bin", "model");

    Config config;
    config.engine_path = engine;
    EngineLocation location;
    GError *error = nullptr;
    assert(locate_engine(config, dir + "/elsewhere", &location, &error));
    assert(location.engine_path == engine);
    assert(location.models_dir == dir + "/opt/whisper/models");
}

static void test_configured_engine_missing(const std::string &dir) {
    Config config;
    config.engine_path = dir + "/nowhere/whisper-cli";
    EngineLocation location;
    GError *error = nullptr;
    assert(!locate_engine(config, dir, &location, &error));
    assert(g_error_matches(error, VOICECLIP_ERROR, ERROR_ENGINE_NOT_FOUND));
    g_clear_error(&error);
}

static void test_non_executable_engine(const std::string &dir) {
    write_file(dir + "/plain/whisper-cli", "not a program");
    Config config;
    config.engine_path = dir + "/plain/whisper-cli";
    EngineLocation location;
    GError *error = nullptr;
    assert(!locate_engine(config, dir, &location, &error));
    assert(g_error_matches(error, VOICECLIP_ERROR, ERROR_ENGINE_NOT_FOUND));
    g_clear_error(&error);
}

static void test_configured_models_missing(const std::string &dir) {
    std::string engine = write_script(dir + "/solo/whisper-cli", "exit 0");
    Config config;
    config.engine_path = engine;
    config.models_dir = dir + "/no-models";
    EngineLocation location;
    GError *error = nullptr;
    assert(!locate_engine(config, dir, &location, &error));
    assert(g_error_matches(error, VOICECLIP_ERROR, ERROR_MODELS_NOT_FOUND));
    g_clear_error(&error);
}

static void test_executable_dir() {
    std::string here = executable_dir();
    assert(!here.empty());
    assert(g_file_test(here.c_str(), G_FILE_TEST_IS_DIR));
}

int main() {
    std::cout << "[Test] Starting Engine Locator Test..." << std::endl;

    std::string dir = make_temp_dir();

    test_bundled_layout(dir);
    test_models_beside_configured_engine(dir);
    test_configured_engine_missing(dir);
    test_non_executable_engine(dir);
    test_configured_models_missing(dir);
    test_executable_dir();

    remove_tree(dir);

    std::cout << "[Test] Engine Locator Test Passed!" << std::endl;
    return 0;
}
