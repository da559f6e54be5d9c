#ifndef VOICECLIP_TEST_SUPPORT_H
#define VOICECLIP_TEST_SUPPORT_H

#include <glib.h>
#include <glib/gstdio.h>

#include <cassert>
#include <filesystem>
#include <string>

namespace voiceclip::test {

inline std::string make_temp_dir() {
    GError *error = nullptr;
    gchar *dir = g_dir_make_tmp("voiceclip-test-XXXXXX", &error);
    assert(dir != nullptr && "temporary directory should be created");
    std::string path(dir);
    g_free(dir);
    return path;
}

inline void remove_tree(const std::string &path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

inline void write_file(const std::string &path, const std::string &contents) {
    std::filesystem::create_directories(
        std::filesystem::path(path).parent_path());
    bool ok = g_file_set_contents(path.c_str(), contents.c_str(),
                                  static_cast<gssize>(contents.size()), nullptr);
    assert(ok && "file should be written");
}

// Shell script standing in for whisper-cli
inline std::string write_script(const std::string &path,
                                const std::string &body) {
    write_file(path, "#!/bin/sh\n" + body + "\n");
    int rc = g_chmod(path.c_str(), 0755);
    assert(rc == 0 && "script should be made executable");
    return path;
}

inline std::string read_file(const std::string &path) {
    gchar *contents = nullptr;
    gsize length = 0;
    if (!g_file_get_contents(path.c_str(), &contents, &length, nullptr)) {
        return "";
    }
    std::string out(contents, length);
    g_free(contents);
    return out;
}

} // namespace voiceclip::test

#endif
