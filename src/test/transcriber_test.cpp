#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"
#include "transcriber.h"

using namespace voiceclip;
using namespace voiceclip::test;

static const std::vector<float> ONE_SECOND(16000, 0.0f);

static void test_normalize_whitespace() {
    assert(normalize_whitespace("") == "");
    assert(normalize_whitespace("\n \t\n") == "");
    assert(normalize_whitespace("hello") == "hello");
    assert(normalize_whitespace("  hello   world  \n") == "hello world");
    assert(normalize_whitespace("a\tb\n\nc") == "a b c");

    // No-break space and ideographic space count as whitespace too
    assert(normalize_whitespace("\u00A0hello\u00A0\u00A0world\u3000") == "hello world");
    assert(normalize_whitespace("caf\u00E9 \u3000 ok") == "caf\u00E9 ok");

    // Bytes that are not UTF-8 pass through untouched
    assert(normalize_whitespace("a \xff  b") == "a \xff b");
}

// Engine stubs report the WAV path they were given through this file
static std::string record_wav_path(const std::string &dir) {
    return "echo \"$4\" > '" + dir + "/wav-path'\n";
}

static void assert_wav_removed(const std::string &dir) {
    std::string wav_path = normalize_whitespace(read_file(dir + "/wav-path"));
    assert(g_str_has_suffix(wav_path.c_str(), ".wav"));
    assert(!g_file_test(wav_path.c_str(), G_FILE_TEST_EXISTS) &&
           "temporary WAV should be deleted after the call");
    g_remove((dir + "/wav-path").c_str());
}

static void test_success_output_is_normalized(const std::string &dir) {
    std::string engine = write_script(dir + "/ok-engine",
                                      "printf '  hello   world  \\n'");
    WhisperCliTranscriber transcriber(engine, 10);

    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-base.bin");
    assert(!result.error && "exit 0 should not be an error");
    assert(result.text == "hello world");
    assert(result.duration_seconds == 1.0);
    assert(result.elapsed_seconds >= 0.0);
}

static void test_arguments_and_temp_file(const std::string &dir) {
    std::string args_file = dir + "/args";
    std::string engine = write_script(
        dir + "/args-engine",
        "echo \"$@\" > '" + args_file + "'\n"
        "if [ -s \"$4\" ]; then echo staged; fi");
    WhisperCliTranscriber transcriber(engine, 10);

    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-tiny.bin");
    assert(!result.error);
    assert(result.text == "staged" && "WAV file should exist while the engine runs");

    std::string args = normalize_whitespace(read_file(args_file));
    assert(g_str_has_prefix(args.c_str(), "-m /models/ggml-tiny.bin -f "));
    assert(g_str_has_suffix(args.c_str(), " --no-timestamps -nt"));

    // "-m M -f WAV ..." -> the WAV path is the fourth word
    gchar **words = g_strsplit(args.c_str(), " ", -1);
    assert(g_strv_length(words) == 6);
    std::string wav_path = words[3];
    g_strfreev(words);
    assert(g_str_has_suffix(wav_path.c_str(), ".wav"));
    assert(!g_file_test(wav_path.c_str(), G_FILE_TEST_EXISTS) &&
           "temporary WAV should be deleted after the call");
}

static void test_nonzero_exit_is_error(const std::string &dir) {
    std::string engine = write_script(dir + "/fail-engine",
                                      record_wav_path(dir) +
                                      "echo 'model   load failed' >&2\nexit 1");
    WhisperCliTranscriber transcriber(engine, 10);

    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-base.bin");
    assert(result.error);
    assert(result.text.empty());
    assert(*result.error == "Engine exited with status 1: model load failed");
    assert_wav_removed(dir);
}

static void test_empty_output_is_not_error(const std::string &dir) {
    std::string engine = write_script(dir + "/silent-engine", "printf '\\n  \\n'");
    WhisperCliTranscriber transcriber(engine, 10);

    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-base.bin");
    assert(!result.error);
    assert(result.text.empty());
}

static void test_missing_engine(const std::string &dir) {
    WhisperCliTranscriber transcriber(dir + "/no-such-engine", 10);

    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-base.bin");
    assert(result.error);
    assert(g_str_has_prefix(result.error->c_str(), "Cannot start "));
}

static void test_timeout(const std::string &dir) {
    std::string engine = write_script(dir + "/slow-engine",
                                      record_wav_path(dir) + "exec sleep 10");
    WhisperCliTranscriber transcriber(engine, 1);

    gint64 start = g_get_monotonic_time();
    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-base.bin");
    double waited = static_cast<double>(g_get_monotonic_time() - start) / G_USEC_PER_SEC;

    assert(result.error);
    assert(*result.error == "Engine timed out after 1s");
    assert(result.text.empty());
    assert(waited < 5.0 && "a timed out engine should not be waited for");
    assert_wav_removed(dir);
}

static void test_killed_engine(const std::string &dir) {
    std::string engine = write_script(dir + "/crashing-engine",
                                      record_wav_path(dir) + "kill -9 $$");
    WhisperCliTranscriber transcriber(engine, 10);

    TranscriptionResult result = transcriber.transcribe(ONE_SECOND, "/models/ggml-base.bin");
    assert(result.error);
    assert(*result.error == "Engine terminated by signal 9");
    assert_wav_removed(dir);
}

int main() {
    std::cout << "[Test] Starting Transcriber Test..." << std::endl;

    std::string dir = make_temp_dir();

    test_normalize_whitespace();
    test_success_output_is_normalized(dir);
    test_arguments_and_temp_file(dir);
    test_nonzero_exit_is_error(dir);
    test_empty_output_is_not_error(dir);
    test_missing_engine(dir);
    test_timeout(dir);
    test_killed_engine(dir);

    remove_tree(dir);

    std::cout << "[Test] Transcriber Test Passed!" << std::endl;
    return 0;
}
