#include "transcriber.h"
#include "audio_format.h"
#include "error.h"

#include <gio/gio.h>
#include <glib/gstdio.h>

#include <exception>
#include <utility>

namespace voiceclip {

// Grace period for reaping the engine after a timeout kill
static constexpr guint REAP_GRACE_MS = 2000;

std::string normalize_whitespace(const std::string &raw) {
    std::string out;
    out.reserve(raw.size());
    bool pending_space = false;
    const gchar *p = raw.c_str();
    const gchar *end = p + raw.size();
    while (p < end) {
        gunichar c = g_utf8_get_char_validated(p, end - p);
        // Invalid bytes are kept as they are
        const gchar *next = c < 0xFFFFFFFE ? g_utf8_next_char(p) : p + 1;
        if (c < 0xFFFFFFFE && g_unichar_isspace(c)) {
            pending_space = !out.empty();
        } else {
            if (pending_space) {
                out += ' ';
                pending_space = false;
            }
            out.append(p, next);
        }
        p = next;
    }
    return out;
}

// --- Temporary WAV file ---

namespace {

class TempWavFile {
public:
    TempWavFile() = default;
    ~TempWavFile() { remove(); }

    TempWavFile(const TempWavFile &) = delete;
    TempWavFile &operator=(const TempWavFile &) = delete;

    bool create(GError **error) {
        gchar *name = nullptr;
        gint fd = g_file_open_tmp("voiceclip-XXXXXX.wav", &name, error);
        if (fd < 0) return false;
        g_close(fd, nullptr);
        path_ = name;
        g_free(name);
        return true;
    }

    void remove() {
        if (path_.empty()) return;
        if (g_remove(path_.c_str()) != 0) {
            g_warning("Failed to remove temporary file %s", path_.c_str());
        }
        path_.clear();
    }

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

// --- Engine subprocess ---

struct EngineRun {
    GMainContext *context = nullptr;
    GSubprocess *process = nullptr;
    GCancellable *cancellable = nullptr;
    bool done = false;
    bool timed_out = false;
    bool reaped = false;
    bool grace_expired = false;
    gchar *out = nullptr;
    gchar *err = nullptr;
    GError *error = nullptr;
};

} // namespace

static void on_communicate_done(GObject *source, GAsyncResult *result,
                                gpointer userdata) {
    auto *run = static_cast<EngineRun *>(userdata);
    g_subprocess_communicate_utf8_finish(G_SUBPROCESS(source), result,
                                         &run->out, &run->err, &run->error);
    run->done = true;
}

static gboolean on_engine_timeout(gpointer userdata) {
    auto *run = static_cast<EngineRun *>(userdata);
    run->timed_out = true;
    g_subprocess_force_exit(run->process);
    g_cancellable_cancel(run->cancellable);
    return G_SOURCE_REMOVE;
}

static void on_engine_reaped(GObject *source, GAsyncResult *result,
                             gpointer userdata) {
    auto *run = static_cast<EngineRun *>(userdata);
    g_subprocess_wait_finish(G_SUBPROCESS(source), result, nullptr);
    run->reaped = true;
}

static gboolean on_reap_grace_expired(gpointer userdata) {
    static_cast<EngineRun *>(userdata)->grace_expired = true;
    return G_SOURCE_REMOVE;
}

static GSource *attach_source(GMainContext *context, GSource *source,
                              GSourceFunc func, EngineRun *run) {
    g_source_set_callback(source, func, run, nullptr);
    g_source_attach(source, context);
    return source;
}

static void destroy_source(GSource *source) {
    g_source_destroy(source);
    g_source_unref(source);
}

// --- WhisperCliTranscriber ---

WhisperCliTranscriber::WhisperCliTranscriber(std::string engine_path,
                                             int timeout_seconds)
    : engine_path_(std::move(engine_path)), timeout_seconds_(timeout_seconds) {}

TranscriptionResult WhisperCliTranscriber::transcribe(
    const std::vector<float> &samples, const std::string &model_path) {
    try {
        return run(samples, model_path);
    } catch (const std::exception &e) {
        TranscriptionResult result;
        result.duration_seconds = samples_to_seconds(samples.size());
        result.error = std::string("Transcription failed: ") + e.what();
        return result;
    }
}

TranscriptionResult WhisperCliTranscriber::run(const std::vector<float> &samples,
                                               const std::string &model_path) {
    TranscriptionResult result;
    result.duration_seconds = samples_to_seconds(samples.size());

    GError *error = nullptr;
    TempWavFile wav;
    if (!wav.create(&error) ||
        !write_wav_file(wav.path(), float_to_pcm16(samples), &error)) {
        result.error = std::string("Cannot stage audio: ") + error->message;
        g_error_free(error);
        return result;
    }

    const gchar *argv[] = {engine_path_.c_str(), "-m", model_path.c_str(),
                           "-f", wav.path().c_str(), "--no-timestamps",
                           "-nt", nullptr};

    g_debug("Running %s -m %s -f %s", engine_path_.c_str(), model_path.c_str(),
            wav.path().c_str());

    EngineRun run;
    run.context = g_main_context_new();
    g_main_context_push_thread_default(run.context);

    GSubprocessLauncher *launcher = g_subprocess_launcher_new(
        static_cast<GSubprocessFlags>(G_SUBPROCESS_FLAGS_STDOUT_PIPE |
                                      G_SUBPROCESS_FLAGS_STDERR_PIPE));
    run.process = g_subprocess_launcher_spawnv(launcher, argv, &error);
    g_object_unref(launcher);

    if (run.process == nullptr) {
        result.error = std::string("Cannot start ") + engine_path_ + ": " +
                       error->message;
        g_error_free(error);
        g_main_context_pop_thread_default(run.context);
        g_main_context_unref(run.context);
        return result;
    }

    gint64 start = g_get_monotonic_time();
    run.cancellable = g_cancellable_new();
    g_subprocess_communicate_utf8_async(run.process, nullptr, run.cancellable,
                                        on_communicate_done, &run);
    GSource *timeout = attach_source(
        run.context,
        g_timeout_source_new_seconds(static_cast<guint>(timeout_seconds_)),
        on_engine_timeout, &run);

    while (!run.done) {
        g_main_context_iteration(run.context, TRUE);
    }
    destroy_source(timeout);
    result.elapsed_seconds =
        static_cast<double>(g_get_monotonic_time() - start) / G_USEC_PER_SEC;

    if (run.timed_out) {
        // Best effort: give the killed engine a moment to be reaped
        g_subprocess_wait_async(run.process, nullptr, on_engine_reaped, &run);
        GSource *grace = attach_source(run.context,
                                       g_timeout_source_new(REAP_GRACE_MS),
                                       on_reap_grace_expired, &run);
        while (!run.reaped && !run.grace_expired) {
            g_main_context_iteration(run.context, TRUE);
        }
        destroy_source(grace);
        if (!run.reaped) {
            g_warning("%s did not exit after being killed", engine_path_.c_str());
        }
        result.error = "Engine timed out after " +
                       std::to_string(timeout_seconds_) + "s";
    } else if (run.error != nullptr) {
        result.error = std::string("Engine I/O failed: ") + run.error->message;
    } else if (!g_subprocess_get_if_exited(run.process)) {
        result.error = std::string("Engine terminated by signal ") +
                       std::to_string(g_subprocess_get_term_sig(run.process));
    } else if (g_subprocess_get_exit_status(run.process) != 0) {
        std::string stderr_text = run.err != nullptr ? run.err : "";
        result.error = "Engine exited with status " +
                       std::to_string(g_subprocess_get_exit_status(run.process)) +
                       (stderr_text.empty() ? "" : ": " + normalize_whitespace(stderr_text));
    } else {
        result.text = normalize_whitespace(run.out != nullptr ? run.out : "");
    }

    g_clear_error(&run.error);
    g_free(run.out);
    g_free(run.err);
    g_object_unref(run.cancellable);
    g_object_unref(run.process);
    g_main_context_pop_thread_default(run.context);
    g_main_context_unref(run.context);

    return result;
}

} // namespace voiceclip
