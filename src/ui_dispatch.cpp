#include "ui_dispatch.h"

#include <glib.h>

#include <utility>

namespace voiceclip {

static gboolean run_job(gpointer userdata) {
    (*static_cast<std::function<void()> *>(userdata))();
    return G_SOURCE_REMOVE;
}

static void free_job(gpointer userdata) {
    delete static_cast<std::function<void()> *>(userdata);
}

void run_on_ui(std::function<void()> fn) {
    auto *job = new std::function<void()>(std::move(fn));
    g_idle_add_full(G_PRIORITY_DEFAULT, run_job, job, free_job);
}

} // namespace voiceclip
