#ifndef VOICECLIP_UI_DISPATCH_H
#define VOICECLIP_UI_DISPATCH_H

#include <functional>

namespace voiceclip {

// Queues |fn| on the default main context. Callable from any thread; jobs
// run in submission order on the UI thread.
void run_on_ui(std::function<void()> fn);

} // namespace voiceclip

#endif
