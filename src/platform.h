#ifndef VOICECLIP_PLATFORM_H
#define VOICECLIP_PLATFORM_H

#include "session.h"

#include <string>

namespace voiceclip {

enum class IndicatorState { Recording, Processing, Success, Error };

// All methods return immediately; rendering happens on the UI main loop.
class StatusIndicator {
public:
    virtual ~StatusIndicator() = default;
    virtual void show(const std::string &text) = 0;
    virtual void update(const std::string &text, IndicatorState state) = 0;
    virtual void hide() = 0;
};

class ClipboardWriter {
public:
    virtual ~ClipboardWriter() = default;
    virtual void copy(const std::string &text) = 0;
};

class TrayMenu {
public:
    virtual ~TrayMenu() = default;
    virtual void set_session_state(SessionState state) = 0;
};

class Platform {
public:
    virtual ~Platform() = default;
    virtual StatusIndicator &indicator() = 0;
    virtual ClipboardWriter &clipboard() = 0;
    virtual TrayMenu &tray() = 0;
};

} // namespace voiceclip

#endif
