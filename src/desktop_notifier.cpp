#include "desktop_notifier.h"
#include "logger.h"
#include "utility.h"

#include <stdexcept>

void DesktopNotifier::notify(const std::string &title, const std::string &body)
{
    LOG_INFO("Notification: %s: %s", title.c_str(), body.c_str());
    try {
        platform::run_command(
            {"notify-send", "--app-name=floatnote", title, body});
    } catch (const std::runtime_error &e) {
        LOG_WARNING("notify-send failed: %s", e.what());
    }
}
