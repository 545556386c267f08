#include "capture_session.h"
#include "logger.h"

CaptureSession::CaptureSession(CaptureListener &listener) : listener_(listener)
{
}

void CaptureSession::on_submit(const std::string &text)
{
    if (!active_) {
        LOG_DEBUG("Ignoring submit on finished capture session");
        return;
    }
    active_ = false;
    listener_.on_submit(text);
}

void CaptureSession::on_cancel()
{
    if (!active_) {
        LOG_DEBUG("Ignoring cancel on finished capture session");
        return;
    }
    active_ = false;
    listener_.on_cancel();
}

void CaptureSession::abandon()
{
    if (active_) {
        LOG_DEBUG("Abandoning open capture session");
    }
    active_ = false;
}
