#pragma once

#include "surface.h"

#include <string>

// Shows notifications through the desktop's notify-send
class DesktopNotifier : public Notifier
{
  public:
    void notify(const std::string &title, const std::string &body) override;
};
