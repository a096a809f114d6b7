#pragma once
#include "config.hpp"

#include <atomic>

namespace trafficgen {

// При AUTO_START=true сразу true. Иначе ждём START_SIGNAL_FILE с опросом раз
// в START_CHECK_INTERVAL, удаляем его и возвращаем true; false при отмене.
bool wait_for_start_signal(const Config &cfg, const std::atomic<bool> &running);

} // namespace trafficgen
