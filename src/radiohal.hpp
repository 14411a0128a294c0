/**
 * @file radiohal.hpp
 * @brief Main radiohal library interface
 */
#pragma once

#include "capture/capture_radio.hpp"
#include "capture/capture_sink.hpp"
#include "capture/pcap_writer.hpp"
#include "capture/rolling_stats.hpp"
#include "config/system_config.hpp"
#include "hal/hal.hpp"
#include "hal/native/native_hal.hpp"
#include "helpers/operations.hpp"
#include "radio/blocking.hpp"
#include "radio/loopback_radio.hpp"
#include "types/configurations/channel_configuration.hpp"
#include "types/error_codes/result.hpp"
#include "types/radio/radio.hpp"
#include "utils/file_log_handler.hpp"
#include "utils/logger.hpp"
