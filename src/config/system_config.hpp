// src/config/system_config.hpp
#pragma once

#if defined(ARDUINO) && ARDUINO >= 100
// Arduino implementations
#include <Arduino.h>

#define RADIOHAL_BUILD_ARDUINO
#else
// Native implementation
#include <stdio.h>
#define RADIOHAL_BUILD_NATIVE
#endif

#ifndef RADIOHAL_LOG_LEVEL
#define RADIOHAL_LOG_LEVEL 0  // 0=DEBUG, 1=INFO, 2=WARNING, 3=ERROR, 4=NO_LOG
#endif

//#define LOGGER_DISABLE_COLORS   // Disable color output

#ifndef LOGGER_BUFFER_SIZE
#define LOGGER_BUFFER_SIZE 256  // Adjust buffer size for your needs
#endif
