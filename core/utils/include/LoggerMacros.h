/**
 * @file LoggerMacros.h
 * @brief Logging shorthands
 *
 * The *_IF variants skip building the message when the level is disabled.
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Session bytes: " + std::to_string(n), "SSHDecoy");
 */

#pragma once

#include "Logger.h"

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::LureNet::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::LureNet::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::LureNet::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::LureNet::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::LureNet::Logger::instance().critical(msg, component)
