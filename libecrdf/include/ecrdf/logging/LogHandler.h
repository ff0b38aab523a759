/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file LogHandler.h
 * @brief Interface definition file for LogHandler
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef ECRDF_LOGGING_LOGHANDLER_H
#define ECRDF_LOGGING_LOGHANDLER_H

#include <string>

namespace ecrdf {
namespace logging {

/**
 * \addtogroup cpp
 * @{
 */

/**
 * @defgroup logging Logging
 * Define logging facility for the exporter library.
 * @{
 */

/**
 * Receives every log message the library emits at or above the level
 * of the handler.  A single handler is active at a time.  Until one is
 * registered, messages at INFO or above go to a ConsoleLogHandler.
 *
 * To silence the library:
 * @code
 * ConsoleLogHandler quiet(LogHandler::NO_LOGGING);
 * LogHandler::registerHandler(quiet);
 * @endcode
 */
class LogHandler {
public:

    /**
     * Log levels for exporter logging
     */
    enum Level {
        TRACE,
        DEBUG7,
        DEBUG6,
        DEBUG5,
        DEBUG4,
        DEBUG3,
        DEBUG2,
        DEBUG1,
        DEBUG0,
        INFO,
        WARNING,
        ERROR,
        FATAL,

        /* keep as the last one */
        NO_LOGGING
    };

    /**
     * Allocate a log handler that will log any messages with equal or
     * greater severity than the specified log level.
     *
     * @param logLevel the minimum log level
     */
    LogHandler(Level logLevel);

    virtual ~LogHandler();

    /**
     * Process a single log message.  Called synchronously from the
     * code that logs.
     *
     * @param file the base name of the source file
     * @param line the line number
     * @param level the log level of the message
     * @param message the message, without a trailing newline
     */
    virtual void handleMessage(const std::string& file,
                               int line,
                               Level level,
                               const std::string& message) = 0;

    /**
     * Check whether we should attempt to log at the given log level.
     *
     * @param level the level of a message to log
     * @return true if the log level could be allowed
     */
    virtual bool shouldEmit(const Level level);

    /**
     * Register a custom handler as the log handler.  You must ensure
     * that the custom log handler is not deallocated before any
     * library components that might need to log to it.
     *
     * @param handler the custom handler to register
     */
    static void registerHandler(LogHandler& handler);

    /**
     * Get the currently-active log handler.  Returns the default
     * handler if there is no active custom handler.
     *
     * @return the currently-active log handler
     */
    static LogHandler* getHandler();

    /**
     * Parse a level name such as "debug" or "warning".  The debug
     * levels are also accepted as "debug0" through "debug7".
     *
     * @param name the case-insensitive level name
     * @return the matching level
     * @throws std::invalid_argument if the name is not a known level
     */
    static Level parseLevel(const std::string& name);

    /**
     * Get the name parseLevel() accepts for a level
     */
    static const char* getLevelName(Level level);

    void setLevel(Level logLevel) {
        logLevel_ = logLevel;
    }

    Level getLevel() const {
        return logLevel_;
    }

protected:
    /**
     * The log level for this logger.
     */
    Level logLevel_;
};

/* @} logging */
/* @} cpp */

} /* namespace logging */
} /* namespace ecrdf */

#endif /* ECRDF_LOGGING_LOGHANDLER_H */
