/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for the LOG macro.  Include it last: it defines short
 * level macros such as INFO and ERROR.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef ECRDF_LOGGING_INTERNAL_LOGGING_HPP
#define ECRDF_LOGGING_INTERNAL_LOGGING_HPP

#include <sstream>

#include "ecrdf/logging/LogHandler.h"

namespace ecrdf {
namespace logging {
namespace internal {

/**
 * Collects one message and hands it to the active handler when it
 * goes out of scope
 */
class Logger {
public:
    Logger(LogHandler::Level level, const char* file, int line);
    ~Logger();

    std::ostream& stream() { return buffer_; }

private:
    LogHandler::Level level_;
    const char* file_;
    int line_;
    std::ostringstream buffer_;
};

} /* namespace internal */
} /* namespace logging */
} /* namespace ecrdf */

#define DEBUG2 ecrdf::logging::LogHandler::DEBUG2
#define DEBUG ecrdf::logging::LogHandler::DEBUG0
#define INFO ecrdf::logging::LogHandler::INFO
#define WARNING ecrdf::logging::LogHandler::WARNING
#define ERROR ecrdf::logging::LogHandler::ERROR

/**
 * Log a message at the given level:
 * @code
 * LOG(INFO) << "Exported " << count << " statements";
 * @endcode
 * The message is only formatted when the active handler emits the
 * level.  Do not end it with a newline.
 */
#define LOG(level)                                                      \
    if (!ecrdf::logging::LogHandler::getHandler()->shouldEmit(level))   \
        ;                                                               \
    else                                                                \
        ecrdf::logging::internal::Logger(level, __FILE__, __LINE__)     \
            .stream()

#endif /* ECRDF_LOGGING_INTERNAL_LOGGING_HPP */
