/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file ConsoleLogHandler.h
 * @brief Interface definition file for ConsoleLogHandler
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_LOGGING_CONSOLELOGHANDLER_H
#define ECRDF_LOGGING_CONSOLELOGHANDLER_H

#include <ostream>

#include "ecrdf/logging/LogHandler.h"

namespace ecrdf {
namespace logging {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup logging
 * @{
 */

/**
 * A @ref LogHandler that writes one line per message, in the form
 * <tt>[level] file:line message</tt>.  Messages below WARNING go to
 * the output stream and the rest to the error stream.
 */
class ConsoleLogHandler : public LogHandler {
public:
    /**
     * Log to standard out and standard error
     *
     * @param logLevel the minimum log level
     */
    explicit ConsoleLogHandler(Level logLevel);

    /**
     * Log to the given streams, which must outlive the handler
     */
    ConsoleLogHandler(Level logLevel, std::ostream& out, std::ostream& err);

    virtual ~ConsoleLogHandler();

    /**
     * Send every message to the error stream.  Used when the output
     * stream carries the exported document.
     */
    void setErrorOnly(bool errorOnly_) { errorOnly = errorOnly_; }

    /* see LogHandler */
    virtual void handleMessage(const std::string& file,
                               int line,
                               Level level,
                               const std::string& message);

private:
    std::ostream& out;
    std::ostream& err;
    bool errorOnly;
};

/* @} logging */
/* @} cpp */

} /* namespace logging */
} /* namespace ecrdf */

#endif /* ECRDF_LOGGING_CONSOLELOGHANDLER_H */
