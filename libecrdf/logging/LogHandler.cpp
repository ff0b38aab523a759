/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for LogHandler class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

#include "ecrdf/logging/LogHandler.h"
#include "ecrdf/logging/ConsoleLogHandler.h"

namespace ecrdf {
namespace logging {

static LogHandler* volatile activeHandler = NULL;

LogHandler::LogHandler(Level logLevel) : logLevel_(logLevel) { }
LogHandler::~LogHandler() { }

void LogHandler::registerHandler(LogHandler& handler) {
    activeHandler = &handler;
}

LogHandler* LogHandler::getHandler() {
    static ConsoleLogHandler defaultHandler(INFO);
    if (activeHandler) return activeHandler;
    return &defaultHandler;
}

bool LogHandler::shouldEmit(const Level level) {
    return level >= logLevel_;
}

// indexed by level
static const char* const LEVEL_NAMES[] = {
    "trace",
    "debug7",
    "debug6",
    "debug5",
    "debug4",
    "debug3",
    "debug2",
    "debug1",
    "debug",
    "info",
    "warning",
    "error",
    "fatal",
    "none"
};

LogHandler::Level LogHandler::parseLevel(const std::string& name) {
    const std::string lname = boost::algorithm::to_lower_copy(name);
    if (lname == "debug0") return DEBUG0;
    for (int i = TRACE; i <= NO_LOGGING; ++i) {
        if (lname == LEVEL_NAMES[i]) return static_cast<Level>(i);
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

const char* LogHandler::getLevelName(Level level) {
    if (level < TRACE || level > NO_LOGGING) return "unknown";
    return LEVEL_NAMES[level];
}

} /* namespace logging */
} /* namespace ecrdf */
