/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for ConsoleLogHandler class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <iostream>

#include "ecrdf/logging/ConsoleLogHandler.h"

namespace ecrdf {
namespace logging {

ConsoleLogHandler::ConsoleLogHandler(Level logLevel_)
    : LogHandler(logLevel_), out(std::cout), err(std::cerr),
      errorOnly(false) {

}

ConsoleLogHandler::ConsoleLogHandler(Level logLevel_,
                                     std::ostream& out_,
                                     std::ostream& err_)
    : LogHandler(logLevel_), out(out_), err(err_), errorOnly(false) {

}

ConsoleLogHandler::~ConsoleLogHandler() {
}

void ConsoleLogHandler::handleMessage(const std::string& file,
                                      int line,
                                      Level level,
                                      const std::string& message) {
    if (level < logLevel_) return;

    std::ostream& os = (errorOnly || level >= WARNING) ? err : out;
    os << "[" << getLevelName(level) << "] " << file << ":" << line
       << " " << message << std::endl;
}

} /* namespace logging */
} /* namespace ecrdf */
