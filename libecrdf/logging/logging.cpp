/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for the LOG macro's message buffer.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <cstring>

#include "ecrdf/logging/LogHandler.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace logging {
namespace internal {

static const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

Logger::Logger(LogHandler::Level level, const char* file, int line)
    : level_(level), file_(baseName(file)), line_(line) {

}

Logger::~Logger() {
    LogHandler::getHandler()->handleMessage(file_, line_, level_,
                                            buffer_.str());
}

} /* namespace internal */
} /* namespace logging */
} /* namespace ecrdf */
