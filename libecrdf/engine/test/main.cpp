/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test module for the export engine
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#define BOOST_TEST_MODULE "Engine"
#include <boost/test/unit_test.hpp>

#include "ecrdf/logging/ConsoleLogHandler.h"

using namespace ecrdf::logging;

class EngineTest {
public:
    EngineTest() {
        LogHandler::registerHandler(testLogger);
    }

    static ConsoleLogHandler testLogger;
};

ConsoleLogHandler EngineTest::testLogger(LogHandler::DEBUG2);

BOOST_GLOBAL_FIXTURE(EngineTest);
