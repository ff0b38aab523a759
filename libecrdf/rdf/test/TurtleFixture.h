/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for turtle fixture
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef RDF_TEST_TURTLEFIXTURE_H
#define RDF_TEST_TURTLEFIXTURE_H

#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "ecrdf/rdf/TurtleWriter.h"
#include "MDFixture.h"

namespace ecrdf {
namespace rdf {

/**
 * A fixture that writes Turtle for the simple object model into a
 * string
 */
class TurtleFixture : public meta::MDFixture {
public:
    TurtleFixture() : writer(out) {}

    /**
     * Get the lines written so far
     */
    std::vector<std::string> lines() const {
        std::vector<std::string> result;
        std::string text = out.str();
        if (text.empty()) return result;
        boost::algorithm::split(result, text, boost::is_any_of("\n"));
        // the last line is terminated too
        result.pop_back();
        return result;
    }

    /**
     * Count the lines that contain the given text
     */
    size_t count(const std::string& text) const {
        size_t n = 0;
        std::vector<std::string> all = lines();
        for (size_t i = 0; i < all.size(); ++i) {
            if (all[i].find(text) != std::string::npos) n += 1;
        }
        return n;
    }

    /**
     * Forget the lines written so far
     */
    void clear() {
        out.str("");
    }

    std::ostringstream out;
    TurtleWriter writer;
};

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* RDF_TEST_TURTLEFIXTURE_H */
