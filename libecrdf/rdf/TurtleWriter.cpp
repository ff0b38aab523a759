/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for TurtleWriter class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "ecrdf/rdf/TurtleWriter.h"
#include "ecrdf/rdf/Errors.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace rdf {

static std::ofstream* openFile(const std::string& fileName) {
    std::ofstream* file =
        new std::ofstream(fileName.c_str(),
                          std::ios_base::out | std::ios_base::trunc);
    if (!file->is_open()) {
        delete file;
        throw IOFailure("Could not open " + fileName + " for writing");
    }
    return file;
}

TurtleWriter::TurtleWriter(std::ostream& out_)
    : out(out_), name("stream"), tripleCount(0), prefixCount(0) {

}

TurtleWriter::TurtleWriter(const std::string& fileName)
    : file(openFile(fileName)), out(*file), name(fileName),
      tripleCount(0), prefixCount(0) {
    LOG(DEBUG) << "Writing Turtle to " << fileName;
}

TurtleWriter::~TurtleWriter() {
    if (file) file->close();
}

void TurtleWriter::writeLine(const std::string& first,
                             const std::string& second,
                             const std::string& third) {
    out << first << ' ' << second << ' ' << third << " .\n";
    out.flush();
    if (!out)
        throw IOFailure("Could not write to " + name);
}

void TurtleWriter::writeTriple(const std::string& subject,
                               const std::string& predicate,
                               const std::string& object) {
    writeLine(subject, predicate, object);
    tripleCount += 1;
}

void TurtleWriter::writePrefix(const std::string& prefix,
                               const std::string& iri) {
    writeLine("@prefix", prefix + ":", "<" + iri + ">");
    prefixCount += 1;
}

} /* namespace rdf */
} /* namespace ecrdf */
