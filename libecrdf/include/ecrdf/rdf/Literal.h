/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Literal.h
 * @brief Formatting of Turtle literals from strings and JSON values
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_LITERAL_H
#define ECRDF_RDF_LITERAL_H

#include <string>

#include <rapidjson/document.h>

namespace ecrdf {
namespace rdf {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup rdf
 * @{
 */

namespace literal {

/**
 * Wrap a string in double quotes, escaping it the way JSON strings
 * are escaped
 *
 * @throws std::invalid_argument if the string is not valid UTF-8
 */
std::string quote(const std::string& value);

/**
 * Serialize a JSON value in compact form
 *
 * @throws std::invalid_argument if a string in the value is not
 * valid UTF-8 or a number is not finite
 */
std::string toJson(const rapidjson::Value& value);

/**
 * Format a JSON value as an unquoted token: strings are written as
 * their content, anything else as its compact JSON form
 *
 * @throws std::invalid_argument under the same conditions as toJson()
 */
std::string toToken(const rapidjson::Value& value);

/**
 * Serialize a point as a JSON object with members "x", "y" and, for
 * three dimensions, "z".  The value may be an object with those
 * members or an array of coordinates.
 *
 * @param value the point value
 * @param is3d true for a three-dimensional point
 * @throws std::invalid_argument if the value is not a point of the
 * given dimension
 */
std::string formatPoint(const rapidjson::Value& value, bool is3d);

} /* namespace literal */

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_LITERAL_H */
