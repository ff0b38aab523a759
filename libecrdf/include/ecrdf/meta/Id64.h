/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Id64.h
 * @brief Helpers for 64-bit repository identifiers
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_ID64_H
#define ECRDF_META_ID64_H

#include <string>

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>
#include <rapidjson/document.h>

namespace ecrdf {
namespace meta {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup meta
 * @{
 */

/**
 * Identifiers of repository instances are 64-bit integers written as
 * lowercase hex strings, such as "0x20000000a1".  Zero is never a
 * valid identifier.
 */
namespace id64 {

/**
 * Check whether a string is a valid identifier: "0x" followed by one
 * to sixteen lowercase hex digits, the first of which is not zero.
 */
bool isValid(const std::string& id);

/**
 * Format a numeric identifier in its string form.  Zero formats as
 * "0", which is not valid.
 */
std::string fromUInt64(uint64_t id);

/**
 * Resolve a JSON value to a valid identifier.  The value may be a
 * string, an unsigned number, or an object with an "id" member
 * holding either of those.
 *
 * @return the identifier, or boost::none if the value does not
 * resolve to a valid one
 */
boost::optional<std::string> fromJson(const rapidjson::Value& value);

} /* namespace id64 */

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_ID64_H */
