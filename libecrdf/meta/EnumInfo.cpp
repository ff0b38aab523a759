/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for EnumInfo class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/foreach.hpp>

#include "ecrdf/meta/EnumInfo.h"

namespace ecrdf {
namespace meta {

EnumInfo::EnumInfo(enum_id_t enum_id_,
                   schema_id_t schema_id_,
                   const std::string& name_,
                   PrimitiveType backing_type_,
                   const std::vector<ConstInfo>& consts_)
    : enum_id(enum_id_), schema_id(schema_id_), name(name_),
      backing_type(backing_type_), consts(consts_) {
    BOOST_FOREACH(const ConstInfo& cinst, consts_) {
        const_name_map[cinst.getName()] = cinst.getValue();
        const_value_map[cinst.getValue()] = cinst.getName();
    }
}

EnumInfo::~EnumInfo() {
}

const std::string& EnumInfo::getValueByName(const std::string& name) const {
    return const_name_map.at(name);
}

const std::string& EnumInfo::getNameByValue(const std::string& value) const {
    return const_value_map.at(value);
}

} /* namespace meta */
} /* namespace ecrdf */
