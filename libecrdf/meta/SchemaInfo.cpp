/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for SchemaInfo class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "ecrdf/meta/SchemaInfo.h"

namespace ecrdf {
namespace meta {

SchemaInfo::SchemaInfo(schema_id_t schema_id_,
                       const std::string& name_,
                       const std::string& alias_,
                       const std::string& version_)
    : schema_id(schema_id_), name(name_), alias(alias_), version(version_) {

}

SchemaInfo::~SchemaInfo() {
}

std::string SchemaInfo::getSchemaKey() const {
    return name + "." + version;
}

} /* namespace meta */
} /* namespace ecrdf */
