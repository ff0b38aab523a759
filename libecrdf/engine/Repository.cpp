/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Repository class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "ecrdf/engine/Repository.h"

namespace ecrdf {
namespace engine {

using meta::Instance;
using meta::InstancePtr;

Repository::Repository(const std::string& id_, const std::string& name_)
    : id(id_), name(name_), md(name_) {

}

void Repository::addInstance(const InstancePtr& instance) {
    switch (instance->getKind()) {
    case Instance::CODESPEC:
        codeSpecs.push_back(instance);
        break;
    case Instance::MODEL:
        models.push_back(instance);
        break;
    case Instance::ELEMENT:
        elements.push_back(instance);
        break;
    case Instance::ASPECT:
        aspects.push_back(instance);
        break;
    case Instance::RELATIONSHIP:
        relationships.push_back(instance);
        break;
    }
}

size_t Repository::getInstanceCount() const {
    return codeSpecs.size() + models.size() + elements.size() +
        aspects.size() + relationships.size();
}

} /* namespace engine */
} /* namespace ecrdf */
