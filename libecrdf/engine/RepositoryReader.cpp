/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for RepositoryReader class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <cstdio>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <rapidjson/filereadstream.h>
#include <rapidjson/error/en.h>

#include "ecrdf/engine/RepositoryReader.h"
#include "ecrdf/meta/Id64.h"
#include "ecrdf/rdf/Errors.h"
#include "ecrdf/rdf/Literal.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace engine {

using std::string;
using std::vector;
using std::invalid_argument;
using boost::optional;
using boost::algorithm::to_lower_copy;
using boost::algorithm::iequals;
using rapidjson::Value;
using rapidjson::Document;
using rapidjson::SizeType;
using meta::ModelMetadata;
using meta::SchemaInfo;
using meta::ClassInfo;
using meta::EnumInfo;
using meta::ConstInfo;
using meta::PropertyInfo;
using meta::PrimitiveType;
using meta::Instance;
using meta::Code;
namespace id64 = meta::id64;

static const Value* getMember(const Value& obj, const char* name) {
    Value::ConstMemberIterator it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) return NULL;
    return &it->value;
}

static optional<string> getString(const Value& obj, const char* name) {
    const Value* v = getMember(obj, name);
    if (v == NULL) return boost::none;
    if (!v->IsString())
        throw invalid_argument(string("Member \"") + name +
                               "\" is not a string");
    return string(v->GetString(), v->GetStringLength());
}

static string getRequiredString(const Value& obj, const char* name,
                                const string& context) {
    optional<string> v = getString(obj, name);
    if (!v || v.get().empty())
        throw invalid_argument(string("Missing \"") + name + "\" in " +
                               context);
    return v.get();
}

static bool getBool(const Value& obj, const char* name, bool defaultValue) {
    const Value* v = getMember(obj, name);
    if (v == NULL) return defaultValue;
    if (!v->IsBool())
        throw invalid_argument(string("Member \"") + name +
                               "\" is not a boolean");
    return v->GetBool();
}

static const Value* getArray(const Value& obj, const char* name) {
    const Value* v = getMember(obj, name);
    if (v == NULL) return NULL;
    if (!v->IsArray())
        throw invalid_argument(string("Member \"") + name +
                               "\" is not an array");
    return v;
}

static PrimitiveType getPrimitiveType(const string& typeName,
                                      const string& context) {
    optional<PrimitiveType> type = meta::parsePrimitiveType(typeName);
    if (!type)
        throw rdf::UnsupportedPrimitiveType("Unknown primitive type " +
                                            typeName + " for " + context);
    return type.get();
}

static ClassInfo::class_type_t getClassKind(const string& kind,
                                            const string& context) {
    if (kind == "EntityClass") return ClassInfo::ENTITY;
    if (kind == "RelationshipClass") return ClassInfo::RELATIONSHIP;
    if (kind == "CustomAttributeClass") return ClassInfo::CUSTOM_ATTRIBUTE;
    if (kind == "Mixin") return ClassInfo::MIXIN;
    throw rdf::UnsupportedClassKind("Unknown class kind " + kind +
                                    " for " + context);
}

// the related element form {"id": ...} is accepted as well
static string getIdString(const Value& value) {
    optional<string> id = id64::fromJson(value);
    if (id) return id.get();
    if (value.IsString())
        return string(value.GetString(), value.GetStringLength());
    return "";
}

RepositoryReader::RepositoryReader(Repository& repository_)
    : repository(repository_), dropped(0) {

}

void RepositoryReader::readFile(const string& fileName) {
    FILE* pfile = fopen(fileName.c_str(), "r");
    if (pfile == NULL)
        throw rdf::IOFailure("Could not open repository file " + fileName);

    LOG(INFO) << "Reading repository from " << fileName;

    char buffer[1024];
    rapidjson::FileReadStream f(pfile, buffer, sizeof(buffer));
    Document d;
    d.ParseStream<rapidjson::kParseValidateEncodingFlag, rapidjson::UTF8<>,
                  rapidjson::FileReadStream>(f);
    fclose(pfile);
    if (d.HasParseError()) {
        throw invalid_argument(string("Malformed repository file ") +
                               fileName + " at offset " +
                               boost::lexical_cast<string>(d.GetErrorOffset()) +
                               ": " +
                               rapidjson::GetParseError_En(d.GetParseError()));
    }
    read(d);
}

void RepositoryReader::readString(const string& json) {
    Document d;
    d.Parse<rapidjson::kParseValidateEncodingFlag>(json.c_str());
    if (d.HasParseError()) {
        throw invalid_argument(string("Malformed repository at offset ") +
                               boost::lexical_cast<string>(d.GetErrorOffset()) +
                               ": " +
                               rapidjson::GetParseError_En(d.GetParseError()));
    }
    read(d);
}

void RepositoryReader::read(const Value& document) {
    if (!document.IsObject())
        throw invalid_argument("Malformed repository: not an object");

    optional<string> id = getString(document, "id");
    if (id) repository.setId(id.get());
    optional<string> name = getString(document, "name");
    if (name) repository.setName(name.get());

    const Value* schemas = getArray(document, "schemas");
    if (schemas != NULL) {
        readSchemaNames(*schemas);
        readSchemaItems(*schemas);
        repository.getMetadata().checkClassHierarchy();
    }

    readInstances(document, "codeSpecs", Instance::CODESPEC);
    readInstances(document, "models", Instance::MODEL);
    readInstances(document, "elements", Instance::ELEMENT);
    readInstances(document, "aspects", Instance::ASPECT);
    readInstances(document, "relationships", Instance::RELATIONSHIP);

    const ModelMetadata& md = repository.getMetadata();
    LOG(INFO) << "Loaded repository " << repository.getId() << ": "
              << md.getSchemas().size() << " schemas, "
              << md.getClasses().size() << " classes, "
              << repository.getInstanceCount() << " instances, "
              << dropped << " dropped";
}

string RepositoryReader::getKey(const string& fullName) const {
    size_t sep = fullName.find_first_of(":.");
    if (sep == string::npos) return "";
    const SchemaInfo* schema =
        repository.getMetadata().findSchema(fullName.substr(0, sep));
    if (schema == NULL) return "";
    return to_lower_copy(schema->getName() + "." + fullName.substr(sep + 1));
}

optional<meta::class_id_t>
RepositoryReader::resolveClass(const string& fullName) const {
    std::map<string, uint32_t>::const_iterator it =
        classIds.find(getKey(fullName));
    if (it == classIds.end()) return boost::none;
    return it->second;
}

optional<meta::enum_id_t>
RepositoryReader::resolveEnumeration(const string& fullName) const {
    std::map<string, uint32_t>::const_iterator it =
        enumIds.find(getKey(fullName));
    if (it == enumIds.end()) return boost::none;
    return it->second;
}

void RepositoryReader::readSchemaNames(const Value& schemas) {
    ModelMetadata& md = repository.getMetadata();
    for (SizeType i = 0; i < schemas.Size(); ++i) {
        const Value& schema = schemas[i];
        if (!schema.IsObject())
            throw invalid_argument("Malformed schema: not an object");

        const string name = getRequiredString(schema, "name", "schema");
        SchemaInfo si(i + 1, name,
                      getRequiredString(schema, "alias", "schema " + name),
                      getRequiredString(schema, "version", "schema " + name));
        optional<string> description = getString(schema, "description");
        if (description) si.setDescription(description.get());
        md.addSchema(si);

        const Value* items = getArray(schema, "items");
        if (items == NULL) continue;
        for (SizeType j = 0; j < items->Size(); ++j) {
            const Value& item = (*items)[j];
            if (!item.IsObject())
                throw invalid_argument("Malformed item in schema " + name);
            const string itemName =
                getRequiredString(item, "name", "schema " + name);
            const string type =
                getRequiredString(item, "type", name + ":" + itemName);
            const string key = to_lower_copy(name + "." + itemName);
            if (classIds.count(key) || enumIds.count(key))
                throw invalid_argument("Duplicate schema item " + name +
                                       ":" + itemName);
            if (type == "Enumeration") {
                meta::enum_id_t enumId = enumIds.size() + 1;
                enumIds[key] = enumId;
            } else {
                meta::class_id_t classId = classIds.size() + 1;
                classIds[key] = classId;
            }
        }
    }
}

void RepositoryReader::readSchemaItems(const Value& schemas) {
    for (SizeType i = 0; i < schemas.Size(); ++i) {
        const Value* items = getArray(schemas[i], "items");
        if (items == NULL) continue;
        for (SizeType j = 0; j < items->Size(); ++j) {
            const Value& item = (*items)[j];
            if (getRequiredString(item, "type", "item") == "Enumeration")
                readEnumeration(i + 1, item);
            else
                readClass(i + 1, item);
        }
    }
}

void RepositoryReader::readEnumeration(meta::schema_id_t schemaId,
                                       const Value& item) {
    ModelMetadata& md = repository.getMetadata();
    const SchemaInfo& schema = md.getSchema(schemaId);
    const string name = getRequiredString(item, "name", "enumeration");
    const string fullName = schema.getName() + ":" + name;

    optional<string> backing = getString(item, "backingType");
    PrimitiveType backingType =
        getPrimitiveType(backing.get_value_or("int"), fullName);

    vector<ConstInfo> consts;
    const Value* enumerators = getArray(item, "enumerators");
    if (enumerators != NULL) {
        for (SizeType i = 0; i < enumerators->Size(); ++i) {
            const Value& e = (*enumerators)[i];
            if (!e.IsObject())
                throw invalid_argument("Malformed enumerator in " + fullName);
            const Value* value = getMember(e, "value");
            if (value == NULL)
                throw invalid_argument("Missing enumerator value in " +
                                       fullName);
            consts.push_back(ConstInfo(getRequiredString(e, "name", fullName),
                                       rdf::literal::toToken(*value)));
        }
    }

    EnumInfo ei(enumIds.at(to_lower_copy(schema.getName() + "." + name)),
                schemaId, name, backingType, consts);
    optional<string> label = getString(item, "label");
    if (label) ei.setLabel(label.get());
    optional<string> description = getString(item, "description");
    if (description) ei.setDescription(description.get());
    md.addEnumeration(ei);
}

void RepositoryReader::readClass(meta::schema_id_t schemaId,
                                 const Value& item) {
    ModelMetadata& md = repository.getMetadata();
    const SchemaInfo& schema = md.getSchema(schemaId);
    const string name = getRequiredString(item, "name", "class");
    const string fullName = schema.getName() + ":" + name;
    ClassInfo::class_type_t kind =
        getClassKind(getRequiredString(item, "type", fullName), fullName);

    vector<PropertyInfo> properties;
    const Value* props = getArray(item, "properties");
    if (props != NULL) {
        for (SizeType i = 0; i < props->Size(); ++i) {
            properties.push_back(readProperty(fullName, (*props)[i]));
        }
    }

    ClassInfo ci(classIds.at(to_lower_copy(schema.getName() + "." + name)),
                 kind, name, schemaId, properties);

    optional<string> base = getString(item, "baseClass");
    if (base) {
        optional<meta::class_id_t> baseId = resolveClass(base.get());
        if (!baseId)
            throw invalid_argument("Unknown base class " + base.get() +
                                   " of " + fullName);
        ci.setBaseClass(baseId.get());
    }
    optional<string> label = getString(item, "label");
    if (label) ci.setLabel(label.get());
    optional<string> description = getString(item, "description");
    if (description) ci.setDescription(description.get());

    const Value* attrs = getArray(item, "customAttributes");
    if (attrs != NULL) {
        for (SizeType i = 0; i < attrs->Size(); ++i) {
            if (!(*attrs)[i].IsString())
                throw invalid_argument("Malformed custom attribute on " +
                                       fullName);
            ci.addCustomAttribute((*attrs)[i].GetString());
        }
    }

    if (kind == ClassInfo::RELATIONSHIP) {
        ci.setConstraints(readConstraint(item, "source", fullName),
                          readConstraint(item, "target", fullName));
    }

    md.addClass(ci);
}

vector<meta::class_id_t>
RepositoryReader::readConstraint(const Value& item, const char* end,
                                 const string& fullName) const {
    vector<meta::class_id_t> result;
    const Value* constraint = getMember(item, end);
    if (constraint == NULL) return result;
    if (!constraint->IsObject())
        throw invalid_argument(string("Malformed ") + end +
                               " constraint of " + fullName);
    const Value* classes = getArray(*constraint, "classes");
    if (classes == NULL) return result;
    for (SizeType i = 0; i < classes->Size(); ++i) {
        const Value& c = (*classes)[i];
        if (!c.IsString())
            throw invalid_argument(string("Malformed ") + end +
                                   " constraint of " + fullName);
        optional<meta::class_id_t> id = resolveClass(c.GetString());
        if (id) {
            result.push_back(id.get());
        } else {
            LOG(WARNING) << "Dropping unknown " << end
                         << " constraint class " << c.GetString()
                         << " of " << fullName;
        }
    }
    return result;
}

PropertyInfo RepositoryReader::readProperty(const string& className,
                                            const Value& prop) {
    if (!prop.IsObject())
        throw invalid_argument("Malformed property in " + className);
    const string name = getRequiredString(prop, "name", className);
    const string context = className + "." + name;
    const string kind = getString(prop, "kind").get_value_or("primitive");
    const PropertyInfo::cardinality_t cardinality =
        getBool(prop, "array", false) ? PropertyInfo::VECTOR
                                      : PropertyInfo::SCALAR;
    optional<string> typeName = getString(prop, "type");

    PropertyInfo result;
    if (iequals(kind, "primitive")) {
        if (!typeName)
            throw invalid_argument("Missing \"type\" in " + context);
        result = PropertyInfo(name, getPrimitiveType(typeName.get(), context),
                              cardinality,
                              getString(prop, "extendedType")
                              .get_value_or(""));
    } else if (iequals(kind, "struct")) {
        result = PropertyInfo(name, cardinality);
    } else if (iequals(kind, "navigation")) {
        optional<meta::class_id_t> relId;
        optional<string> relName = getString(prop, "relationshipClass");
        if (relName) {
            relId = resolveClass(relName.get());
            if (!relId)
                LOG(WARNING) << "Unknown relationship class "
                             << relName.get() << " of " << context;
        }
        const string direction =
            getString(prop, "direction").get_value_or("forward");
        PropertyInfo::direction_t dir;
        if (iequals(direction, "forward"))
            dir = PropertyInfo::FORWARD;
        else if (iequals(direction, "backward"))
            dir = PropertyInfo::BACKWARD;
        else
            throw invalid_argument("Invalid direction " + direction +
                                   " of " + context);
        result = PropertyInfo(name, relId, dir);
    } else if (iequals(kind, "enumeration")) {
        optional<meta::enum_id_t> enumId;
        optional<string> enumName = getString(prop, "enumeration");
        if (enumName) {
            enumId = resolveEnumeration(enumName.get());
            if (!enumId)
                LOG(WARNING) << "Unknown enumeration "
                             << enumName.get() << " of " << context;
        }
        result = PropertyInfo(name, enumId,
                              getPrimitiveType(typeName.get_value_or("int"),
                                               context),
                              cardinality);
    } else {
        throw invalid_argument("Unknown property kind " + kind +
                               " of " + context);
    }

    optional<string> label = getString(prop, "label");
    if (label) result.setLabel(label.get());
    optional<string> description = getString(prop, "description");
    if (description) result.setDescription(description.get());
    return result;
}

void RepositoryReader::readInstances(const Value& document,
                                     const char* member,
                                     Instance::instance_kind_t kind) {
    const Value* instances = getArray(document, member);
    if (instances == NULL) return;
    for (SizeType i = 0; i < instances->Size(); ++i) {
        readInstance((*instances)[i], kind);
    }
}

void RepositoryReader::readInstance(const Value& inst,
                                    Instance::instance_kind_t kind) {
    const char* kindName = meta::getInstanceKindName(kind);
    if (!inst.IsObject()) {
        LOG(WARNING) << "Dropping malformed " << kindName;
        dropped += 1;
        return;
    }

    const Value* idv = getMember(inst, "id");
    optional<string> id;
    if (idv != NULL) id = id64::fromJson(*idv);
    if (!id) {
        LOG(WARNING) << "Dropping " << kindName << " without a valid ID";
        dropped += 1;
        return;
    }

    const Value* classv = getMember(inst, "classFullName");
    meta::class_id_t classId = 0;
    if (classv != NULL && classv->IsString()) {
        const ClassInfo* ci =
            repository.getMetadata().findClass(classv->GetString());
        if (ci != NULL) {
            classId = ci->getId();
        } else if (kind != Instance::CODESPEC) {
            LOG(WARNING) << "Dropping " << kindName << " " << id.get()
                         << " of unknown class " << classv->GetString();
            dropped += 1;
            return;
        }
    } else if (kind != Instance::CODESPEC) {
        LOG(WARNING) << "Dropping " << kindName << " " << id.get()
                     << " without a class";
        dropped += 1;
        return;
    }

    boost::shared_ptr<Instance> instance =
        boost::make_shared<Instance>(kind, id.get(), classId);

    const Value* v;
    switch (kind) {
    case Instance::ELEMENT:
        if ((v = getMember(inst, "model")) != NULL)
            instance->setModelId(getIdString(*v));
        if ((v = getMember(inst, "parent")) != NULL)
            instance->setParentId(getIdString(*v));
        if ((v = getMember(inst, "code")) != NULL && v->IsObject()) {
            Code code;
            const Value* c;
            if ((c = getMember(*v, "spec")) != NULL)
                code.spec = getIdString(*c);
            if ((c = getMember(*v, "scope")) != NULL)
                code.scope = getIdString(*c);
            if ((c = getMember(*v, "value")) != NULL)
                code.value = rdf::literal::toToken(*c);
            instance->setCode(code);
        }
        break;
    case Instance::MODEL:
    case Instance::CODESPEC:
        if ((v = getMember(inst, "name")) != NULL)
            instance->setName(rdf::literal::toToken(*v));
        break;
    case Instance::RELATIONSHIP:
        {
            string source, target;
            if ((v = getMember(inst, "sourceId")) != NULL)
                source = getIdString(*v);
            if ((v = getMember(inst, "targetId")) != NULL)
                target = getIdString(*v);
            instance->setEndpoints(source, target);
        }
        break;
    case Instance::ASPECT:
        if ((v = getMember(inst, "element")) != NULL)
            instance->setElementId(getIdString(*v));
        break;
    }

    const Value* props = getMember(inst, "properties");
    if (props != NULL) {
        if (props->IsObject()) {
            Value::ConstMemberIterator it;
            for (it = props->MemberBegin(); it != props->MemberEnd(); ++it) {
                instance->setValue(string(it->name.GetString(),
                                          it->name.GetStringLength()),
                                   it->value);
            }
        } else {
            LOG(WARNING) << "Ignoring malformed properties of "
                         << kindName << " " << id.get();
        }
    }

    repository.addInstance(instance);
}

} /* namespace engine */
} /* namespace ecrdf */
