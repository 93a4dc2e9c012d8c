
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "TestModels.h"

#include <clEntityCore/AttributeParser.h>


clent::AnnotationList test::Attrs(const char* text, clent::Dialect dialect)
{
	return clent::ParseAttributes(dialect, text, "model/Model.h", 1);
}


clent::TypeRef test::Value(const char* name)
{
	clent::TypeRef ref;
	ref.name = name;
	return ref;
}


clent::TypeRef test::ConstValue(const char* name)
{
	clent::TypeRef ref = Value(name);
	ref.is_const = true;
	return ref;
}


clent::TypeRef test::Pointer(const char* name)
{
	clent::TypeRef ref = Value(name);
	ref.qualifier = clent::TypeRef::POINTER;
	return ref;
}


clent::TypeRef test::Container(const char* name, clent::TypeShape shape, const char* arg)
{
	clent::TypeRef ref = Value(name);
	ref.shape = shape;
	ref.args.push_back(arg);
	return ref;
}


clent::TypeDecl& test::AddType(clent::DeclDatabase& db, const char* name, const char* attrs, int line)
{
	clent::TypeDecl& type = db.AddType(name);
	type.filename = "model/Model.h";
	type.line = line;
	type.annotations = Attrs(attrs);
	return type;
}


clent::MemberDecl& test::AddField(clent::DeclDatabase& db, clent::TypeDecl& type, const char* name, const clent::TypeRef& type_ref, const char* attrs)
{
	clent::MemberDecl& member = db.AddMember(type, name, clent::MemberDecl::MEMBER_FIELD, type_ref);
	member.annotations = Attrs(attrs);
	member.line = type.line + (int)type.members.size();
	return member;
}


clent::MemberDecl& test::AddMethod(clent::DeclDatabase& db, clent::TypeDecl& type, const char* name, const clent::TypeRef& type_ref, unsigned int modifiers, const char* attrs)
{
	clent::MemberDecl& member = db.AddMember(type, name, clent::MemberDecl::MEMBER_METHOD, type_ref);
	member.modifiers = modifiers;
	member.annotations = Attrs(attrs);
	member.line = type.line + (int)type.members.size();
	return member;
}


void test::AddPersonModel(clent::DeclDatabase& db)
{
	clent::TypeDecl& base = AddType(db, "model::BaseEntity", "superclass", 10);
	AddField(db, base, "id", Value("long"), "key, generated");
	AddField(db, base, "version", Value("int"), "version");

	clent::TypeDecl& phone = AddType(db, "model::Phone", "embeddable", 20);
	AddField(db, phone, "number", Value("std::string"));

	clent::TypeDecl& address = AddType(db, "model::Address", "entity, table(name = \"addresses\")", 30);
	AddField(db, address, "id", Value("int"), "key");
	AddField(db, address, "street", Value("std::string"));

	clent::TypeDecl& person = AddType(db, "model::Person", "entity", 40);
	person.bases.push_back("model::BaseEntity");
	person.flags = clent::TYPE_ABSTRACT;
	AddField(db, person, "name", Value("std::string"));
	AddField(db, person, "address", Pointer("model::Address"), "many_to_one");
	AddField(db, person, "phones", Container("std::vector", clent::SHAPE_LIST, "model::Phone"), "one_to_many");
	clent::TypeRef email = ConstValue("std::string");
	email.qualifier = clent::TypeRef::REFERENCE;
	AddMethod(db, person, "getEmailAddress", email, clent::MOD_VIRTUAL | clent::MOD_PURE | clent::MOD_CONST);
}
