
//
// ===============================================================================
// clEntity, TestModels.h - Declaration databases built by hand for the tests.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <clEntityCore/DeclDatabase.h>


namespace test
{
	// Parses attribute text the way the scanner would
	clent::AnnotationList Attrs(const char* text, clent::Dialect dialect = clent::DIALECT_NATIVE);

	clent::TypeRef Value(const char* name);
	clent::TypeRef ConstValue(const char* name);
	clent::TypeRef Pointer(const char* name);
	clent::TypeRef Container(const char* name, clent::TypeShape shape, const char* arg);

	clent::TypeDecl& AddType(clent::DeclDatabase& db, const char* name, const char* attrs, int line = 1);
	clent::MemberDecl& AddField(clent::DeclDatabase& db, clent::TypeDecl& type, const char* name, const clent::TypeRef& type_ref, const char* attrs = "");
	clent::MemberDecl& AddMethod(clent::DeclDatabase& db, clent::TypeDecl& type, const char* name, const clent::TypeRef& type_ref, unsigned int modifiers, const char* attrs = "");


	//
	// A small package with all kinds of declaration:
	//
	//    model::BaseEntity     superclass with generated key and version
	//    model::Phone          embeddable
	//    model::Address        entity with its own key
	//    model::Person         abstract entity deriving from BaseEntity, many-to-one Address
	//
	void AddPersonModel(clent::DeclDatabase& db);
}
