
//
// ===============================================================================
// clEntity, DeclDatabase.h - Record store of scanned declarations, queried
// through the DeclarationAdapter interface.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "Declarations.h"

#include <map>


namespace clent
{
	class DeclDatabase : public DeclarationAdapter
	{
	public:
		DeclDatabase();

		DeclDatabase(const DeclDatabase&) = delete;
		DeclDatabase& operator = (const DeclDatabase&) = delete;

		//
		// Adds a type with package and simple name split from its qualified name, returning
		// the existing record if it's already been added. The package is the enclosing scope,
		// or the package of the enclosing type where that's recorded; front ends that know
		// the enclosing namespace should set it themselves.
		//
		TypeDecl& AddType(const std::string& qualified_name);

		// Appends a member, taking care of its parent name
		MemberDecl& AddMember(TypeDecl& type, const std::string& name, MemberDecl::Kind kind, const TypeRef& type_ref);

		size_t GetNbTypes() const { return m_TypeOrder.size(); }

		// DeclarationAdapter implementation
		std::vector<const TypeDecl*> GetTypes() const override;
		const TypeDecl* FindType(const std::string& qualified_name) const override;
		const TypeDecl* ResolveTypeName(const std::string& name, const std::string& scope) const override;
		std::vector<const MemberDecl*> MembersOf(const TypeDecl& type) const override;
		const AnnotationList& AnnotationsOf(const TypeDecl& type) const override;
		const AnnotationList& AnnotationsOf(const MemberDecl& member) const override;
		TypeRef ResolvedTypeOf(const MemberDecl& member) const override;
		unsigned int ModifiersOf(const MemberDecl& member) const override;
		const std::vector<std::string>& SuperTypesOf(const TypeDecl& type) const override;
		bool IsInterface(const TypeDecl& type) const override;
		bool IsAbstract(const TypeDecl& type) const override;

	private:
		typedef std::map<std::string, TypeDecl> TypeMap;
		TypeMap m_Types;

		// Map nodes never move so these stay valid
		std::vector<TypeDecl*> m_TypeOrder;
	};
}
