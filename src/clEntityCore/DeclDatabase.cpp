
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "DeclDatabase.h"
#include "FileUtils.h"


clent::DeclDatabase::DeclDatabase()
{
}


clent::TypeDecl& clent::DeclDatabase::AddType(const std::string& qualified_name)
{
	TypeMap::iterator i = m_Types.find(qualified_name);
	if (i != m_Types.end())
		return i->second;

	TypeDecl& type = m_Types[qualified_name];
	type.name = qualified_name;
	type.simple_name = UnscopeName(qualified_name);

	// Types nested in a recorded class share its package
	type.package = ScopeName(qualified_name);
	if (const TypeDecl* outer = FindType(type.package))
		type.package = outer->package;

	m_TypeOrder.push_back(&type);
	return type;
}


clent::MemberDecl& clent::DeclDatabase::AddMember(TypeDecl& type, const std::string& name, MemberDecl::Kind kind, const TypeRef& type_ref)
{
	MemberDecl member;
	member.name = name;
	member.kind = kind;
	member.type = type_ref;
	member.parent = type.name;
	type.members.push_back(member);
	return type.members.back();
}


std::vector<const clent::TypeDecl*> clent::DeclDatabase::GetTypes() const
{
	return std::vector<const TypeDecl*>(m_TypeOrder.begin(), m_TypeOrder.end());
}


const clent::TypeDecl* clent::DeclDatabase::FindType(const std::string& qualified_name) const
{
	TypeMap::const_iterator i = m_Types.find(qualified_name);
	if (i == m_Types.end())
		return 0;
	return &i->second;
}


const clent::TypeDecl* clent::DeclDatabase::ResolveTypeName(const std::string& name, const std::string& scope) const
{
	// Explicitly global names skip the scope search
	if (startswith(name, "::"))
		return FindType(name.substr(2));

	// Search from the innermost scope outwards, the way C++ name lookup would
	std::string search_scope = scope;
	while (search_scope != "")
	{
		if (const TypeDecl* type = FindType(search_scope + "::" + name))
			return type;
		search_scope = ScopeName(search_scope);
	}

	return FindType(name);
}


std::vector<const clent::MemberDecl*> clent::DeclDatabase::MembersOf(const TypeDecl& type) const
{
	std::vector<const MemberDecl*> members;
	for (size_t i = 0; i < type.members.size(); i++)
		members.push_back(&type.members[i]);
	return members;
}


const clent::AnnotationList& clent::DeclDatabase::AnnotationsOf(const TypeDecl& type) const
{
	return type.annotations;
}


const clent::AnnotationList& clent::DeclDatabase::AnnotationsOf(const MemberDecl& member) const
{
	return member.annotations;
}


clent::TypeRef clent::DeclDatabase::ResolvedTypeOf(const MemberDecl& member) const
{
	return member.type;
}


unsigned int clent::DeclDatabase::ModifiersOf(const MemberDecl& member) const
{
	return member.modifiers;
}


const std::vector<std::string>& clent::DeclDatabase::SuperTypesOf(const TypeDecl& type) const
{
	return type.bases;
}


bool clent::DeclDatabase::IsInterface(const TypeDecl& type) const
{
	return (type.flags & TYPE_INTERFACE) != 0;
}


bool clent::DeclDatabase::IsAbstract(const TypeDecl& type) const
{
	return (type.flags & (TYPE_ABSTRACT | TYPE_INTERFACE)) != 0;
}
