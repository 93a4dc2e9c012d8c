
//
// ===============================================================================
// clEntity, Descriptors.h - Property and entity descriptors derived from
// annotated declarations.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "Declarations.h"

#include <clent/Meta.h>

#include <string>
#include <vector>


namespace clent
{
	enum EntityKind
	{
		KIND_ENTITY,
		KIND_SUPERCLASS,
		KIND_EMBEDDABLE,
	};


	enum PropertyNameStyle
	{
		STYLE_BEAN,			// getName/isName, setName
		STYLE_FLUENT_BEAN,	// getName/isName, name(value)
		STYLE_FLUENT,		// name(), name(value)
		STYLE_NONE,			// name(), name(value)
	};


	enum PropertyVisibility
	{
		VISIBILITY_PUBLIC,
		VISIBILITY_PROTECTED,
		VISIBILITY_PRIVATE,
	};


	const char* GetEntityKindName(EntityKind kind);
	const char* GetCardinalityName(Cardinality cardinality);
	const char* GetPropertyNameStyleName(PropertyNameStyle style);
	bool ParsePropertyNameStyle(const std::string& name, PropertyNameStyle& style);
	bool ParsePropertyVisibility(const std::string& name, PropertyVisibility& visibility);


	inline unsigned int CardinalityBit(Cardinality cardinality)
	{
		return 1 << cardinality;
	}


	struct PropertyDescriptor
	{
		PropertyDescriptor()
			: is_key(false)
			, is_generated(false)
			, is_version(false)
			, is_nullable(false)
			, is_transient(false)
			, is_lazy(false)
			, is_read_only(false)
			, is_collection(false)
			, cardinality(CARDINALITY_NONE)
			, declared_cardinalities(0)
			, member_kind(MemberDecl::MEMBER_FIELD)
			, member(0)
		{
		}

		bool IsToMany() const
		{
			return cardinality == ONE_TO_MANY || cardinality == MANY_TO_MANY;
		}

		bool IsBoolean() const
		{
			return type.name == "bool" && type.qualifier == TypeRef::VALUE;
		}

		std::string name;
		std::string column_name;

		// Qualified type name without qualifiers or template arguments
		std::string type_name;

		// Full type, as declared
		TypeRef type;

		// Explicit relationship target, empty when implied by the type
		std::string referenced_type_name;

		bool is_key;
		bool is_generated;
		bool is_version;
		bool is_nullable;
		bool is_transient;
		bool is_lazy;
		bool is_read_only;
		bool is_collection;

		Cardinality cardinality;

		// One CardinalityBit for each relationship annotation present
		unsigned int declared_cardinalities;

		MemberDecl::Kind member_kind;

		// Field or accessor name in user code
		std::string member_name;

		// Qualified name of the type that declared the member, differs from the owner when inherited
		std::string declaring_type;

		// Only for reporting
		const MemberDecl* member;
	};


	typedef std::vector<PropertyDescriptor> PropertyList;


	struct EntityDescriptor
	{
		EntityDescriptor()
			: kind(KIND_ENTITY)
			, is_abstract(false)
			, is_interface(false)
			, is_immutable(false)
			, is_read_only(false)
			, is_stateless(false)
			, is_cacheable(true)
			, is_view(false)
			, is_unimplementable(false)
			, property_name_style(STYLE_BEAN)
			, property_visibility(VISIBILITY_PUBLIC)
			, line(0)
			, declaration(0)
		{
		}

		const PropertyDescriptor* FindProperty(const std::string& name) const
		{
			for (size_t i = 0; i < properties.size(); i++)
			{
				if (properties[i].name == name)
					return &properties[i];
			}
			return 0;
		}

		bool HasProperty(const std::string& name) const
		{
			return FindProperty(name) != 0;
		}

		std::string package_name;
		std::string simple_name;
		std::string qualified_name;
		std::string table_name;

		// Explicit name for the generated implementation
		std::string entity_name;

		EntityKind kind;

		bool is_abstract;
		bool is_interface;
		bool is_immutable;
		bool is_read_only;
		bool is_stateless;
		bool is_cacheable;
		bool is_view;
		bool is_unimplementable;

		PropertyNameStyle property_name_style;
		PropertyVisibility property_visibility;

		// Unique by name, own members first then inherited in walk order
		PropertyList properties;

		std::string source_file;
		int line;

		// Only for reporting
		const TypeDecl* declaration;
	};
}
