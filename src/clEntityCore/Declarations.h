
//
// ===============================================================================
// clEntity, Declarations.h - Offline description of the declarations that
// entities are built from, and the adapter interface used to query them.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <string>
#include <vector>


namespace clent
{
	//
	// Which annotation macro a set of attributes came from
	//
	enum Dialect
	{
		DIALECT_NATIVE,		// clent_attr
		DIALECT_JPA,		// clent_jpa
	};


	struct AnnotationValue
	{
		enum Kind
		{
			KIND_FLAG,
			KIND_INT,
			KIND_FLOAT,
			KIND_SYMBOL,
			KIND_TEXT,
		};

		AnnotationValue()
			: kind(KIND_FLAG)
			, int_value(0)
			, float_value(0)
		{
		}

		Kind kind;

		// Original text for all kinds, so symbols and numbers can be read as text
		std::string text;
		int int_value;
		float float_value;
	};


	struct AnnotationArgument
	{
		std::string key;
		AnnotationValue value;
	};


	//
	// A single parsed attribute such as 'key', 'column = "email"' or 'table(name = "people")'.
	// The shorthand 'name = value' form stores its value under the "value" key.
	//
	struct AnnotationInstance
	{
		AnnotationInstance()
			: dialect(DIALECT_NATIVE)
			, line(0)
		{
		}

		bool Has(const std::string& key) const
		{
			return Get(key) != 0;
		}

		const AnnotationValue* Get(const std::string& key) const
		{
			for (size_t i = 0; i < arguments.size(); i++)
			{
				if (arguments[i].key == key)
					return &arguments[i].value;
			}
			return 0;
		}

		std::string GetText(const std::string& key, const std::string& default_value = "") const;
		int GetInt(const std::string& key, int default_value) const;
		bool GetBool(const std::string& key, bool default_value) const;

		// Unquoted identifiers only, such as LAZY or FetchType::LAZY
		std::string GetSymbol(const std::string& key, const std::string& default_value = "") const;

		Dialect dialect;
		std::string name;
		std::vector<AnnotationArgument> arguments;

		// Where the annotation was written
		std::string filename;
		int line;
	};


	typedef std::vector<AnnotationInstance> AnnotationList;


	//
	// Closed set of container shapes recognised by the scanner
	//
	enum TypeShape
	{
		SHAPE_VALUE,
		SHAPE_LIST,
		SHAPE_SET,
		SHAPE_COLLECTION,
		SHAPE_MAP,
		SHAPE_OPTIONAL,
		SHAPE_SMART_POINTER,
	};


	const char* GetShapeName(TypeShape shape);
	bool ParseShapeName(const std::string& name, TypeShape& shape);


	// "const model::Phone *" -> "model::Phone"
	std::string StripTypeQualifiers(const std::string& type_name);


	//
	// Reference to the type of a member with qualifiers and template arguments split out
	//
	struct TypeRef
	{
		enum Qualifier
		{
			VALUE,
			POINTER,
			REFERENCE,
		};

		TypeRef()
			: qualifier(VALUE)
			, is_const(false)
			, shape(SHAPE_VALUE)
			, resolved(true)
		{
		}

		// The unresolved sentinel
		static TypeRef Unresolved(const std::string& name)
		{
			TypeRef ref;
			ref.name = name;
			ref.resolved = false;
			return ref;
		}

		bool IsVoid() const
		{
			return name == "void" && qualifier == VALUE;
		}

		bool IsCollection() const
		{
			return shape == SHAPE_LIST || shape == SHAPE_SET || shape == SHAPE_COLLECTION;
		}

		// Collections and wrappers whose first template argument is the interesting type
		bool HasElement() const
		{
			return (IsCollection() || shape == SHAPE_OPTIONAL || shape == SHAPE_SMART_POINTER) && !args.empty();
		}

		// Element type name stripped of cv-qualifiers, pointers and references
		std::string GetElement() const;

		// Name with template arguments but without qualifiers, e.g. "std::vector<model::Phone>"
		std::string GetFullName() const;

		// Qualified name, stripped of template arguments
		std::string name;

		Qualifier qualifier;
		bool is_const;
		TypeShape shape;
		std::vector<std::string> args;
		bool resolved;
	};


	enum MemberModifier
	{
		MOD_PRIVATE		= 0x01,
		MOD_PROTECTED	= 0x02,
		MOD_STATIC		= 0x04,
		MOD_CONST		= 0x08,
		MOD_VIRTUAL		= 0x10,
		MOD_PURE		= 0x20,
	};


	struct MemberDecl
	{
		enum Kind
		{
			MEMBER_FIELD,
			MEMBER_METHOD,
		};

		MemberDecl()
			: kind(MEMBER_FIELD)
			, nb_params(0)
			, modifiers(0)
			, line(0)
		{
		}

		std::string name;
		Kind kind;

		// Field type or method return type
		TypeRef type;

		int nb_params;
		unsigned int modifiers;
		AnnotationList annotations;

		// Qualified name of the declaring type
		std::string parent;
		int line;
	};


	enum TypeFlags
	{
		TYPE_ABSTRACT	= 0x01,
		TYPE_INTERFACE	= 0x02,
		TYPE_FINAL		= 0x04,
	};


	struct TypeDecl
	{
		TypeDecl()
			: line(0)
			, flags(0)
		{
		}

		std::string name;
		std::string package;
		std::string simple_name;

		std::string filename;
		int line;

		unsigned int flags;

		// Qualified names of direct bases in declaration order
		std::vector<std::string> bases;

		AnnotationList annotations;
		std::vector<MemberDecl> members;
	};


	//
	// Read-only queries over the declarations of a compilation. Unresolvable member types
	// come back as TypeRef::Unresolved rather than stopping the query.
	//
	class DeclarationAdapter
	{
	public:
		virtual ~DeclarationAdapter() { }

		// All class-like declarations in declaration order
		virtual std::vector<const TypeDecl*> GetTypes() const = 0;

		virtual const TypeDecl* FindType(const std::string& qualified_name) const = 0;

		// Looks up a name as written in an annotation, searching outwards from the given scope
		virtual const TypeDecl* ResolveTypeName(const std::string& name, const std::string& scope) const = 0;

		virtual std::vector<const MemberDecl*> MembersOf(const TypeDecl& type) const = 0;

		virtual const AnnotationList& AnnotationsOf(const TypeDecl& type) const = 0;
		virtual const AnnotationList& AnnotationsOf(const MemberDecl& member) const = 0;

		virtual TypeRef ResolvedTypeOf(const MemberDecl& member) const = 0;
		virtual unsigned int ModifiersOf(const MemberDecl& member) const = 0;

		// Names of the direct bases in declaration order, whether or not they're recorded
		virtual const std::vector<std::string>& SuperTypesOf(const TypeDecl& type) const = 0;

		virtual bool IsInterface(const TypeDecl& type) const = 0;
		virtual bool IsAbstract(const TypeDecl& type) const = 0;
	};
}
