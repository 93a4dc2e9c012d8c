
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "PropertyExtractor.h"
#include "FileUtils.h"
#include "ProcessingContext.h"

#include <cctype>


namespace
{
	// Relationship annotations in the order they take priority
	struct CardinalityAnnotation
	{
		clent::AnnotationKind kind;
		clent::Cardinality cardinality;
	};

	const CardinalityAnnotation g_CardinalityPriority[] =
	{
		{ clent::ANNOTATION_ONE_TO_ONE, clent::ONE_TO_ONE },
		{ clent::ANNOTATION_ONE_TO_MANY, clent::ONE_TO_MANY },
		{ clent::ANNOTATION_MANY_TO_ONE, clent::MANY_TO_ONE },
		{ clent::ANNOTATION_MANY_TO_MANY, clent::MANY_TO_MANY },
	};


	// Generated destructuring accessors of value types: component1, component2, ...
	bool IsComponentName(const std::string& name)
	{
		if (!startswith(name, "component") || name.size() == 9)
			return false;
		for (size_t i = 9; i < name.size(); i++)
		{
			if (!isdigit((unsigned char)name[i]))
				return false;
		}
		return true;
	}


	bool IsLazyFetch(const clent::AnnotationInstance* basic)
	{
		if (basic == 0)
			return false;

		// Accept both LAZY and FetchType::LAZY
		std::string fetch = basic->GetSymbol("fetch");
		return fetch == "LAZY" || endswith(fetch, "::LAZY");
	}
}


std::string clent::PropertyNameFromAccessor(const std::string& method_name)
{
	std::string name;
	if (startswith(method_name, "get") && method_name.size() > 3)
		name = method_name.substr(3);
	else if (startswith(method_name, "is") && method_name.size() > 2)
		name = method_name.substr(2);
	else
		return "";

	name[0] = (char)tolower((unsigned char)name[0]);
	return name;
}


clent::Status clent::ExtractProperty(const ProcessingContext& ctx, const EntityDescriptor& owner, const MemberDecl& member, PropertyDescriptor& property)
{
	const DeclarationAdapter& adapter = ctx.GetAdapter();
	const AnnotationCatalog& catalog = ctx.GetCatalog();
	const AnnotationList& annotations = adapter.AnnotationsOf(member);
	unsigned int modifiers = adapter.ModifiersOf(member);

	// Eligibility
	if (modifiers & (MOD_PRIVATE | MOD_STATIC))
		return Status::Skip();
	if (member.kind == MemberDecl::MEMBER_METHOD && member.nb_params != 0)
		return Status::Skip();
	if (member.kind == MemberDecl::MEMBER_METHOD && IsComponentName(member.name))
		return Status::Skip();

	TypeRef type = adapter.ResolvedTypeOf(member);
	if (type.IsVoid())
		return Status::Skip();

	// Transient members are only kept on interfaces, where their accessors still need implementing
	bool is_transient = catalog.Has(annotations, ANNOTATION_TRANSIENT);
	if (is_transient && !owner.is_interface)
		return Status::Skip();

	std::string name = member.name;
	if (member.kind == MemberDecl::MEMBER_METHOD)
	{
		name = PropertyNameFromAccessor(member.name);
		if (name == "")
			return Status::Skip();
	}

	if (!type.resolved)
		return Status::Fail(DIAG_UNRESOLVED_TYPE, "Type '" + type.name + "' of member '" + member.name + "' could not be resolved");

	// Value types don't store references to themselves
	if (owner.is_immutable && type.name == owner.qualified_name)
		return Status::Skip();

	property.name = name;
	property.type = type;
	property.type_name = type.name;
	property.member_kind = member.kind;
	property.member_name = member.name;
	property.declaring_type = member.parent;
	property.member = &member;

	const AnnotationInstance* column = catalog.Find(annotations, ANNOTATION_COLUMN);
	if (column != 0)
		property.column_name = column->GetText("name", column->GetText("value"));
	if (property.column_name == "")
		property.column_name = name;

	property.is_key = catalog.Has(annotations, ANNOTATION_KEY);
	property.is_generated = catalog.Has(annotations, ANNOTATION_GENERATED);
	property.is_version = catalog.Has(annotations, ANNOTATION_VERSION);
	property.is_transient = is_transient;
	property.is_lazy = catalog.Has(annotations, ANNOTATION_LAZY) || IsLazyFetch(catalog.Find(annotations, ANNOTATION_BASIC));
	property.is_collection = type.IsCollection();

	// Pointers and wrappers can be empty
	property.is_nullable =
		catalog.Has(annotations, ANNOTATION_NULLABLE) ||
		(column != 0 && column->GetBool("nullable", false)) ||
		type.qualifier == TypeRef::POINTER ||
		type.shape == SHAPE_OPTIONAL ||
		type.shape == SHAPE_SMART_POINTER;

	// Const fields can't be assigned by generated code
	property.is_read_only =
		catalog.Has(annotations, ANNOTATION_READ_ONLY) ||
		(member.kind == MemberDecl::MEMBER_FIELD && type.is_const && type.qualifier == TypeRef::VALUE);

	// Record every relationship annotation but take the cardinality from the first by priority
	const AnnotationInstance* relationship = 0;
	for (size_t i = 0; i < sizeof(g_CardinalityPriority) / sizeof(g_CardinalityPriority[0]); i++)
	{
		const CardinalityAnnotation& ca = g_CardinalityPriority[i];
		const AnnotationInstance* annotation = catalog.Find(annotations, ca.kind);
		if (annotation == 0)
			continue;

		property.declared_cardinalities |= CardinalityBit(ca.cardinality);
		if (relationship == 0)
		{
			relationship = annotation;
			property.cardinality = ca.cardinality;
		}
	}

	// Explicit targets must name a known declaration
	if (relationship != 0)
	{
		std::string target = relationship->GetText("target", relationship->GetText("targetEntity"));
		if (target != "")
		{
			const TypeDecl* target_type = adapter.ResolveTypeName(target, member.parent);
			if (target_type == 0)
				return Status::Fail(DIAG_UNRESOLVED_ANNOTATION_REFERENCE, "Relationship target '" + target + "' of member '" + member.name + "' could not be resolved");
			property.referenced_type_name = target_type->name;
		}
	}

	return Status();
}
