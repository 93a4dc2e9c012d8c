
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "EntityBuilder.h"
#include "FileUtils.h"
#include "Logging.h"
#include "ProcessingContext.h"
#include "PropertyExtractor.h"

#include <cctype>
#include <set>


namespace
{
	clent::AnnotationKind GetMarkerKind(clent::EntityKind kind)
	{
		switch (kind)
		{
		case (clent::KIND_SUPERCLASS): return clent::ANNOTATION_SUPERCLASS;
		case (clent::KIND_EMBEDDABLE): return clent::ANNOTATION_EMBEDDABLE;
		default: return clent::ANNOTATION_ENTITY;
		}
	}


	// Name given either as the "name" argument or through the shorthand assignment
	std::string GetNameArgument(const clent::AnnotationInstance* annotation)
	{
		if (annotation == 0)
			return "";
		return annotation->GetText("name", annotation->GetText("value"));
	}


	// Setting given on the marker annotation or as a standalone annotation
	std::string GetTypeSetting(const clent::ProcessingContext& ctx, const clent::AnnotationList& annotations,
		const clent::AnnotationInstance* marker, const char* key, clent::AnnotationKind standalone_kind)
	{
		if (marker != 0)
		{
			std::string value = marker->GetText(key);
			if (value != "")
				return value;
		}
		return GetNameArgument(ctx.GetCatalog().Find(annotations, standalone_kind));
	}


	void ApplyTypeAnnotations(const clent::ProcessingContext& ctx, const clent::TypeDecl& type, clent::EntityDescriptor& entity)
	{
		const clent::AnnotationCatalog& catalog = ctx.GetCatalog();
		const clent::AnnotationList& annotations = ctx.GetAdapter().AnnotationsOf(type);
		const clent::AnnotationInstance* marker = catalog.Find(annotations, GetMarkerKind(entity.kind));

		entity.is_unimplementable = (type.flags & clent::TYPE_FINAL) != 0 || (marker != 0 && !marker->GetBool("extendable", true));
		entity.is_immutable =
			catalog.Has(annotations, clent::ANNOTATION_IMMUTABLE) ||
			entity.is_unimplementable ||
			(marker != 0 && marker->GetBool("immutable", false));
		entity.is_stateless = entity.is_immutable || entity.is_unimplementable || (marker != 0 && marker->GetBool("stateless", false));
		entity.is_read_only = catalog.Has(annotations, clent::ANNOTATION_READ_ONLY);
		entity.is_view = catalog.Has(annotations, clent::ANNOTATION_VIEW);

		entity.is_cacheable = marker == 0 || marker->GetBool("cacheable", true);
		if (const clent::AnnotationInstance* cacheable = catalog.Find(annotations, clent::ANNOTATION_CACHEABLE))
			entity.is_cacheable = entity.is_cacheable && cacheable->GetBool("value", true);

		if (marker != 0)
			entity.entity_name = marker->GetText("name");

		std::string style = GetTypeSetting(ctx, annotations, marker, "property_name_style", clent::ANNOTATION_PROPERTY_NAME_STYLE);
		if (style != "" && !clent::ParsePropertyNameStyle(style, entity.property_name_style))
			LOG(build, WARNING, "%s(%d) : Unknown property name style '%s' ignored\n", type.filename.c_str(), type.line, style.c_str());

		std::string visibility = GetTypeSetting(ctx, annotations, marker, "property_visibility", clent::ANNOTATION_PROPERTY_VISIBILITY);
		if (visibility != "" && !clent::ParsePropertyVisibility(visibility, entity.property_visibility))
			LOG(build, WARNING, "%s(%d) : Unknown property visibility '%s' ignored\n", type.filename.c_str(), type.line, visibility.c_str());

		// Explicit table, then view, then the default
		entity.table_name = GetNameArgument(catalog.Find(annotations, clent::ANNOTATION_TABLE));
		if (entity.table_name == "")
			entity.table_name = GetNameArgument(catalog.Find(annotations, clent::ANNOTATION_VIEW));
		if (entity.table_name == "")
			entity.table_name = clent::DefaultTableName(entity, ctx.GetOptions().class_prefixes);
	}


	clent::Status AddOwnProperties(const clent::ProcessingContext& ctx, const clent::TypeDecl& type, clent::EntityDescriptor& entity)
	{
		std::vector<const clent::MemberDecl*> members = ctx.GetAdapter().MembersOf(type);
		for (size_t i = 0; i < members.size(); i++)
		{
			clent::PropertyDescriptor property;
			clent::Status status = clent::ExtractProperty(ctx, entity, *members[i], property);
			if (status.IsSkip())
				continue;
			if (status.HasFailed())
				return status;

			// First declaration of a name wins, typically a field over its accessor
			if (entity.HasProperty(property.name))
			{
				LOG(build, INFO, "Dropped '%s' as property '%s' already exists\n", members[i]->name.c_str(), property.name.c_str());
				continue;
			}

			LOG(build, INFO, "Property: %s %s\n", property.type.GetFullName().c_str(), property.name.c_str());
			entity.properties.push_back(property);
		}

		return clent::Status();
	}


	bool IsMappedAncestor(const clent::ProcessingContext& ctx, const std::string& name)
	{
		return ctx.FindDescriptor(clent::KIND_SUPERCLASS, name) != 0 || ctx.FindDescriptor(clent::KIND_EMBEDDABLE, name) != 0;
	}


	// Appends each first base above 'type' until one isn't recorded or has already been seen
	void AddBaseChain(const clent::DeclarationAdapter& adapter, const clent::TypeDecl& type,
		std::set<std::string>& visited, std::vector<const clent::TypeDecl*>& ancestors)
	{
		const clent::TypeDecl* current = &type;
		while (true)
		{
			const std::vector<std::string>& bases = adapter.SuperTypesOf(*current);
			if (bases.empty())
				break;
			const clent::TypeDecl* base = adapter.FindType(bases[0]);
			if (base == 0 || !visited.insert(base->name).second)
				break;
			ancestors.push_back(base);
			current = base;
		}
	}


	//
	// The first-base chain followed by the remaining direct bases that are interfaces or mapped
	// superclasses/embeddables, each with its own first-base chain. Each declaration is visited
	// once.
	//
	std::vector<const clent::TypeDecl*> GetAncestors(const clent::ProcessingContext& ctx, const clent::TypeDecl& type)
	{
		const clent::DeclarationAdapter& adapter = ctx.GetAdapter();

		std::vector<const clent::TypeDecl*> ancestors;
		std::set<std::string> visited;
		visited.insert(type.name);
		AddBaseChain(adapter, type, visited, ancestors);

		const std::vector<std::string>& bases = adapter.SuperTypesOf(type);
		for (size_t i = 0; i < bases.size(); i++)
		{
			const clent::TypeDecl* base = adapter.FindType(bases[i]);
			if (base == 0 || visited.count(base->name) != 0)
				continue;
			if (!adapter.IsInterface(*base) && !IsMappedAncestor(ctx, base->name))
				continue;

			visited.insert(base->name);
			ancestors.push_back(base);
			AddBaseChain(adapter, *base, visited, ancestors);
		}

		return ancestors;
	}


	void MergeInheritedProperties(const clent::ProcessingContext& ctx, const clent::TypeDecl& type, clent::EntityDescriptor& entity)
	{
		std::vector<const clent::TypeDecl*> ancestors = GetAncestors(ctx, type);
		for (size_t i = 0; i < ancestors.size(); i++)
		{
			const std::string& name = ancestors[i]->name;
			const clent::EntityDescriptor* ancestor = ctx.FindDescriptor(clent::KIND_SUPERCLASS, name);
			if (ancestor == 0)
				ancestor = ctx.FindDescriptor(clent::KIND_EMBEDDABLE, name);
			if (ancestor == 0)
				continue;

			// Local properties shadow inherited ones
			LOG(build, INFO, "Inherits: %s\n", name.c_str());
			for (size_t j = 0; j < ancestor->properties.size(); j++)
			{
				const clent::PropertyDescriptor& property = ancestor->properties[j];
				if (!entity.HasProperty(property.name))
					entity.properties.push_back(property);
			}
		}
	}
}


std::string clent::DefaultTableName(const EntityDescriptor& entity, const std::vector<std::string>& class_prefixes)
{
	if (entity.is_interface || entity.is_immutable)
		return entity.simple_name;

	// Only strip prefixes that are followed by the start of another word
	const std::string& name = entity.simple_name;
	for (size_t i = 0; i < class_prefixes.size(); i++)
	{
		const std::string& prefix = class_prefixes[i];
		if (prefix != "" && name.size() > prefix.size() && startswith(name, prefix.c_str()) && isupper((unsigned char)name[prefix.size()]))
			return name.substr(prefix.size());
	}

	return name;
}


clent::Status clent::BuildEntity(const ProcessingContext& ctx, const TypeDecl& type, EntityKind kind, EntityDescriptor& entity)
{
	if (type.name == "")
		return Status::Fail(DIAG_MISSING_QUALIFIED_NAME, "Declaration has no qualified name");

	const DeclarationAdapter& adapter = ctx.GetAdapter();

	LOG(build, INFO, "Processing %s: %s\n", GetEntityKindName(kind), type.name.c_str());
	LOG_PUSH_INDENT(build);

	entity.kind = kind;
	entity.package_name = type.package;
	entity.simple_name = type.simple_name;
	entity.qualified_name = type.name;
	entity.source_file = type.filename;
	entity.line = type.line;
	entity.declaration = &type;
	entity.is_interface = adapter.IsInterface(type);
	entity.is_abstract = adapter.IsAbstract(type);

	ApplyTypeAnnotations(ctx, type, entity);

	Status status = AddOwnProperties(ctx, type, entity);
	if (status.IsOk() && kind == KIND_ENTITY)
		MergeInheritedProperties(ctx, type, entity);

	LOG_POP_INDENT(build);

	if (status.HasFailed())
		return Status::JoinFail(status, "Failed to build '" + type.name + "'");
	return Status();
}
