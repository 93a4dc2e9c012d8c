
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "Validator.h"
#include "EntityGraph.h"

#include <cctype>


namespace
{
	const char* g_ReservedWords[] =
	{
		"add", "all", "alter", "and", "as", "asc", "between", "by", "case", "check",
		"column", "constraint", "create", "cross", "current", "default", "delete", "desc", "distinct", "drop",
		"else", "end", "exists", "foreign", "from", "full", "grant", "group", "having", "in",
		"index", "inner", "insert", "intersect", "into", "is", "join", "key", "left", "like",
		"limit", "not", "null", "offset", "on", "or", "order", "outer", "primary", "references",
		"right", "select", "set", "table", "then", "to", "union", "unique", "update", "user",
		"using", "values", "view", "when", "where", "with",
	};


	void AddDiagnostic(clent::DiagnosticList& diagnostics, clent::Severity severity, clent::DiagnosticCode code,
		const clent::EntityDescriptor& entity, const clent::PropertyDescriptor* property, const std::string& message)
	{
		clent::Diagnostic diag;
		diag.severity = severity;
		diag.code = code;
		diag.message = message;
		diag.subject = entity.qualified_name;
		diag.filename = entity.source_file;
		diag.line = entity.line;
		if (property != 0)
		{
			diag.property = property->name;

			// Point at the member itself where it's known
			if (property->member != 0 && property->member->line != 0)
				diag.line = property->member->line;
		}
		diagnostics.push_back(diag);
	}


	int CountBits(unsigned int value)
	{
		int count = 0;
		for (; value; value &= value - 1)
			count++;
		return count;
	}


	void CheckKeys(clent::DiagnosticList& diagnostics, const clent::EntityDescriptor& entity)
	{
		int nb_keys = 0, nb_versions = 0;
		for (size_t i = 0; i < entity.properties.size(); i++)
		{
			const clent::PropertyDescriptor& property = entity.properties[i];
			if (property.is_transient)
				continue;
			nb_keys += property.is_key;
			nb_versions += property.is_version;
		}

		if (nb_keys == 0)
			AddDiagnostic(diagnostics, clent::SEVERITY_ERROR, clent::DIAG_MISSING_KEY, entity, 0,
				"Entity '" + entity.qualified_name + "' has no key property");
		if (nb_versions > 1)
			AddDiagnostic(diagnostics, clent::SEVERITY_ERROR, clent::DIAG_MULTIPLE_VERSION, entity, 0,
				"Entity '" + entity.qualified_name + "' has more than one version property");
	}


	void CheckProperties(clent::DiagnosticList& diagnostics, const clent::EntityDescriptor& entity)
	{
		for (size_t i = 0; i < entity.properties.size(); i++)
		{
			const clent::PropertyDescriptor& property = entity.properties[i];
			if (property.is_transient)
				continue;

			if (property.IsToMany() && !property.is_collection)
			{
				AddDiagnostic(diagnostics, clent::SEVERITY_ERROR, clent::DIAG_TO_MANY_NOT_COLLECTION, entity, &property,
					"Property '" + property.name + "' is " + clent::GetCardinalityName(property.cardinality) + " but its type '" +
					property.type.GetFullName() + "' is not a collection");
			}

			if (CountBits(property.declared_cardinalities) > 1)
			{
				AddDiagnostic(diagnostics, clent::SEVERITY_ERROR, clent::DIAG_MULTIPLE_CARDINALITY, entity, &property,
					"Property '" + property.name + "' has more than one relationship annotation, using " +
					clent::GetCardinalityName(property.cardinality));
			}
		}
	}


	void CheckEntityWarnings(clent::DiagnosticList& diagnostics, const clent::EntityDescriptor& entity)
	{
		// Transient properties are never stored
		std::vector<const clent::PropertyDescriptor*> stored;
		for (size_t i = 0; i < entity.properties.size(); i++)
		{
			if (!entity.properties[i].is_transient)
				stored.push_back(&entity.properties[i]);
		}

		if (stored.empty())
		{
			AddDiagnostic(diagnostics, clent::SEVERITY_WARNING, clent::DIAG_EMPTY_ENTITY, entity, 0,
				"Entity '" + entity.qualified_name + "' has no properties");
			return;
		}

		// Nothing can ever be written to a table whose only column is generated
		if (stored.size() == 1 && !entity.is_read_only)
		{
			const clent::PropertyDescriptor& property = *stored[0];
			if (property.is_key && property.is_generated)
				AddDiagnostic(diagnostics, clent::SEVERITY_WARNING, clent::DIAG_LONE_GENERATED_KEY, entity, &property,
					"Entity '" + entity.qualified_name + "' only has a generated key property");
		}
	}


	void CheckEdges(clent::DiagnosticList& diagnostics, const clent::EntityGraph& graph)
	{
		const std::vector<clent::RelationshipEdge>& edges = graph.GetEdges();
		for (size_t i = 0; i < edges.size(); i++)
		{
			const clent::RelationshipEdge& edge = edges[i];
			const clent::EntityDescriptor* source = graph.Find(edge.source);
			const clent::EntityDescriptor* target = graph.Find(edge.target);
			if (source != 0 && target != 0)
				continue;

			std::string message = "Relationship from '" + edge.source + "' to '" + edge.target + "' has no " + (source == 0 ? "source" : "target");
			if (source != 0)
			{
				AddDiagnostic(diagnostics, clent::SEVERITY_ERROR, clent::DIAG_DANGLING_RELATIONSHIP, *source, edge.property, message);
			}
			else
			{
				clent::Diagnostic diag;
				diag.code = clent::DIAG_DANGLING_RELATIONSHIP;
				diag.message = message;
				diag.subject = edge.source;
				diagnostics.push_back(diag);
			}
		}
	}
}


bool clent::IsReservedTableName(const std::string& name)
{
	std::string lower = name;
	for (size_t i = 0; i < lower.size(); i++)
		lower[i] = (char)tolower((unsigned char)lower[i]);

	for (size_t i = 0; i < sizeof(g_ReservedWords) / sizeof(g_ReservedWords[0]); i++)
	{
		if (lower == g_ReservedWords[i])
			return true;
	}
	return false;
}


bool clent::IsValidIdentifier(const std::string& name)
{
	if (name.empty() || isdigit((unsigned char)name[0]))
		return false;
	for (size_t i = 0; i < name.size(); i++)
	{
		if (!isalnum((unsigned char)name[i]) && name[i] != '_')
			return false;
	}
	return true;
}


clent::DiagnosticList clent::ValidateGraph(const EntityGraph& graph)
{
	DiagnosticList diagnostics;

	std::vector<const EntityDescriptor*> entities = graph.GetEntities();
	for (size_t i = 0; i < entities.size(); i++)
	{
		const EntityDescriptor& entity = *entities[i];

		if (entity.kind == KIND_ENTITY)
		{
			CheckKeys(diagnostics, entity);

			if (entity.entity_name != "" && !IsValidIdentifier(entity.entity_name))
				AddDiagnostic(diagnostics, SEVERITY_ERROR, DIAG_INVALID_ENTITY_NAME, entity, 0,
					"Entity name '" + entity.entity_name + "' is not a valid identifier");

			if (IsReservedTableName(entity.table_name))
				AddDiagnostic(diagnostics, SEVERITY_WARNING, DIAG_RESERVED_TABLE_NAME, entity, 0,
					"Table name '" + entity.table_name + "' is a reserved SQL word");

			CheckEntityWarnings(diagnostics, entity);
		}

		CheckProperties(diagnostics, entity);
	}

	CheckEdges(diagnostics, graph);

	return diagnostics;
}
