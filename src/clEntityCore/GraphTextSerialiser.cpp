
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "GraphTextSerialiser.h"
#include "EntityGraph.h"

#include <cstdio>
#include <cstring>


namespace
{
	const char* g_Ruler = "-------------------------------------------------------------------------\n";


	void AppendTableHeader(std::string& text, const char* title, const char* headers)
	{
		std::string ruler = g_Ruler;
		ruler.replace(5, strlen(title) + 1, std::string(title) + " ");
		text += ruler;
		text += headers;
		text += "\n";
		text += g_Ruler;
	}


	void AppendTableFooter(std::string& text)
	{
		text += g_Ruler;
		text += "\n\n";
	}


	const char* Flag(bool set, const char* name)
	{
		return set ? name : "";
	}


	std::string EntityFlags(const clent::EntityDescriptor& entity)
	{
		std::string flags;
		flags += Flag(entity.is_abstract, " abstract");
		flags += Flag(entity.is_interface, " interface");
		flags += Flag(entity.is_immutable, " immutable");
		flags += Flag(entity.is_read_only, " read_only");
		flags += Flag(entity.is_stateless, " stateless");
		flags += Flag(!entity.is_cacheable, " uncacheable");
		flags += Flag(entity.is_view, " view");
		flags += Flag(entity.is_unimplementable, " final");
		return flags.empty() ? "-" : flags.substr(1);
	}


	std::string PropertyFlags(const clent::PropertyDescriptor& property)
	{
		std::string flags;
		flags += Flag(property.is_key, " key");
		flags += Flag(property.is_generated, " generated");
		flags += Flag(property.is_version, " version");
		flags += Flag(property.is_nullable, " nullable");
		flags += Flag(property.is_transient, " transient");
		flags += Flag(property.is_lazy, " lazy");
		flags += Flag(property.is_read_only, " read_only");
		flags += Flag(property.is_collection, " collection");
		return flags.empty() ? "-" : flags.substr(1);
	}
}


std::string clent::GraphToText(const EntityGraph& graph)
{
	std::string text = "\nclEntity Graph\n\n\n";
	std::vector<const EntityDescriptor*> entities = graph.GetEntities();

	AppendTableHeader(text, "Entities", "Name\t\tKind\tTable\tStyle\tFlags");
	for (size_t i = 0; i < entities.size(); i++)
	{
		const EntityDescriptor& entity = *entities[i];
		text += entity.qualified_name + "\t" + GetEntityKindName(entity.kind) + "\t" + entity.table_name + "\t";
		text += std::string(GetPropertyNameStyleName(entity.property_name_style)) + "\t" + EntityFlags(entity) + "\n";
	}
	AppendTableFooter(text);

	AppendTableHeader(text, "Properties", "Owner\t\tName\tColumn\tType\t\tCardinality\tFlags");
	for (size_t i = 0; i < entities.size(); i++)
	{
		const EntityDescriptor& entity = *entities[i];
		for (size_t j = 0; j < entity.properties.size(); j++)
		{
			const PropertyDescriptor& property = entity.properties[j];
			text += entity.qualified_name + "\t" + property.name + "\t" + property.column_name + "\t" + property.type.GetFullName() + "\t";
			text += std::string(GetCardinalityName(property.cardinality)) + "\t" + PropertyFlags(property) + "\n";
		}
	}
	AppendTableFooter(text);

	AppendTableHeader(text, "Edges", "Source\t\tProperty\tTarget");
	const std::vector<RelationshipEdge>& edges = graph.GetEdges();
	for (size_t i = 0; i < edges.size(); i++)
	{
		const RelationshipEdge& edge = edges[i];
		text += edge.source + "\t" + (edge.property ? edge.property->name : std::string("-")) + "\t" + edge.target + "\n";
	}
	AppendTableFooter(text);

	return text;
}


bool clent::WriteGraphText(const char* filename, const EntityGraph& graph)
{
	FILE* fp = fopen(filename, "w");
	if (fp == 0)
		return false;

	std::string text = GraphToText(graph);
	fwrite(text.c_str(), 1, text.size(), fp);
	fclose(fp);
	return true;
}
