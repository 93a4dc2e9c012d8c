
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "EntityGraph.h"
#include "Logging.h"
#include "ProcessingContext.h"


namespace
{
	void AddDescriptors(const clent::ProcessingContext& ctx, clent::EntityKind kind, clent::EntityGraph& graph)
	{
		const clent::EntityMap& descriptors = ctx.GetDescriptors(kind);
		for (clent::EntityMap::const_iterator i = descriptors.begin(); i != descriptors.end(); ++i)
		{
			if (!graph.AddEntity(i->second))
				LOG(graph, INFO, "Skipped %s '%s' as the name is already taken\n", clent::GetEntityKindName(kind), i->first.c_str());
		}
	}


	const clent::EntityDescriptor* FindTarget(const clent::EntityGraph& graph, const std::string& name)
	{
		// Entities take precedence over superclasses by being added first
		const clent::EntityDescriptor* target = graph.Find(name);
		if (target == 0 || target->kind == clent::KIND_EMBEDDABLE)
			return 0;
		return target;
	}
}


clent::EntityGraph::EntityGraph()
	: m_Frozen(false)
{
}


bool clent::EntityGraph::AddEntity(const EntityDescriptor& entity)
{
	if (m_Frozen || m_Entities.find(entity.qualified_name) != m_Entities.end())
		return false;

	// Map nodes don't move so property pointers remain valid as more entities are added
	EntityDescriptor& added = m_Entities[entity.qualified_name];
	added = entity;
	for (size_t i = 0; i < added.properties.size(); i++)
	{
		PropertyRef ref;
		ref.owner = &added;
		ref.property = &added.properties[i];
		m_Properties.push_back(ref);
	}

	return true;
}


bool clent::EntityGraph::AddEdge(const std::string& source, const std::string& property_name, const std::string& target)
{
	if (m_Frozen)
		return false;

	RelationshipEdge edge;
	edge.source = source;
	edge.target = target;
	if (const EntityDescriptor* entity = Find(source))
		edge.property = entity->FindProperty(property_name);
	m_Edges.push_back(edge);
	return true;
}


const clent::EntityDescriptor* clent::EntityGraph::Find(const std::string& qualified_name) const
{
	EntityMap::const_iterator i = m_Entities.find(qualified_name);
	if (i == m_Entities.end())
		return 0;
	return &i->second;
}


std::vector<const clent::EntityDescriptor*> clent::EntityGraph::GetEntities() const
{
	std::vector<const EntityDescriptor*> entities;
	for (EntityMap::const_iterator i = m_Entities.begin(); i != m_Entities.end(); ++i)
		entities.push_back(&i->second);
	return entities;
}


std::vector<const clent::EntityDescriptor*> clent::EntityGraph::GetEntities(EntityKind kind) const
{
	std::vector<const EntityDescriptor*> entities;
	for (EntityMap::const_iterator i = m_Entities.begin(); i != m_Entities.end(); ++i)
	{
		if (i->second.kind == kind)
			entities.push_back(&i->second);
	}
	return entities;
}


const clent::RelationshipEdge* clent::EntityGraph::FindEdge(const std::string& source, const std::string& property_name) const
{
	for (size_t i = 0; i < m_Edges.size(); i++)
	{
		const RelationshipEdge& edge = m_Edges[i];
		if (edge.source == source && edge.property != 0 && edge.property->name == property_name)
			return &edge;
	}
	return 0;
}


std::string clent::GetRelationshipTarget(const PropertyDescriptor& property)
{
	if (property.referenced_type_name != "")
		return property.referenced_type_name;
	if (property.type.HasElement())
		return property.type.GetElement();
	return property.type_name;
}


void clent::AssembleGraph(const ProcessingContext& ctx, EntityGraph& graph)
{
	AddDescriptors(ctx, KIND_ENTITY, graph);
	AddDescriptors(ctx, KIND_SUPERCLASS, graph);
	AddDescriptors(ctx, KIND_EMBEDDABLE, graph);

	// Relationship edges from every non-transient property with a cardinality
	const std::vector<PropertyRef>& properties = graph.GetProperties();
	std::vector<RelationshipEdge> edges;
	for (size_t i = 0; i < properties.size(); i++)
	{
		const PropertyRef& ref = properties[i];
		const PropertyDescriptor& property = *ref.property;
		if (property.cardinality == CARDINALITY_NONE || property.is_transient)
			continue;

		std::string target_name = GetRelationshipTarget(property);
		const EntityDescriptor* target = FindTarget(graph, target_name);
		if (target == 0)
		{
			LOG(graph, INFO, "No edge for %s.%s; '%s' is not an entity\n", ref.owner->qualified_name.c_str(), property.name.c_str(), target_name.c_str());
			continue;
		}

		RelationshipEdge edge;
		edge.source = ref.owner->qualified_name;
		edge.target = target->qualified_name;
		edge.property = &property;
		edges.push_back(edge);
	}

	for (size_t i = 0; i < edges.size(); i++)
	{
		const RelationshipEdge& edge = edges[i];
		LOG(graph, INFO, "Edge: %s.%s -> %s (%s)\n", edge.source.c_str(), edge.property->name.c_str(), edge.target.c_str(), GetCardinalityName(edge.property->cardinality));
		graph.AddEdge(edge.source, edge.property->name, edge.target);
	}

	graph.Freeze();
}
