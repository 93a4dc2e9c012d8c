
//
// ===============================================================================
// clEntity, EntityGraph.h - Cross-referenced graph of all built descriptors
// and the relationships between them.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "Descriptors.h"

#include <map>
#include <string>
#include <vector>


namespace clent
{
	class ProcessingContext;


	struct PropertyRef
	{
		PropertyRef()
			: owner(0)
			, property(0)
		{
		}

		const EntityDescriptor* owner;
		const PropertyDescriptor* property;
	};


	struct RelationshipEdge
	{
		RelationshipEdge()
			: property(0)
		{
		}

		// Qualified names of both ends
		std::string source;
		std::string target;

		// Property of the source that the edge comes from, null if the source isn't in the graph
		const PropertyDescriptor* property;
	};


	//
	// Owns copies of every descriptor, keyed and ordered by qualified name. Nothing can be added
	// once frozen, after which all pointers handed out stay valid for the life of the graph.
	//
	class EntityGraph
	{
	public:
		EntityGraph();

		EntityGraph(const EntityGraph&) = delete;
		EntityGraph& operator = (const EntityGraph&) = delete;

		// Returns false if frozen or a descriptor of the same name is already present
		bool AddEntity(const EntityDescriptor& entity);

		// Returns false if frozen. Neither end has to be present in the graph.
		bool AddEdge(const std::string& source, const std::string& property_name, const std::string& target);

		void Freeze() { m_Frozen = true; }
		bool IsFrozen() const { return m_Frozen; }

		const EntityDescriptor* Find(const std::string& qualified_name) const;

		std::vector<const EntityDescriptor*> GetEntities() const;
		std::vector<const EntityDescriptor*> GetEntities(EntityKind kind) const;

		// Every property of every descriptor, transient ones included
		const std::vector<PropertyRef>& GetProperties() const { return m_Properties; }

		const std::vector<RelationshipEdge>& GetEdges() const { return m_Edges; }
		const RelationshipEdge* FindEdge(const std::string& source, const std::string& property_name) const;

		size_t Size() const { return m_Entities.size(); }

	private:
		typedef std::map<std::string, EntityDescriptor> EntityMap;
		EntityMap m_Entities;

		std::vector<PropertyRef> m_Properties;
		std::vector<RelationshipEdge> m_Edges;

		bool m_Frozen;
	};


	// Name of the type a relationship property points at
	std::string GetRelationshipTarget(const PropertyDescriptor& property);


	//
	// Populates and freezes the graph from the descriptor maps of the context: entities first,
	// then superclasses, then embeddables. Relationship targets are searched for amongst
	// entities, then superclasses, and unresolved targets add no edge.
	//
	void AssembleGraph(const ProcessingContext& ctx, EntityGraph& graph);
}
