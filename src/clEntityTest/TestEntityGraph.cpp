
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "TestModels.h"

#include <clEntityCore/EntityBuilder.h>
#include <clEntityCore/EntityGraph.h>
#include <clEntityCore/ProcessingContext.h>

#include <gtest/gtest.h>


namespace
{
	void Build(clent::ProcessingContext& ctx, const char* name, clent::EntityKind kind)
	{
		clent::EntityDescriptor entity;
		ASSERT_TRUE(clent::BuildEntity(ctx, *ctx.GetAdapter().FindType(name), kind, entity).IsOk());
		ASSERT_TRUE(ctx.AddDescriptor(entity));
	}
}


TEST(EntityGraph, AssemblesPersonModel)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);
	Build(ctx, "model::BaseEntity", clent::KIND_SUPERCLASS);
	Build(ctx, "model::Phone", clent::KIND_EMBEDDABLE);
	Build(ctx, "model::Address", clent::KIND_ENTITY);
	Build(ctx, "model::Person", clent::KIND_ENTITY);

	clent::EntityGraph graph;
	clent::AssembleGraph(ctx, graph);
	EXPECT_TRUE(graph.IsFrozen());
	EXPECT_EQ(4u, graph.Size());
	EXPECT_EQ(2u, graph.GetEntities(clent::KIND_ENTITY).size());
	EXPECT_EQ(1u, graph.GetEntities(clent::KIND_SUPERCLASS).size());
	EXPECT_EQ(1u, graph.GetEntities(clent::KIND_EMBEDDABLE).size());

	// Ordered by qualified name
	std::vector<const clent::EntityDescriptor*> entities = graph.GetEntities();
	ASSERT_EQ(4u, entities.size());
	EXPECT_EQ("model::Address", entities[0]->qualified_name);
	EXPECT_EQ("model::Phone", entities[3]->qualified_name);

	// Embeddables aren't relationship targets
	ASSERT_EQ(1u, graph.GetEdges().size());
	const clent::RelationshipEdge* edge = graph.FindEdge("model::Person", "address");
	ASSERT_TRUE(edge != 0);
	EXPECT_EQ("model::Address", edge->target);
	EXPECT_EQ(clent::MANY_TO_ONE, edge->property->cardinality);
	EXPECT_TRUE(graph.FindEdge("model::Person", "phones") == 0);

	// Every property including inherited copies
	EXPECT_EQ(2u + 1u + 2u + 6u, graph.GetProperties().size());
}


TEST(EntityGraph, NothingAddedOnceFrozen)
{
	clent::EntityDescriptor entity;
	entity.qualified_name = "model::Thing";

	clent::EntityGraph graph;
	EXPECT_TRUE(graph.AddEntity(entity));
	EXPECT_FALSE(graph.AddEntity(entity));
	graph.Freeze();

	entity.qualified_name = "model::Other";
	EXPECT_FALSE(graph.AddEntity(entity));
	EXPECT_FALSE(graph.AddEdge("model::Thing", "other", "model::Other"));
	EXPECT_EQ(1u, graph.Size());
}


TEST(EntityGraph, RelationshipTargets)
{
	clent::PropertyDescriptor property;
	property.type_name = "model::Address";
	property.type = test::Pointer("model::Address");
	EXPECT_EQ("model::Address", clent::GetRelationshipTarget(property));

	property.type = test::Container("std::set", clent::SHAPE_SET, "const model::Tag *");
	EXPECT_EQ("model::Tag", clent::GetRelationshipTarget(property));

	property.referenced_type_name = "model::Label";
	EXPECT_EQ("model::Label", clent::GetRelationshipTarget(property));
}


TEST(EntityGraph, SkipsUnknownTargets)
{
	clent::DeclDatabase db;
	clent::TypeDecl& order = test::AddType(db, "shop::Order", "entity");
	test::AddField(db, order, "id", test::Value("int"), "key");
	test::AddField(db, order, "customer", test::Pointer("shop::Customer"), "many_to_one");
	test::AddField(db, order, "self", test::Pointer("shop::Order"), "one_to_one");
	test::AddField(db, order, "note", test::Pointer("shop::Note"), "one_to_one");

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);
	Build(ctx, "shop::Order", clent::KIND_ENTITY);

	clent::EntityGraph graph;
	clent::AssembleGraph(ctx, graph);

	// Self references are fine, unknown types aren't entities
	ASSERT_EQ(1u, graph.GetEdges().size());
	EXPECT_EQ("shop::Order", graph.GetEdges()[0].target);
	EXPECT_TRUE(graph.FindEdge("shop::Order", "customer") == 0);

	// Properties without an edge are still listed
	bool has_customer = false;
	const std::vector<clent::PropertyRef>& properties = graph.GetProperties();
	for (size_t i = 0; i < properties.size(); i++)
	{
		if (properties[i].owner->qualified_name == "shop::Order" && properties[i].property->name == "customer")
			has_customer = true;
	}
	EXPECT_TRUE(has_customer);
	EXPECT_EQ(4u, properties.size());
}
