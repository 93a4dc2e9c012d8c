
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "TestModels.h"

#include <clEntityCore/EntityGraph.h>
#include <clEntityCore/Validator.h>

#include <gtest/gtest.h>


namespace
{
	clent::EntityDescriptor MakeEntity(const char* qualified_name, clent::EntityKind kind = clent::KIND_ENTITY)
	{
		clent::EntityDescriptor entity;
		entity.qualified_name = qualified_name;
		entity.kind = kind;
		entity.table_name = "things";
		entity.source_file = "model/Model.h";
		entity.line = 5;
		return entity;
	}


	clent::PropertyDescriptor MakeProperty(const char* name, bool is_key = false)
	{
		clent::PropertyDescriptor property;
		property.name = name;
		property.column_name = name;
		property.type = test::Value("int");
		property.type_name = "int";
		property.is_key = is_key;
		return property;
	}


	clent::DiagnosticList Validate(const clent::EntityDescriptor& entity)
	{
		clent::EntityGraph graph;
		graph.AddEntity(entity);
		graph.Freeze();
		return clent::ValidateGraph(graph);
	}
}


TEST(Validator, ValidEntityHasNoFindings)
{
	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("id", true));
	entity.properties.push_back(MakeProperty("size"));
	EXPECT_TRUE(Validate(entity).empty());
}


TEST(Validator, MissingKey)
{
	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("size"));

	// Transient keys don't count
	clent::PropertyDescriptor transient = MakeProperty("id", true);
	transient.is_transient = true;
	entity.properties.push_back(transient);

	clent::DiagnosticList diagnostics = Validate(entity);
	ASSERT_EQ(1u, diagnostics.size());
	EXPECT_EQ(clent::DIAG_MISSING_KEY, diagnostics[0].code);
	EXPECT_EQ(clent::SEVERITY_ERROR, diagnostics[0].severity);
	EXPECT_EQ("model::Thing", diagnostics[0].subject);
	EXPECT_EQ("model/Model.h", diagnostics[0].filename);
	EXPECT_EQ(5, diagnostics[0].line);

	// Superclasses don't need keys of their own
	entity.kind = clent::KIND_SUPERCLASS;
	EXPECT_TRUE(Validate(entity).empty());
}


TEST(Validator, MultipleVersions)
{
	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("id", true));
	entity.properties.push_back(MakeProperty("v1"));
	entity.properties.push_back(MakeProperty("v2"));
	entity.properties[1].is_version = true;
	entity.properties[2].is_version = true;

	clent::DiagnosticList diagnostics = Validate(entity);
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_MULTIPLE_VERSION));
	EXPECT_TRUE(clent::HasErrors(diagnostics));
}


TEST(Validator, ToManyNeedsCollection)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = test::AddType(db, "model::Thing", "entity", 5);
	clent::MemberDecl& member = test::AddField(db, type, "parts", test::Pointer("model::Part"));

	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("id", true));
	clent::PropertyDescriptor parts = MakeProperty("parts");
	parts.cardinality = clent::ONE_TO_MANY;
	parts.declared_cardinalities = clent::CardinalityBit(clent::ONE_TO_MANY);
	parts.member = &member;
	entity.properties.push_back(parts);

	clent::DiagnosticList diagnostics = Validate(entity);
	ASSERT_EQ(1u, diagnostics.size());
	EXPECT_EQ(clent::DIAG_TO_MANY_NOT_COLLECTION, diagnostics[0].code);
	EXPECT_EQ("parts", diagnostics[0].property);

	// Reported where the member is declared
	EXPECT_EQ(member.line, diagnostics[0].line);

	// Embeddables are checked too
	entity.kind = clent::KIND_EMBEDDABLE;
	EXPECT_EQ(1u, clent::CountDiagnostics(Validate(entity), clent::DIAG_TO_MANY_NOT_COLLECTION));
}


TEST(Validator, MultipleCardinalities)
{
	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("id", true));
	clent::PropertyDescriptor owner = MakeProperty("owner");
	owner.cardinality = clent::ONE_TO_ONE;
	owner.declared_cardinalities = clent::CardinalityBit(clent::ONE_TO_ONE) | clent::CardinalityBit(clent::MANY_TO_ONE);
	entity.properties.push_back(owner);

	EXPECT_EQ(1u, clent::CountDiagnostics(Validate(entity), clent::DIAG_MULTIPLE_CARDINALITY));
}


TEST(Validator, InvalidEntityName)
{
	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("id", true));
	entity.entity_name = "Thing Impl";
	EXPECT_EQ(1u, clent::CountDiagnostics(Validate(entity), clent::DIAG_INVALID_ENTITY_NAME));

	entity.entity_name = "ThingImpl";
	EXPECT_TRUE(Validate(entity).empty());

	EXPECT_TRUE(clent::IsValidIdentifier("_Thing2"));
	EXPECT_FALSE(clent::IsValidIdentifier("2Thing"));
	EXPECT_FALSE(clent::IsValidIdentifier(""));
	EXPECT_FALSE(clent::IsValidIdentifier("a::b"));
}


TEST(Validator, Warnings)
{
	clent::EntityDescriptor empty = MakeEntity("model::Empty");
	clent::DiagnosticList diagnostics = Validate(empty);
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_EMPTY_ENTITY));
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_MISSING_KEY));

	clent::EntityDescriptor lone = MakeEntity("model::Counter");
	lone.properties.push_back(MakeProperty("id", true));
	lone.properties[0].is_generated = true;
	diagnostics = Validate(lone);
	ASSERT_EQ(1u, diagnostics.size());
	EXPECT_EQ(clent::DIAG_LONE_GENERATED_KEY, diagnostics[0].code);
	EXPECT_EQ(clent::SEVERITY_WARNING, diagnostics[0].severity);
	EXPECT_FALSE(clent::HasErrors(diagnostics));

	lone.is_read_only = true;
	EXPECT_TRUE(Validate(lone).empty());

	clent::EntityDescriptor reserved = MakeEntity("model::Order");
	reserved.properties.push_back(MakeProperty("id", true));
	reserved.table_name = "Order";
	diagnostics = Validate(reserved);
	ASSERT_EQ(1u, diagnostics.size());
	EXPECT_EQ(clent::DIAG_RESERVED_TABLE_NAME, diagnostics[0].code);

	EXPECT_TRUE(clent::IsReservedTableName("SELECT"));
	EXPECT_FALSE(clent::IsReservedTableName("orders"));
}


TEST(Validator, WarningsIgnoreTransientProperties)
{
	clent::PropertyDescriptor cache = MakeProperty("cache");
	cache.is_transient = true;

	clent::EntityDescriptor lone = MakeEntity("model::Counter");
	lone.properties.push_back(MakeProperty("id", true));
	lone.properties[0].is_generated = true;
	lone.properties.push_back(cache);
	clent::DiagnosticList diagnostics = Validate(lone);
	ASSERT_EQ(1u, diagnostics.size());
	EXPECT_EQ(clent::DIAG_LONE_GENERATED_KEY, diagnostics[0].code);

	clent::EntityDescriptor empty = MakeEntity("model::Scratch");
	empty.properties.push_back(cache);
	diagnostics = Validate(empty);
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_EMPTY_ENTITY));
}


TEST(Validator, DanglingRelationships)
{
	clent::EntityDescriptor entity = MakeEntity("model::Thing");
	entity.properties.push_back(MakeProperty("id", true));
	clent::PropertyDescriptor part = MakeProperty("part");
	part.cardinality = clent::MANY_TO_ONE;
	part.declared_cardinalities = clent::CardinalityBit(clent::MANY_TO_ONE);
	entity.properties.push_back(part);

	clent::EntityGraph graph;
	graph.AddEntity(entity);
	graph.AddEdge("model::Thing", "part", "model::Missing");
	graph.AddEdge("model::Ghost", "thing", "model::Thing");
	graph.Freeze();

	clent::DiagnosticList diagnostics = clent::ValidateGraph(graph);
	ASSERT_EQ(2u, diagnostics.size());
	EXPECT_EQ(clent::DIAG_DANGLING_RELATIONSHIP, diagnostics[0].code);
	EXPECT_EQ("part", diagnostics[0].property);
	EXPECT_EQ(clent::DIAG_DANGLING_RELATIONSHIP, diagnostics[1].code);
	EXPECT_EQ("model::Ghost", diagnostics[1].subject);
}


TEST(Validator, ReportsEverythingAtOnce)
{
	clent::EntityDescriptor entity = MakeEntity("model::Select");
	entity.table_name = "select";
	entity.entity_name = "1Select";
	clent::PropertyDescriptor v1 = MakeProperty("v1"), v2 = MakeProperty("v2");
	v1.is_version = true;
	v2.is_version = true;
	entity.properties.push_back(v1);
	entity.properties.push_back(v2);

	clent::DiagnosticList diagnostics = Validate(entity);
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_MISSING_KEY));
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_MULTIPLE_VERSION));
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_INVALID_ENTITY_NAME));
	EXPECT_EQ(1u, clent::CountDiagnostics(diagnostics, clent::DIAG_RESERVED_TABLE_NAME));
}
