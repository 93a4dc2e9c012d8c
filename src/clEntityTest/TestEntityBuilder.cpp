
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
#include <clEntityCore/ProcessingContext.h>

#include <gtest/gtest.h>


namespace
{
	clent::EntityDescriptor NamedEntity(const char* simple_name)
	{
		clent::EntityDescriptor entity;
		entity.simple_name = simple_name;
		return entity;
	}


	std::vector<std::string> PropertyNames(const clent::EntityDescriptor& entity)
	{
		std::vector<std::string> names;
		for (size_t i = 0; i < entity.properties.size(); i++)
			names.push_back(entity.properties[i].name);
		return names;
	}
}


TEST(DefaultTableName, StripsClassPrefixes)
{
	clent::ProcessingOptions options;
	EXPECT_EQ("Person", clent::DefaultTableName(NamedEntity("Person"), options.class_prefixes));
	EXPECT_EQ("Person", clent::DefaultTableName(NamedEntity("AbstractPerson"), options.class_prefixes));
	EXPECT_EQ("Account", clent::DefaultTableName(NamedEntity("BaseAccount"), options.class_prefixes));

	// Only whole words are stripped
	EXPECT_EQ("Basement", clent::DefaultTableName(NamedEntity("Basement"), options.class_prefixes));
	EXPECT_EQ("Base", clent::DefaultTableName(NamedEntity("Base"), options.class_prefixes));

	std::vector<std::string> custom;
	custom.push_back("My");
	EXPECT_EQ("Person", clent::DefaultTableName(NamedEntity("MyPerson"), custom));
	EXPECT_EQ("AbstractPerson", clent::DefaultTableName(NamedEntity("AbstractPerson"), custom));
}


TEST(DefaultTableName, KeepsInterfaceAndValueNames)
{
	clent::ProcessingOptions options;
	clent::EntityDescriptor entity = NamedEntity("AbstractPerson");
	entity.is_interface = true;
	EXPECT_EQ("AbstractPerson", clent::DefaultTableName(entity, options.class_prefixes));

	entity.is_interface = false;
	entity.is_immutable = true;
	EXPECT_EQ("AbstractPerson", clent::DefaultTableName(entity, options.class_prefixes));
}


TEST(EntityBuilder, TypeAnnotations)
{
	clent::DeclDatabase db;
	test::AddType(db, "shop::Item", "entity(name = \"ItemImpl\", property_name_style = FLUENT, cacheable = false), table(name = \"items\"), read_only");
	test::AddType(db, "shop::Report", "entity, view = \"report_view\", property_visibility = PRIVATE");
	test::AddType(db, "shop::Price", "entity, immutable");
	clent::TypeDecl& sealed = test::AddType(db, "shop::Sealed", "entity");
	sealed.flags = clent::TYPE_FINAL;

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);

	clent::EntityDescriptor item;
	ASSERT_TRUE(clent::BuildEntity(ctx, *db.FindType("shop::Item"), clent::KIND_ENTITY, item).IsOk());
	EXPECT_EQ("shop", item.package_name);
	EXPECT_EQ("Item", item.simple_name);
	EXPECT_EQ("items", item.table_name);
	EXPECT_EQ("ItemImpl", item.entity_name);
	EXPECT_EQ(clent::STYLE_FLUENT, item.property_name_style);
	EXPECT_FALSE(item.is_cacheable);
	EXPECT_TRUE(item.is_read_only);
	EXPECT_FALSE(item.is_immutable);
	EXPECT_EQ("model/Model.h", item.source_file);

	clent::EntityDescriptor report;
	ASSERT_TRUE(clent::BuildEntity(ctx, *db.FindType("shop::Report"), clent::KIND_ENTITY, report).IsOk());
	EXPECT_TRUE(report.is_view);
	EXPECT_EQ("report_view", report.table_name);
	EXPECT_EQ(clent::VISIBILITY_PRIVATE, report.property_visibility);

	clent::EntityDescriptor value;
	ASSERT_TRUE(clent::BuildEntity(ctx, *db.FindType("shop::Price"), clent::KIND_ENTITY, value).IsOk());
	EXPECT_TRUE(value.is_immutable);
	EXPECT_TRUE(value.is_stateless);

	clent::EntityDescriptor final_entity;
	ASSERT_TRUE(clent::BuildEntity(ctx, *db.FindType("shop::Sealed"), clent::KIND_ENTITY, final_entity).IsOk());
	EXPECT_TRUE(final_entity.is_unimplementable);
	EXPECT_TRUE(final_entity.is_immutable);
}


TEST(EntityBuilder, InheritsFromSuperclasses)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);

	// Local properties shadow inherited ones
	clent::TypeDecl& person = db.AddType("model::Person");
	test::AddField(db, person, "version", test::Value("std::string"));

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);

	clent::EntityDescriptor base;
	ASSERT_TRUE(clent::BuildEntity(ctx, *db.FindType("model::BaseEntity"), clent::KIND_SUPERCLASS, base).IsOk());
	ASSERT_TRUE(ctx.AddDescriptor(base));

	clent::EntityDescriptor entity;
	ASSERT_TRUE(clent::BuildEntity(ctx, person, clent::KIND_ENTITY, entity).IsOk());
	EXPECT_TRUE(entity.is_abstract);

	std::vector<std::string> expected;
	expected.push_back("name");
	expected.push_back("address");
	expected.push_back("phones");
	expected.push_back("emailAddress");
	expected.push_back("version");
	expected.push_back("id");
	EXPECT_EQ(expected, PropertyNames(entity));

	const clent::PropertyDescriptor* version = entity.FindProperty("version");
	ASSERT_TRUE(version != 0);
	EXPECT_EQ("std::string", version->type_name);
	EXPECT_FALSE(version->is_version);

	const clent::PropertyDescriptor* id = entity.FindProperty("id");
	ASSERT_TRUE(id != 0);
	EXPECT_EQ("model::BaseEntity", id->declaring_type);
	EXPECT_TRUE(id->is_key);
}


TEST(EntityBuilder, FieldWinsOverAccessor)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = test::AddType(db, "model::Tag", "entity");
	test::AddField(db, type, "label", test::Value("std::string"), "key");
	test::AddMethod(db, type, "getLabel", test::Value("std::string"), clent::MOD_CONST);

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);

	clent::EntityDescriptor entity;
	ASSERT_TRUE(clent::BuildEntity(ctx, type, clent::KIND_ENTITY, entity).IsOk());
	ASSERT_EQ(1u, entity.properties.size());
	EXPECT_EQ(clent::MemberDecl::MEMBER_FIELD, entity.properties[0].member_kind);
}


TEST(EntityBuilder, FailsWithoutName)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = test::AddType(db, "", "entity");

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);

	clent::EntityDescriptor entity;
	clent::Status status = clent::BuildEntity(ctx, type, clent::KIND_ENTITY, entity);
	EXPECT_EQ(clent::DIAG_MISSING_QUALIFIED_NAME, status.code);
}


TEST(EntityBuilder, ReportsPropertyFailures)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = test::AddType(db, "model::Broken", "entity");
	test::AddField(db, type, "part", clent::TypeRef::Unresolved("Part"));

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);

	clent::EntityDescriptor entity;
	clent::Status status = clent::BuildEntity(ctx, type, clent::KIND_ENTITY, entity);
	EXPECT_EQ(clent::DIAG_UNRESOLVED_TYPE, status.code);
	EXPECT_NE(std::string::npos, status.message.find("model::Broken"));
}


TEST(EntityBuilder, InheritsFromLaterBases)
{
	clent::DeclDatabase db;
	clent::TypeDecl& root = test::AddType(db, "model::Audited", "superclass", 5);
	test::AddField(db, root, "created", test::Value("long"));

	clent::TypeDecl& base = test::AddType(db, "model::BaseEntity", "superclass", 10);
	base.bases.push_back("model::Audited");
	test::AddField(db, base, "id", test::Value("long"), "key, generated");

	clent::TypeDecl& printable = test::AddType(db, "model::Printable", "", 15);
	test::AddField(db, printable, "label", test::Value("std::string"));

	// The mapped superclass is not the first base
	clent::TypeDecl& person = test::AddType(db, "model::Person", "entity", 20);
	person.bases.push_back("model::Printable");
	person.bases.push_back("model::BaseEntity");
	test::AddField(db, person, "name", test::Value("std::string"));

	clent::ProcessingOptions options;
	clent::ProcessingContext ctx(db, options);

	clent::EntityDescriptor audited;
	ASSERT_TRUE(clent::BuildEntity(ctx, root, clent::KIND_SUPERCLASS, audited).IsOk());
	ASSERT_TRUE(ctx.AddDescriptor(audited));
	clent::EntityDescriptor base_entity;
	ASSERT_TRUE(clent::BuildEntity(ctx, base, clent::KIND_SUPERCLASS, base_entity).IsOk());
	ASSERT_TRUE(ctx.AddDescriptor(base_entity));

	clent::EntityDescriptor entity;
	ASSERT_TRUE(clent::BuildEntity(ctx, person, clent::KIND_ENTITY, entity).IsOk());

	// Unmapped bases contribute nothing
	std::vector<std::string> expected;
	expected.push_back("name");
	expected.push_back("id");
	expected.push_back("created");
	EXPECT_EQ(expected, PropertyNames(entity));

	const clent::PropertyDescriptor* id = entity.FindProperty("id");
	ASSERT_TRUE(id != 0);
	EXPECT_TRUE(id->is_key);
}
