
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "TestModels.h"

#include <clEntityCore/ProcessingContext.h>
#include <clEntityCore/PropertyExtractor.h>

#include <gtest/gtest.h>


namespace
{
	class PropertyExtractor : public ::testing::Test
	{
	protected:
		PropertyExtractor()
			: type(test::AddType(db, "model::Customer", "entity"))
		{
			owner.qualified_name = "model::Customer";
			owner.simple_name = "Customer";
			owner.package_name = "model";

			// Tests hold on to members while adding more
			type.members.reserve(16);
		}

		clent::Status Extract(const clent::MemberDecl& member, clent::PropertyDescriptor& property)
		{
			clent::ProcessingContext ctx(db, options);
			return clent::ExtractProperty(ctx, owner, member, property);
		}

		clent::DeclDatabase db;
		clent::ProcessingOptions options;
		clent::TypeDecl& type;
		clent::EntityDescriptor owner;
	};
}


TEST(PropertyNames, FromAccessors)
{
	EXPECT_EQ("emailAddress", clent::PropertyNameFromAccessor("getEmailAddress"));
	EXPECT_EQ("active", clent::PropertyNameFromAccessor("isActive"));
	EXPECT_EQ("", clent::PropertyNameFromAccessor("get"));
	EXPECT_EQ("", clent::PropertyNameFromAccessor("is"));
	EXPECT_EQ("", clent::PropertyNameFromAccessor("computeTotal"));
}


TEST_F(PropertyExtractor, FieldDefaults)
{
	clent::MemberDecl& member = test::AddField(db, type, "name", test::Value("std::string"));

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_EQ("name", property.name);
	EXPECT_EQ("name", property.column_name);
	EXPECT_EQ("std::string", property.type_name);
	EXPECT_EQ("model::Customer", property.declaring_type);
	EXPECT_EQ(clent::MemberDecl::MEMBER_FIELD, property.member_kind);
	EXPECT_FALSE(property.is_key);
	EXPECT_FALSE(property.is_nullable);
	EXPECT_FALSE(property.is_read_only);
	EXPECT_EQ(clent::CARDINALITY_NONE, property.cardinality);
}


TEST_F(PropertyExtractor, AccessorMethod)
{
	clent::MemberDecl& member = test::AddMethod(db, type, "getEmailAddress", test::Value("std::string"), clent::MOD_CONST, "column = \"email\"");

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_EQ("emailAddress", property.name);
	EXPECT_EQ("email", property.column_name);
	EXPECT_EQ("getEmailAddress", property.member_name);
	EXPECT_EQ(clent::MemberDecl::MEMBER_METHOD, property.member_kind);
}


TEST_F(PropertyExtractor, SkipsIneligibleMembers)
{
	clent::MemberDecl& private_field = test::AddField(db, type, "secret", test::Value("int"));
	private_field.modifiers = clent::MOD_PRIVATE;
	clent::MemberDecl& static_field = test::AddField(db, type, "count", test::Value("int"));
	static_field.modifiers = clent::MOD_STATIC;
	clent::MemberDecl& with_params = test::AddMethod(db, type, "getItem", test::Value("int"), 0);
	with_params.nb_params = 1;
	clent::MemberDecl& returns_void = test::AddMethod(db, type, "getNothing", test::Value("void"), 0);
	clent::MemberDecl& not_accessor = test::AddMethod(db, type, "total", test::Value("int"), 0);
	clent::MemberDecl& component = test::AddMethod(db, type, "component1", test::Value("int"), 0);
	clent::MemberDecl& transient = test::AddField(db, type, "cache", test::Value("int"), "transient");

	clent::PropertyDescriptor property;
	EXPECT_TRUE(Extract(private_field, property).IsSkip());
	EXPECT_TRUE(Extract(static_field, property).IsSkip());
	EXPECT_TRUE(Extract(with_params, property).IsSkip());
	EXPECT_TRUE(Extract(returns_void, property).IsSkip());
	EXPECT_TRUE(Extract(not_accessor, property).IsSkip());
	EXPECT_TRUE(Extract(component, property).IsSkip());
	EXPECT_TRUE(Extract(transient, property).IsSkip());
}


TEST_F(PropertyExtractor, ComponentFieldsAreProperties)
{
	// Only accessors of that shape are synthetic
	clent::MemberDecl& field = test::AddField(db, type, "component1", test::Value("int"));

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(field, property).IsOk());
	EXPECT_EQ("component1", property.name);
}


TEST_F(PropertyExtractor, TransientKeptOnInterfaces)
{
	owner.is_interface = true;
	clent::MemberDecl& member = test::AddMethod(db, type, "getCache", test::Value("int"), clent::MOD_VIRTUAL | clent::MOD_PURE, "transient");

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_TRUE(property.is_transient);
}


TEST_F(PropertyExtractor, ValueTypesSkipSelfReferences)
{
	owner.is_immutable = true;
	clent::MemberDecl& member = test::AddMethod(db, type, "getNext", test::Value("model::Customer"), 0);

	clent::PropertyDescriptor property;
	EXPECT_TRUE(Extract(member, property).IsSkip());
}


TEST_F(PropertyExtractor, Flags)
{
	clent::MemberDecl& key = test::AddField(db, type, "id", test::Value("long"), "key, generated");
	clent::MemberDecl& version = test::AddField(db, type, "revision", test::Value("int"), "version");
	clent::MemberDecl& pointer = test::AddField(db, type, "parent", test::Pointer("model::Customer"));
	clent::MemberDecl& optional = test::AddField(db, type, "nickname", test::Container("std::optional", clent::SHAPE_OPTIONAL, "std::string"));
	clent::MemberDecl& column_nullable = test::AddField(db, type, "notes", test::Value("std::string"), "column(name = \"note_text\", nullable = true)");
	clent::MemberDecl& constant = test::AddField(db, type, "created", test::ConstValue("long"));
	clent::MemberDecl& lazy = test::AddField(db, type, "photo", test::Value("std::string"), "lazy");
	clent::MemberDecl& basic = test::AddField(db, type, "history", test::Value("std::string"), "basic(fetch = LAZY)");

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(key, property).IsOk());
	EXPECT_TRUE(property.is_key);
	EXPECT_TRUE(property.is_generated);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(version, property).IsOk());
	EXPECT_TRUE(property.is_version);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(pointer, property).IsOk());
	EXPECT_TRUE(property.is_nullable);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(optional, property).IsOk());
	EXPECT_TRUE(property.is_nullable);
	EXPECT_FALSE(property.is_collection);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(column_nullable, property).IsOk());
	EXPECT_TRUE(property.is_nullable);
	EXPECT_EQ("note_text", property.column_name);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(constant, property).IsOk());
	EXPECT_TRUE(property.is_read_only);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(lazy, property).IsOk());
	EXPECT_TRUE(property.is_lazy);

	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(basic, property).IsOk());
	EXPECT_TRUE(property.is_lazy);
}


TEST_F(PropertyExtractor, CardinalityByPriority)
{
	clent::MemberDecl& member = test::AddField(db, type, "orders",
		test::Container("std::vector", clent::SHAPE_LIST, "model::Order*"), "many_to_many, one_to_many");

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_EQ(clent::ONE_TO_MANY, property.cardinality);
	EXPECT_EQ(clent::CardinalityBit(clent::ONE_TO_MANY) | clent::CardinalityBit(clent::MANY_TO_MANY), property.declared_cardinalities);
	EXPECT_TRUE(property.is_collection);
	EXPECT_TRUE(property.IsToMany());
}


TEST_F(PropertyExtractor, ResolvesExplicitTargets)
{
	test::AddType(db, "model::Order", "entity");
	clent::MemberDecl& member = test::AddField(db, type, "lastOrder", test::Value("long"), "one_to_one(target = \"Order\")");

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_EQ("model::Order", property.referenced_type_name);
}


TEST_F(PropertyExtractor, FailsOnUnresolvedNames)
{
	clent::MemberDecl& bad_target = test::AddField(db, type, "lastOrder", test::Value("long"), "one_to_one(target = \"Missing\")");
	clent::MemberDecl& bad_type = test::AddField(db, type, "broken", clent::TypeRef::Unresolved("Broken"));

	clent::PropertyDescriptor property;
	clent::Status status = Extract(bad_target, property);
	EXPECT_TRUE(status.HasFailed());
	EXPECT_EQ(clent::DIAG_UNRESOLVED_ANNOTATION_REFERENCE, status.code);

	status = Extract(bad_type, property);
	EXPECT_TRUE(status.HasFailed());
	EXPECT_EQ(clent::DIAG_UNRESOLVED_TYPE, status.code);
}


TEST_F(PropertyExtractor, StandardDialect)
{
	clent::MemberDecl& member = db.AddMember(type, "id", clent::MemberDecl::MEMBER_FIELD, test::Value("long"));
	member.annotations = test::Attrs("Id, GeneratedValue, Column(name = \"customer_id\")", clent::DIALECT_JPA);

	clent::PropertyDescriptor property;
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_TRUE(property.is_key);
	EXPECT_TRUE(property.is_generated);
	EXPECT_EQ("customer_id", property.column_name);

	options.generate_jpa = false;
	property = clent::PropertyDescriptor();
	ASSERT_TRUE(Extract(member, property).IsOk());
	EXPECT_FALSE(property.is_key);
	EXPECT_EQ("id", property.column_name);
}
