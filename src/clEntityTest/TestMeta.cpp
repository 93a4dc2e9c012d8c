
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include <clent/Meta.h>

#include <gtest/gtest.h>


namespace
{
	struct Address
	{
		int id;
	};
}


TEST(Meta, BuildsTypeDescriptors)
{
	clent::TypeDescriptor address_type;
	clent::TypeDescriptor person_type;
	clent::AttributeDescriptor attributes[3];

	clent::TypeBuilder type(person_type, "people", "model::Person", typeid(Address));
	type.SetCacheable(false).SetReadOnly(true);

	clent::Build(attributes[0], "id", "person_id")
		.SetGetter("getId")
		.SetKey(true)
		.SetGenerated(true);
	clent::Build(attributes[1], "address", "address")
		.SetGetter("getAddress")
		.SetSetter("setAddress")
		.SetNullable(true)
		.SetCardinality(clent::MANY_TO_ONE)
		.SetReferencedType(&address_type)
		.SetPropertyState([](const void*) { return clent::STATE_LOADED; });
	clent::BuildList(attributes[2], "tags", "tags")
		.SetCardinality(clent::ONE_TO_MANY)
		.SetLazy(true);
	for (int i = 0; i < 3; i++)
		type.AddAttribute(attributes[i]);

	EXPECT_EQ("people", person_type.name);
	EXPECT_EQ("model::Person", person_type.class_name);
	EXPECT_TRUE(*person_type.class_type == typeid(Address));
	EXPECT_FALSE(person_type.is_cacheable);
	EXPECT_TRUE(person_type.is_read_only);
	ASSERT_EQ(3u, person_type.attributes.size());

	const clent::AttributeDescriptor* address = person_type.GetAttribute("address");
	ASSERT_TRUE(address != 0);
	EXPECT_EQ(&address_type, address->referenced_type);
	EXPECT_EQ(&person_type, address->declaring_type);
	EXPECT_EQ(clent::ATTRIBUTE_BASIC, address->kind);
	EXPECT_EQ(clent::STATE_LOADED, address->property_state(0));

	EXPECT_EQ(clent::ATTRIBUTE_LIST, person_type.GetAttribute("tags")->kind);
	EXPECT_TRUE(person_type.GetAttribute("tags")->is_lazy);
	EXPECT_TRUE(person_type.GetAttribute("missing") == 0);

	std::vector<const clent::AttributeDescriptor*> keys = person_type.GetKeyAttributes();
	ASSERT_EQ(1u, keys.size());
	EXPECT_EQ("person_id", keys[0]->name);
}


TEST(Meta, HashesValuesAndContainers)
{
	std::vector<std::string> a, b;
	a.push_back("x");
	a.push_back("y");
	b = a;

	size_t seed_a = 0, seed_b = 0;
	clent::HashValue(seed_a, a);
	clent::HashValue(seed_b, b);
	EXPECT_EQ(seed_a, seed_b);

	b.push_back("z");
	seed_b = 0;
	clent::HashValue(seed_b, b);
	EXPECT_NE(seed_a, seed_b);

	std::map<int, std::string> m;
	m[1] = "one";
	size_t seed_m = 0;
	clent::HashValue(seed_m, m);
	EXPECT_NE(0u, seed_m);
}



TEST(Meta, HashesEveryRecognisedContainer)
{
	std::deque<int> deque_a, deque_b;
	deque_a.push_back(1);
	deque_a.push_back(2);
	deque_b.push_front(2);
	deque_b.push_front(1);
	size_t seed_a = 0, seed_b = 0;
	clent::HashValue(seed_a, deque_a);
	clent::HashValue(seed_b, deque_b);
	EXPECT_EQ(seed_a, seed_b);

	// Equal unordered containers hash the same whatever their insertion order
	std::unordered_set<std::string> set_a, set_b;
	const char* names[] = { "alpha", "beta", "gamma", "delta", "epsilon" };
	for (int i = 0; i < 5; i++)
	{
		set_a.insert(names[i]);
		set_b.insert(names[4 - i]);
	}
	seed_a = seed_b = 0;
	clent::HashValue(seed_a, set_a);
	clent::HashValue(seed_b, set_b);
	EXPECT_EQ(seed_a, seed_b);

	set_b.erase("beta");
	seed_b = 0;
	clent::HashValue(seed_b, set_b);
	EXPECT_NE(seed_a, seed_b);

	std::unordered_map<std::string, int> map_a, map_b;
	map_a["one"] = 1;
	map_a["two"] = 2;
	map_b["two"] = 2;
	map_b["one"] = 1;
	seed_a = seed_b = 0;
	clent::HashValue(seed_a, map_a);
	clent::HashValue(seed_b, map_b);
	EXPECT_EQ(seed_a, seed_b);

	std::multiset<int> multiset;
	multiset.insert(3);
	multiset.insert(3);
	std::multimap<int, int> multimap;
	multimap.insert(std::make_pair(1, 2));
	size_t seed_m = 0;
	clent::HashValue(seed_m, multiset);
	clent::HashValue(seed_m, multimap);
	EXPECT_NE(0u, seed_m);
}

TEST(Meta, ConvertsValuesToText)
{
	EXPECT_EQ("42", clent::ToText(42));
	EXPECT_EQ("true", clent::ToText(true));
	EXPECT_EQ("hello", clent::ToText(std::string("hello")));

	Address* null_address = 0;
	EXPECT_EQ("null", clent::ToText(null_address));

	Address address = { 3 };
	EXPECT_EQ("{...}", clent::ToText(address));
}
