
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "TestModels.h"

#include <clEntityCore/DeclDatabaseTextSerialiser.h>
#include <clEntityCore/Logging.h>
#include <clEntityGen/DeclDatabaseMerge.h>

#include <gtest/gtest.h>

#include <cstdio>


namespace
{
	std::string TempFilename(const char* name)
	{
		return ::testing::TempDir() + name;
	}
}


TEST(DeclDatabase, AddTypeSplitsNames)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = db.AddType("app::model::Person");
	EXPECT_EQ("app::model", type.package);
	EXPECT_EQ("Person", type.simple_name);

	// Adding again returns the same record
	EXPECT_EQ(&type, &db.AddType("app::model::Person"));
	EXPECT_EQ(1u, db.GetNbTypes());

	clent::TypeDecl& global = db.AddType("Global");
	EXPECT_EQ("", global.package);
	EXPECT_EQ("Global", global.simple_name);
}


TEST(DeclDatabase, NestedTypesShareOuterPackage)
{
	clent::DeclDatabase db;
	db.AddType("app::Order");
	clent::TypeDecl& line = db.AddType("app::Order::Line");
	EXPECT_EQ("app", line.package);
	EXPECT_EQ("Line", line.simple_name);

	clent::TypeDecl& deeper = db.AddType("app::Order::Line::Note");
	EXPECT_EQ("app", deeper.package);
}


TEST(DeclDatabase, ResolvesNamesOutwards)
{
	clent::DeclDatabase db;
	db.AddType("Address");
	db.AddType("app::Address");
	db.AddType("app::model::Person");

	EXPECT_EQ("app::Address", db.ResolveTypeName("Address", "app::model::Person")->name);
	EXPECT_EQ("Address", db.ResolveTypeName("::Address", "app::model::Person")->name);
	EXPECT_EQ("app::model::Person", db.ResolveTypeName("model::Person", "app::Address")->name);
	EXPECT_TRUE(db.ResolveTypeName("Missing", "app::model::Person") == 0);
}


TEST(DeclDatabaseText, ReloadsWhatWasWritten)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);
	clent::TypeDecl& person = db.AddType("model::Person");
	person.bases.push_back("model::Named");
	person.members[0].annotations = test::Attrs("column(name = \"full_name\", nullable = true), lazy");
	clent::TypeDecl& standard = db.AddType("model::Standard");
	standard.annotations = test::Attrs("Entity, Table(name = \"std_table\")", clent::DIALECT_JPA);

	std::string filename = TempFilename("clentity_reload.decl");
	ASSERT_TRUE(clent::WriteDeclDatabase(filename.c_str(), db));
	EXPECT_TRUE(clent::IsDeclDatabase(filename.c_str()));

	clent::DeclDatabase loaded;
	ASSERT_TRUE(clent::ReadDeclDatabase(filename.c_str(), loaded));
	ASSERT_EQ(db.GetNbTypes(), loaded.GetNbTypes());

	const clent::TypeDecl* loaded_person = loaded.FindType("model::Person");
	ASSERT_TRUE(loaded_person != 0);
	EXPECT_EQ("model/Model.h", loaded_person->filename);
	EXPECT_EQ(40, loaded_person->line);
	EXPECT_EQ((unsigned int)clent::TYPE_ABSTRACT, loaded_person->flags);
	ASSERT_EQ(2u, loaded_person->bases.size());
	EXPECT_EQ("model::Named", loaded_person->bases[1]);
	ASSERT_EQ(person.members.size(), loaded_person->members.size());

	const clent::MemberDecl& name = loaded_person->members[0];
	EXPECT_EQ("model::Person", name.parent);
	ASSERT_EQ(2u, name.annotations.size());
	EXPECT_EQ("full_name", name.annotations[0].GetText("name"));
	EXPECT_TRUE(name.annotations[0].GetBool("nullable", false));
	EXPECT_EQ("lazy", name.annotations[1].name);

	const clent::MemberDecl& phones = loaded_person->members[2];
	EXPECT_EQ(clent::SHAPE_LIST, phones.type.shape);
	ASSERT_EQ(1u, phones.type.args.size());
	EXPECT_EQ("model::Phone", phones.type.args[0]);

	const clent::MemberDecl& email = loaded_person->members[3];
	EXPECT_EQ(clent::MemberDecl::MEMBER_METHOD, email.kind);
	EXPECT_EQ(clent::TypeRef::REFERENCE, email.type.qualifier);
	EXPECT_TRUE(email.type.is_const);
	EXPECT_EQ((unsigned int)(clent::MOD_VIRTUAL | clent::MOD_PURE | clent::MOD_CONST), email.modifiers);

	const clent::TypeDecl* loaded_standard = loaded.FindType("model::Standard");
	ASSERT_TRUE(loaded_standard != 0);
	ASSERT_EQ(2u, loaded_standard->annotations.size());
	EXPECT_EQ(clent::DIALECT_JPA, loaded_standard->annotations[1].dialect);
	EXPECT_EQ("std_table", loaded_standard->annotations[1].GetText("name"));

	remove(filename.c_str());
}


TEST(DeclDatabaseText, KeepsAwkwardText)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = test::AddType(db, "model::Order::Line", "entity");
	type.package = "model";

	// Strings can hold anything but a quote, including row and column separators
	test::AddField(db, type, "note", test::Value("std::string"), "column(name = \"a\tb\nc\\d\")");

	// Longer than any fixed line buffer
	std::string long_name(6000, 'x');
	std::string long_attrs = "column(name = \"" + long_name + "\")";
	test::AddField(db, type, "remark", test::Value("std::string"), long_attrs.c_str());

	clent::TypeRef pair = test::Container("std::map", clent::SHAPE_MAP, "");
	pair.args.push_back("int");
	test::AddField(db, type, "lookup", pair);

	std::string filename = TempFilename("clentity_awkward.decl");
	ASSERT_TRUE(clent::WriteDeclDatabase(filename.c_str(), db));

	clent::DeclDatabase loaded;
	ASSERT_TRUE(clent::ReadDeclDatabase(filename.c_str(), loaded));
	ASSERT_EQ(1u, loaded.GetNbTypes());
	const clent::TypeDecl* loaded_type = loaded.FindType("model::Order::Line");
	ASSERT_TRUE(loaded_type != 0);
	EXPECT_EQ("model", loaded_type->package);
	ASSERT_EQ(3u, loaded_type->members.size());

	ASSERT_EQ(1u, loaded_type->members[0].annotations.size());
	EXPECT_EQ("a\tb\nc\\d", loaded_type->members[0].annotations[0].GetText("name"));

	ASSERT_EQ(1u, loaded_type->members[1].annotations.size());
	EXPECT_EQ(long_name, loaded_type->members[1].annotations[0].GetText("name"));

	const clent::TypeRef& lookup = loaded_type->members[2].type;
	ASSERT_EQ(2u, lookup.args.size());
	EXPECT_EQ("", lookup.args[0]);
	EXPECT_EQ("int", lookup.args[1]);

	remove(filename.c_str());
}


TEST(DeclDatabaseText, KeepsUnresolvedTypes)
{
	clent::DeclDatabase db;
	clent::TypeDecl& type = test::AddType(db, "model::Broken", "entity");
	test::AddField(db, type, "part", clent::TypeRef::Unresolved("Part"));

	std::string filename = TempFilename("clentity_unresolved.decl");
	ASSERT_TRUE(clent::WriteDeclDatabase(filename.c_str(), db));

	clent::DeclDatabase loaded;
	ASSERT_TRUE(clent::ReadDeclDatabase(filename.c_str(), loaded));
	const clent::TypeDecl* loaded_type = loaded.FindType("model::Broken");
	ASSERT_TRUE(loaded_type != 0);
	ASSERT_EQ(1u, loaded_type->members.size());
	EXPECT_FALSE(loaded_type->members[0].type.resolved);
	EXPECT_EQ("Part", loaded_type->members[0].type.name);

	remove(filename.c_str());
}


TEST(DeclDatabaseText, RejectsOtherFiles)
{
	std::string filename = TempFilename("clentity_other.txt");
	FILE* fp = fopen(filename.c_str(), "w");
	ASSERT_TRUE(fp != 0);
	fputs("\nclReflect Database\nFormat Version: 1\n", fp);
	fclose(fp);

	EXPECT_FALSE(clent::IsDeclDatabase(filename.c_str()));
	clent::DeclDatabase db;
	EXPECT_FALSE(clent::ReadDeclDatabase(filename.c_str(), db));
	EXPECT_FALSE(clent::ReadDeclDatabase(TempFilename("clentity_missing.decl").c_str(), db));

	remove(filename.c_str());
}


TEST(DeclDatabaseMerge, FirstDefinitionWins)
{
	LOG_TO_BUFFER(main, WARNING);
	logging::ClearBuffer("main");

	clent::DeclDatabase first;
	clent::TypeDecl& address = test::AddType(first, "model::Address", "entity");
	test::AddField(first, address, "id", test::Value("int"), "key");

	clent::DeclDatabase second;
	clent::TypeDecl& other_address = test::AddType(second, "model::Address", "entity", 99);
	test::AddField(second, other_address, "id", test::Value("int"), "key");
	test::AddField(second, other_address, "street", test::Value("std::string"));
	test::AddType(second, "model::Person", "entity");

	clent::DeclDatabase merged;
	clent::MergeDeclDatabases(merged, first, "first.decl");
	clent::MergeDeclDatabases(merged, second, "second.decl");

	EXPECT_EQ(2u, merged.GetNbTypes());
	const clent::TypeDecl* merged_address = merged.FindType("model::Address");
	ASSERT_TRUE(merged_address != 0);
	EXPECT_EQ(1u, merged_address->members.size());
	EXPECT_EQ(1, merged_address->line);
	EXPECT_EQ("model::Address", merged_address->members[0].parent);

	std::string log = logging::GetBuffer("main");
	EXPECT_NE(std::string::npos, log.find("second.decl"));
	EXPECT_NE(std::string::npos, log.find("model::Address"));
}
