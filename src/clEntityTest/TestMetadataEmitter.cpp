
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "TestModels.h"

#include <clEntityCore/EntityProcessor.h>
#include <clEntityCore/Logging.h>
#include <clEntityGen/CodeGen.h>
#include <clEntityGen/MetadataEmitter.h>

#include <gtest/gtest.h>

#include <cstdio>


namespace
{
	const clent::GeneratedFile* FindFile(const std::vector<clent::GeneratedFile>& files, const char* path)
	{
		for (size_t i = 0; i < files.size(); i++)
		{
			if (files[i].path == path)
				return &files[i];
		}
		return 0;
	}


	bool Contains(const clent::GeneratedFile* file, const char* text)
	{
		return file != 0 && file->text.find(text) != std::string::npos;
	}


	class MetadataEmitter : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			test::AddPersonModel(db);
			result = clent::Process(db, options);
			ASSERT_FALSE(clent::HasErrors(result.diagnostics));
		}

		clent::DeclDatabase db;
		clent::ProcessingOptions options;
		clent::ProcessResult result;
	};


	clent::PropertyDescriptor FieldProperty(const char* name, const char* type_name)
	{
		clent::PropertyDescriptor property;
		property.name = name;
		property.member_name = name;
		property.type = test::Value(type_name);
		property.type_name = type_name;
		return property;
	}
}


TEST(CodeGen, IndentsScopes)
{
	CodeGen cg;
	cg.Line("struct %s", "Point");
	cg.EnterScope();
	cg.Line("int x;");
	cg.Line();
	cg.Line("int y;");
	cg.ExitTypeScope();
	EXPECT_EQ("struct Point\n{\n\tint x;\n\n\tint y;\n};\n", cg.GetText());

	// Extra unindents are ignored
	cg.UnIndent();
	cg.Line("x");
	EXPECT_EQ('x', cg.GetText()[cg.Size() - 2]);
}


TEST(CodeGen, RecordsHashOnFirstLine)
{
	CodeGen cg;
	cg.Line("int value;");
	unsigned int hash = cg.GenerateHash();

	clent::GeneratedFile file = clent::FinishFile(cg, "model/Value.h");
	EXPECT_EQ(hash, file.hash);
	EXPECT_EQ("model/Value.h", file.path);

	char expected[64];
	snprintf(expected, sizeof(expected), "// %x\nint value;\n", hash);
	EXPECT_EQ(expected, file.text);
}


TEST(EmitterNames, AttributeNames)
{
	EXPECT_EQ("EMAIL_ADDRESS", clent::GetAttributeName("emailAddress"));
	EXPECT_EQ("ID", clent::GetAttributeName("id"));
	EXPECT_EQ("TYPE_", clent::GetAttributeName("type"));
}


TEST(EmitterNames, AccessorsFollowStyle)
{
	clent::EntityDescriptor entity;
	clent::PropertyDescriptor name = FieldProperty("name", "std::string");
	clent::PropertyDescriptor active = FieldProperty("active", "bool");

	EXPECT_EQ("getName", clent::GetGetterName(entity, name));
	EXPECT_EQ("setName", clent::GetSetterName(entity, name));
	EXPECT_EQ("isActive", clent::GetGetterName(entity, active));

	entity.property_name_style = clent::STYLE_FLUENT_BEAN;
	EXPECT_EQ("getName", clent::GetGetterName(entity, name));
	EXPECT_EQ("name", clent::GetSetterName(entity, name));

	entity.property_name_style = clent::STYLE_FLUENT;
	EXPECT_EQ("name", clent::GetGetterName(entity, name));
	EXPECT_EQ("name", clent::GetSetterName(entity, name));

	name.is_read_only = true;
	EXPECT_EQ("", clent::GetSetterName(entity, name));

	// Implemented accessors keep their own name and can't be set
	clent::PropertyDescriptor email = FieldProperty("emailAddress", "std::string");
	email.member_kind = clent::MemberDecl::MEMBER_METHOD;
	email.member_name = "getEmailAddress";
	EXPECT_EQ("getEmailAddress", clent::GetGetterName(entity, email));
	EXPECT_EQ("", clent::GetSetterName(entity, email));
}


TEST(EmitterNames, ImplementationName)
{
	clent::EntityDescriptor entity;
	entity.simple_name = "Person";
	EXPECT_EQ("GeneratedPerson", clent::GetImplementationName(entity));

	entity.entity_name = "PersonImpl";
	EXPECT_EQ("PersonImpl", clent::GetImplementationName(entity));

	entity.entity_name = "Person Impl";
	EXPECT_EQ("GeneratedPerson", clent::GetImplementationName(entity));
}


TEST(EmitterNames, LocalNameJoinsEnclosingClasses)
{
	clent::EntityDescriptor entity;
	entity.package_name = "model";
	entity.simple_name = "Inner";
	entity.qualified_name = "model::Outer::Inner";
	EXPECT_EQ("Outer_Inner", clent::GetLocalName(entity));
	EXPECT_EQ("GeneratedOuter_Inner", clent::GetImplementationName(entity));

	entity.package_name = "";
	entity.qualified_name = "Outer::Inner";
	EXPECT_EQ("Outer_Inner", clent::GetLocalName(entity));
}


TEST(NestedEntities, GeneratedInPackageNamespace)
{
	clent::DeclDatabase db;
	test::AddType(db, "model::Outer", "", 10);
	clent::TypeDecl& inner = test::AddType(db, "model::Outer::Inner", "entity", 12);
	test::AddField(db, inner, "id", test::Value("int"), "key");
	test::AddField(db, inner, "label", test::Value("std::string"));
	EXPECT_EQ("model", inner.package);
	EXPECT_EQ("Inner", inner.simple_name);

	clent::ProcessingOptions options;
	clent::ProcessResult result = clent::Process(db, options);
	ASSERT_FALSE(clent::HasErrors(result.diagnostics));
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);

	const char* expected[] =
	{
		"model/GeneratedOuter_Inner.h",
		"model/Models.cpp",
		"model/Models.h",
		"model/Outer_Inner_.cpp",
		"model/Outer_Inner_.h",
	};
	ASSERT_EQ(sizeof(expected) / sizeof(expected[0]), files.size());
	for (size_t i = 0; i < files.size(); i++)
		EXPECT_EQ(expected[i], files[i].path);

	// The enclosing class must never be opened as a namespace
	for (size_t i = 0; i < files.size(); i++)
		EXPECT_EQ(std::string::npos, files[i].text.find("namespace Outer")) << files[i].path;

	const clent::GeneratedFile* impl = FindFile(files, "model/GeneratedOuter_Inner.h");
	EXPECT_TRUE(Contains(impl, "class GeneratedOuter_Inner : public model::Outer::Inner, public clent::Persistable"));

	const clent::GeneratedFile* source = FindFile(files, "model/Outer_Inner_.cpp");
	EXPECT_TRUE(Contains(source, "typeid(model::Outer::Inner)"));

	const clent::GeneratedFile* models = FindFile(files, "model/Models.cpp");
	EXPECT_TRUE(Contains(models, "models.push_back(&model::Outer_Inner_::Instance().TYPE);"));
}


TEST_F(MetadataEmitter, FilesForEachKind)
{
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);

	const char* expected[] =
	{
		"model/Address_.cpp",
		"model/Address_.h",
		"model/BaseEntity_.cpp",
		"model/BaseEntity_.h",
		"model/GeneratedAddress.h",
		"model/GeneratedPerson.h",
		"model/Models.cpp",
		"model/Models.h",
		"model/Person_.cpp",
		"model/Person_.h",
		"model/Phone_.cpp",
		"model/Phone_.h",
	};
	ASSERT_EQ(sizeof(expected) / sizeof(expected[0]), files.size());
	for (size_t i = 0; i < files.size(); i++)
		EXPECT_EQ(expected[i], files[i].path);

	options.generate_model = false;
	files = clent::EmitGraph(*result.graph, options);
	EXPECT_TRUE(FindFile(files, "model/Models.h") == 0);
}


TEST_F(MetadataEmitter, MetadataReferencesTargets)
{
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);

	const clent::GeneratedFile* header = FindFile(files, "model/Person_.h");
	EXPECT_TRUE(Contains(header, "class Person_"));
	EXPECT_TRUE(Contains(header, "const clent::AttributeDescriptor& ADDRESS;"));
	EXPECT_TRUE(Contains(header, "const clent::AttributeDescriptor& EMAIL_ADDRESS;"));
	EXPECT_TRUE(Contains(header, "clent::AttributeDescriptor m_Attributes[6];"));

	const clent::GeneratedFile* source = FindFile(files, "model/Person_.cpp");
	EXPECT_TRUE(Contains(source, "#include \"model/Address_.h\""));
	EXPECT_TRUE(Contains(source, "clent::TypeBuilder type(TypeStorage(), \"Person\", \"model::Person\", typeid(model::Person));"));
	EXPECT_TRUE(Contains(source, ".SetReferencedType(&model::Address_::Type())"));
	EXPECT_TRUE(Contains(source, "clent::BuildList(m_Attributes[2], \"phones\", \"phones\")"));
	EXPECT_TRUE(Contains(source, ".SetCardinality(clent::MANY_TO_ONE)"));
	EXPECT_TRUE(Contains(source, "static_cast<const model::GeneratedPerson*>(entity)->GetAddressState()"));

	// Superclasses aren't implemented so have no state
	const clent::GeneratedFile* base = FindFile(files, "model/BaseEntity_.cpp");
	EXPECT_TRUE(Contains(base, ".SetKey(true)"));
	EXPECT_FALSE(Contains(base, "SetPropertyState"));

	const clent::GeneratedFile* models = FindFile(files, "model/Models.cpp");
	EXPECT_TRUE(Contains(models, "models.push_back(&model::Address_::Instance().TYPE);"));
	EXPECT_TRUE(Contains(models, "models.push_back(&model::Person_::Instance().TYPE);"));
	EXPECT_FALSE(Contains(models, "BaseEntity_"));
}


TEST_F(MetadataEmitter, ImplementationOfPerson)
{
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);

	const clent::GeneratedFile* impl = FindFile(files, "model/GeneratedPerson.h");
	EXPECT_TRUE(Contains(impl, "class GeneratedPerson : public model::Person, public clent::Persistable"));
	EXPECT_TRUE(Contains(impl, "const std::string& getName() const { return model::Person::name; }"));
	EXPECT_TRUE(Contains(impl, "model::Address* getAddress() const { return model::Person::address; }"));
	EXPECT_TRUE(Contains(impl, "const std::string& getEmailAddress() const override { return m_EmailAddress; }"));
	EXPECT_TRUE(Contains(impl, "void setEmailAddress(const std::string& value) { m_EmailAddress = value; m_EmailAddressState = clent::STATE_MODIFIED; }"));
	EXPECT_TRUE(Contains(impl, "const long& getId() const { return model::BaseEntity::id; }"));

	// Identity comes from the inherited key
	EXPECT_TRUE(Contains(impl, "return model::BaseEntity::id == other.model::BaseEntity::id;"));
	EXPECT_TRUE(Contains(impl, "clent::HashValue(seed, model::BaseEntity::id);"));
}



TEST(KeylessEntities, IdentityUsesValueProperties)
{
	clent::DeclDatabase db;
	clent::TypeDecl& tag = test::AddType(db, "model::Tag", "entity");
	test::AddField(db, tag, "label", test::Value("std::string"));
	test::AddField(db, tag, "aliases", test::Container("std::deque", clent::SHAPE_LIST, "std::string"));
	test::AddField(db, tag, "parent", test::Pointer("model::Tag"), "many_to_one");
	test::AddField(db, tag, "note", test::Container("std::optional", clent::SHAPE_OPTIONAL, "std::string"));
	test::AddField(db, tag, "scratch", test::Value("int"), "transient");

	clent::ProcessingOptions options;
	clent::ProcessResult result = clent::Process(db, options);
	EXPECT_TRUE(clent::HasErrors(result.diagnostics));
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);

	const clent::GeneratedFile* impl = FindFile(files, "model/GeneratedTag.h");
	ASSERT_TRUE(impl != 0);
	EXPECT_TRUE(Contains(impl, "clent::HashValue(seed, model::Tag::label);"));
	EXPECT_TRUE(Contains(impl, "clent::HashValue(seed, model::Tag::aliases);"));
	EXPECT_FALSE(Contains(impl, "clent::HashValue(seed, model::Tag::parent);"));
	EXPECT_FALSE(Contains(impl, "clent::HashValue(seed, model::Tag::note);"));
	EXPECT_FALSE(Contains(impl, "clent::HashValue(seed, model::Tag::scratch);"));
	EXPECT_FALSE(Contains(impl, "model::Tag::parent == other"));
}

TEST_F(MetadataEmitter, WritesOnlyChangedFiles)
{
	LOG_TO_BUFFER(main, INFO);
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);
	std::string output_dir = ::testing::TempDir() + "clentity_emit";

	ASSERT_TRUE(clent::WriteGeneratedFiles(output_dir, files));
	logging::ClearBuffer("main");
	ASSERT_TRUE(clent::WriteGeneratedFiles(output_dir, files));
	std::string log = logging::GetBuffer("main");
	EXPECT_EQ(std::string::npos, log.find("Wrote:"));
	EXPECT_NE(std::string::npos, log.find("Unchanged:"));

	for (size_t i = 0; i < files.size(); i++)
		remove((output_dir + "/" + files[i].path).c_str());
}


TEST(CodeGen, ReportsFailedWrites)
{
	// Every write to this device fails with no space left
	FILE* fp = fopen("/dev/full", "wb");
	if (fp == 0)
		GTEST_SKIP();
	fclose(fp);

	LOG_TO_BUFFER(main, ERROR);
	logging::ClearBuffer("main");

	CodeGen cg;
	cg.Line("int value;");
	std::vector<clent::GeneratedFile> files;
	files.push_back(clent::FinishFile(cg, "full"));

	EXPECT_FALSE(clent::WriteGeneratedFiles("/dev", files));
	EXPECT_NE(std::string::npos, logging::GetBuffer("main").find("Couldn't write all of"));
}
