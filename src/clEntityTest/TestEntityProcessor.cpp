
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
#include <clEntityCore/GraphTextSerialiser.h>
#include <clEntityGen/MetadataEmitter.h>

#include <gtest/gtest.h>

#include <stdexcept>


namespace
{
	//
	// Forwards to a database but throws when asked for the members of one type
	//
	class ThrowingAdapter : public clent::DeclarationAdapter
	{
	public:
		ThrowingAdapter(const clent::DeclDatabase& db, const std::string& bad_type)
			: m_DB(db)
			, m_BadType(bad_type)
		{
		}

		std::vector<const clent::TypeDecl*> GetTypes() const override { return m_DB.GetTypes(); }
		const clent::TypeDecl* FindType(const std::string& name) const override { return m_DB.FindType(name); }
		const clent::TypeDecl* ResolveTypeName(const std::string& name, const std::string& scope) const override { return m_DB.ResolveTypeName(name, scope); }
		const clent::AnnotationList& AnnotationsOf(const clent::TypeDecl& type) const override { return m_DB.AnnotationsOf(type); }
		const clent::AnnotationList& AnnotationsOf(const clent::MemberDecl& member) const override { return m_DB.AnnotationsOf(member); }
		clent::TypeRef ResolvedTypeOf(const clent::MemberDecl& member) const override { return m_DB.ResolvedTypeOf(member); }
		unsigned int ModifiersOf(const clent::MemberDecl& member) const override { return m_DB.ModifiersOf(member); }
		const std::vector<std::string>& SuperTypesOf(const clent::TypeDecl& type) const override { return m_DB.SuperTypesOf(type); }
		bool IsInterface(const clent::TypeDecl& type) const override { return m_DB.IsInterface(type); }
		bool IsAbstract(const clent::TypeDecl& type) const override { return m_DB.IsAbstract(type); }

		std::vector<const clent::MemberDecl*> MembersOf(const clent::TypeDecl& type) const override
		{
			if (type.name == m_BadType)
				throw std::runtime_error("adapter failure");
			return m_DB.MembersOf(type);
		}

	private:
		const clent::DeclDatabase& m_DB;
		std::string m_BadType;
	};
}


TEST(EntityProcessor, CollectsCandidatesOnce)
{
	clent::DeclDatabase db;
	test::AddType(db, "model::Twice", "entity, entity");
	test::AddType(db, "model::Both", "entity, superclass");
	test::AddType(db, "model::Plain", "");
	clent::TypeDecl& standard = db.AddType("model::Standard");
	standard.annotations = test::Attrs("Embeddable", clent::DIALECT_JPA);

	clent::Candidates candidates = clent::CollectCandidates(db, clent::AnnotationCatalog(true));
	ASSERT_EQ(2u, candidates.entities.size());
	EXPECT_EQ("model::Twice", candidates.entities[0]->name);
	EXPECT_EQ("model::Both", candidates.entities[1]->name);
	ASSERT_EQ(1u, candidates.superclasses.size());
	EXPECT_EQ("model::Both", candidates.superclasses[0]->name);
	EXPECT_EQ(1u, candidates.embeddables.size());

	candidates = clent::CollectCandidates(db, clent::AnnotationCatalog(false));
	EXPECT_TRUE(candidates.embeddables.empty());
}


TEST(EntityProcessor, ProcessesPersonModel)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);

	clent::ProcessResult result = clent::Process(db, clent::ProcessingOptions());
	ASSERT_TRUE(result.graph.get() != 0);
	EXPECT_TRUE(result.graph->IsFrozen());
	EXPECT_TRUE(result.diagnostics.empty());
	EXPECT_TRUE(result.invalid.empty());
	EXPECT_EQ(4u, result.graph->Size());

	const clent::EntityDescriptor* person = result.graph->Find("model::Person");
	ASSERT_TRUE(person != 0);
	EXPECT_EQ("Person", person->table_name);
	EXPECT_TRUE(person->HasProperty("id"));
	EXPECT_TRUE(person->HasProperty("emailAddress"));
}


TEST(EntityProcessor, PersonWithAddress)
{
	clent::DeclDatabase db;
	clent::TypeDecl& address = test::AddType(db, "model::Address", "entity", 10);
	test::AddField(db, address, "id", test::Value("int"), "key, generated");

	clent::TypeDecl& person = test::AddType(db, "model::Person", "entity", 20);
	test::AddField(db, person, "id", test::Value("int"), "key, generated");
	test::AddField(db, person, "name", test::Value("std::string"));
	test::AddField(db, person, "address", test::Pointer("model::Address"), "one_to_one");

	clent::ProcessingOptions options;
	clent::ProcessResult result = clent::Process(db, options);
	ASSERT_TRUE(result.graph.get() != 0);
	EXPECT_EQ(2u, result.graph->Size());
	EXPECT_FALSE(clent::HasErrors(result.diagnostics));
	EXPECT_TRUE(result.invalid.empty());

	ASSERT_EQ(1u, result.graph->GetEdges().size());
	const clent::RelationshipEdge* edge = result.graph->FindEdge("model::Person", "address");
	ASSERT_TRUE(edge != 0);
	EXPECT_EQ("model::Address", edge->target);
	EXPECT_EQ(clent::ONE_TO_ONE, edge->property->cardinality);

	// Only Address is left with nothing but its generated key
	ASSERT_EQ(1u, result.diagnostics.size());
	EXPECT_EQ(clent::DIAG_LONE_GENERATED_KEY, result.diagnostics[0].code);
	EXPECT_EQ(clent::SEVERITY_WARNING, result.diagnostics[0].severity);
	EXPECT_EQ("model::Address", result.diagnostics[0].subject);

	// The generated address metadata points at the address type
	std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);
	bool references_address = false;
	for (size_t i = 0; i < files.size(); i++)
	{
		if (files[i].path == "model/Person_.cpp")
			references_address = files[i].text.find(".SetReferencedType(&model::Address_::Type())") != std::string::npos;
	}
	EXPECT_TRUE(references_address);
}


TEST(EntityProcessor, RunsAreRepeatable)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);

	clent::ProcessResult first = clent::Process(db, clent::ProcessingOptions());
	clent::ProcessResult second = clent::Process(db, clent::ProcessingOptions());
	std::string text = clent::GraphToText(*first.graph);
	EXPECT_EQ(text, clent::GraphToText(*second.graph));
	EXPECT_NE(std::string::npos, text.find("model::Person\taddress\tmodel::Address"));
}


TEST(EntityProcessor, ContinuesPastInvalidDeclarations)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);
	clent::TypeDecl& broken = test::AddType(db, "model::Broken", "entity", 90);
	test::AddField(db, broken, "id", test::Value("int"), "key");
	test::AddField(db, broken, "part", clent::TypeRef::Unresolved("Part"));

	clent::ProcessResult result = clent::Process(db, clent::ProcessingOptions());
	EXPECT_TRUE(clent::HasErrors(result.diagnostics));
	ASSERT_EQ(1u, clent::CountDiagnostics(result.diagnostics, clent::DIAG_UNRESOLVED_TYPE));
	EXPECT_EQ(1u, result.invalid.count("model::Broken"));
	EXPECT_TRUE(result.graph->Find("model::Broken") == 0);
	EXPECT_EQ(4u, result.graph->Size());

	const clent::Diagnostic& diag = result.diagnostics[0];
	EXPECT_EQ("model::Broken", diag.subject);
	EXPECT_EQ(90, diag.line);
}


TEST(EntityProcessor, ContainsInternalFailures)
{
	clent::DeclDatabase db;
	test::AddPersonModel(db);
	ThrowingAdapter adapter(db, "model::Address");

	clent::ProcessResult result = clent::Process(adapter, clent::ProcessingOptions());
	ASSERT_EQ(1u, clent::CountDiagnostics(result.diagnostics, clent::DIAG_INTERNAL_FAILURE));
	EXPECT_NE(std::string::npos, result.diagnostics[0].message.find("adapter failure"));
	EXPECT_EQ(1u, result.invalid.count("model::Address"));

	// The rest still builds, without the edge to the missing entity
	EXPECT_TRUE(result.graph->Find("model::Person") != 0);
	EXPECT_TRUE(result.graph->FindEdge("model::Person", "address") == 0);
}


TEST(EntityProcessor, ValidationFollowsBuildFailures)
{
	clent::DeclDatabase db;
	clent::TypeDecl& keyless = test::AddType(db, "model::Keyless", "entity");
	test::AddField(db, keyless, "size", test::Value("int"));
	clent::TypeDecl& broken = test::AddType(db, "model::Broken", "entity");
	test::AddField(db, broken, "part", clent::TypeRef::Unresolved("Part"));

	clent::ProcessResult result = clent::Process(db, clent::ProcessingOptions());
	ASSERT_EQ(2u, result.diagnostics.size());
	EXPECT_EQ(clent::DIAG_UNRESOLVED_TYPE, result.diagnostics[0].code);
	EXPECT_EQ(clent::DIAG_MISSING_KEY, result.diagnostics[1].code);
}
