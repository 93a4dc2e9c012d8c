
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include <clEntityCore/AnnotationCatalog.h>
#include <clEntityCore/AttributeParser.h>
#include <clEntityCore/Logging.h>

#include <gtest/gtest.h>


TEST(AttributeParser, SplitsDialects)
{
	clent::Dialect dialect;
	std::string text;

	ASSERT_TRUE(clent::SplitAnnotationText("attr:key, generated", dialect, text));
	EXPECT_EQ(clent::DIALECT_NATIVE, dialect);
	EXPECT_EQ("key, generated", text);

	ASSERT_TRUE(clent::SplitAnnotationText("jpa:Id", dialect, text));
	EXPECT_EQ(clent::DIALECT_JPA, dialect);
	EXPECT_EQ("Id", text);

	// Annotations for other tools
	EXPECT_FALSE(clent::SplitAnnotationText("container-std::vector-list", dialect, text));
	EXPECT_FALSE(clent::SplitAnnotationText("reflect", dialect, text));
}


TEST(AttributeParser, ParsesFlagsAndArguments)
{
	clent::AnnotationList attrs = clent::ParseAttributes(clent::DIALECT_NATIVE,
		"key, column = \"email\", table(name = \"people\", schema = main), basic(fetch = FetchType::LAZY, optional = false), size = 32",
		"Person.h", 12);
	ASSERT_EQ(5u, attrs.size());

	EXPECT_EQ("key", attrs[0].name);
	EXPECT_TRUE(attrs[0].arguments.empty());
	EXPECT_EQ("Person.h", attrs[0].filename);
	EXPECT_EQ(12, attrs[0].line);

	EXPECT_EQ("column", attrs[1].name);
	EXPECT_EQ("email", attrs[1].GetText("value"));

	EXPECT_EQ("people", attrs[2].GetText("name"));
	EXPECT_EQ("main", attrs[2].GetSymbol("schema"));
	EXPECT_EQ("", attrs[2].GetSymbol("name"));

	EXPECT_EQ("FetchType::LAZY", attrs[3].GetSymbol("fetch"));
	EXPECT_FALSE(attrs[3].GetBool("optional", true));
	EXPECT_TRUE(attrs[3].GetBool("missing", true));

	EXPECT_EQ(32, attrs[4].GetInt("value", 0));
}


TEST(AttributeParser, KeepsAttributesBeforeAnError)
{
	LOG_TO_BUFFER(warnings, ALL);
	logging::ClearBuffer("warnings");

	clent::AnnotationList attrs = clent::ParseAttributes(clent::DIALECT_NATIVE, "key, column(name = ), transient", "Person.h", 7);
	ASSERT_EQ(1u, attrs.size());
	EXPECT_EQ("key", attrs[0].name);

	std::string log = logging::GetBuffer("warnings");
	EXPECT_NE(std::string::npos, log.find("Person.h(7)"));
}


TEST(AttributeParser, FormatsTextItCanReadBack)
{
	clent::AnnotationList attrs = clent::ParseAttributes(clent::DIALECT_NATIVE,
		"one_to_many(target = \"Phone\", lazy), column = \"phone_list\", transient", "", 0);
	ASSERT_EQ(3u, attrs.size());
	EXPECT_EQ("one_to_many(target = \"Phone\", lazy)", clent::FormatAttribute(attrs[0]));
	EXPECT_EQ("column = \"phone_list\"", clent::FormatAttribute(attrs[1]));
	EXPECT_EQ("transient", clent::FormatAttribute(attrs[2]));
}


TEST(AnnotationCatalog, ClassifiesBothDialects)
{
	clent::AnnotationCatalog catalog(true);

	clent::AnnotationList native = clent::ParseAttributes(clent::DIALECT_NATIVE, "entity, embeddable, key, many_to_one, unknown_thing", "", 0);
	EXPECT_EQ(clent::ANNOTATION_ENTITY, catalog.Classify(native[0]));
	EXPECT_EQ(clent::ANNOTATION_EMBEDDABLE, catalog.Classify(native[1]));
	EXPECT_EQ(clent::ANNOTATION_KEY, catalog.Classify(native[2]));
	EXPECT_EQ(clent::ANNOTATION_MANY_TO_ONE, catalog.Classify(native[3]));
	EXPECT_EQ(clent::ANNOTATION_UNKNOWN, catalog.Classify(native[4]));

	clent::AnnotationList jpa = clent::ParseAttributes(clent::DIALECT_JPA, "Entity, MappedSuperclass, Id, GeneratedValue, OneToMany", "", 0);
	EXPECT_EQ(clent::ANNOTATION_ENTITY, catalog.Classify(jpa[0]));
	EXPECT_EQ(clent::ANNOTATION_SUPERCLASS, catalog.Classify(jpa[1]));
	EXPECT_EQ(clent::ANNOTATION_KEY, catalog.Classify(jpa[2]));
	EXPECT_EQ(clent::ANNOTATION_GENERATED, catalog.Classify(jpa[3]));
	EXPECT_EQ(clent::ANNOTATION_ONE_TO_MANY, catalog.Classify(jpa[4]));

	// Dialects don't share names
	clent::AnnotationList mixed = clent::ParseAttributes(clent::DIALECT_JPA, "key", "", 0);
	EXPECT_EQ(clent::ANNOTATION_UNKNOWN, catalog.Classify(mixed[0]));
}


TEST(AnnotationCatalog, IgnoresStandardDialectWhenNotAccepted)
{
	clent::AnnotationCatalog catalog(false);
	clent::AnnotationList jpa = clent::ParseAttributes(clent::DIALECT_JPA, "Entity, Id", "", 0);
	EXPECT_FALSE(catalog.Has(jpa, clent::ANNOTATION_ENTITY));
	EXPECT_TRUE(catalog.Find(jpa, clent::ANNOTATION_KEY) == 0);

	clent::AnnotationList native = clent::ParseAttributes(clent::DIALECT_NATIVE, "entity", "", 0);
	EXPECT_TRUE(catalog.Has(native, clent::ANNOTATION_ENTITY));
}
