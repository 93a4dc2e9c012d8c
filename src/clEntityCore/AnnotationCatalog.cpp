
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "AnnotationCatalog.h"


namespace
{
	struct CatalogEntry
	{
		clent::Dialect dialect;
		const char* name;
		clent::AnnotationKind kind;
	};


	const CatalogEntry g_Catalog[] =
	{
		{ clent::DIALECT_NATIVE, "entity", clent::ANNOTATION_ENTITY },
		{ clent::DIALECT_NATIVE, "superclass", clent::ANNOTATION_SUPERCLASS },
		{ clent::DIALECT_NATIVE, "embedded", clent::ANNOTATION_EMBEDDABLE },
		{ clent::DIALECT_NATIVE, "embeddable", clent::ANNOTATION_EMBEDDABLE },
		{ clent::DIALECT_NATIVE, "table", clent::ANNOTATION_TABLE },
		{ clent::DIALECT_NATIVE, "view", clent::ANNOTATION_VIEW },
		{ clent::DIALECT_NATIVE, "immutable", clent::ANNOTATION_IMMUTABLE },
		{ clent::DIALECT_NATIVE, "value", clent::ANNOTATION_IMMUTABLE },
		{ clent::DIALECT_NATIVE, "data", clent::ANNOTATION_IMMUTABLE },
		{ clent::DIALECT_NATIVE, "read_only", clent::ANNOTATION_READ_ONLY },
		{ clent::DIALECT_NATIVE, "property_name_style", clent::ANNOTATION_PROPERTY_NAME_STYLE },
		{ clent::DIALECT_NATIVE, "property_visibility", clent::ANNOTATION_PROPERTY_VISIBILITY },
		{ clent::DIALECT_NATIVE, "key", clent::ANNOTATION_KEY },
		{ clent::DIALECT_NATIVE, "generated", clent::ANNOTATION_GENERATED },
		{ clent::DIALECT_NATIVE, "version", clent::ANNOTATION_VERSION },
		{ clent::DIALECT_NATIVE, "nullable", clent::ANNOTATION_NULLABLE },
		{ clent::DIALECT_NATIVE, "transient", clent::ANNOTATION_TRANSIENT },
		{ clent::DIALECT_NATIVE, "lazy", clent::ANNOTATION_LAZY },
		{ clent::DIALECT_NATIVE, "column", clent::ANNOTATION_COLUMN },
		{ clent::DIALECT_NATIVE, "one_to_one", clent::ANNOTATION_ONE_TO_ONE },
		{ clent::DIALECT_NATIVE, "one_to_many", clent::ANNOTATION_ONE_TO_MANY },
		{ clent::DIALECT_NATIVE, "many_to_one", clent::ANNOTATION_MANY_TO_ONE },
		{ clent::DIALECT_NATIVE, "many_to_many", clent::ANNOTATION_MANY_TO_MANY },

		{ clent::DIALECT_JPA, "Entity", clent::ANNOTATION_ENTITY },
		{ clent::DIALECT_JPA, "MappedSuperclass", clent::ANNOTATION_SUPERCLASS },
		{ clent::DIALECT_JPA, "Embeddable", clent::ANNOTATION_EMBEDDABLE },
		{ clent::DIALECT_JPA, "Table", clent::ANNOTATION_TABLE },
		{ clent::DIALECT_JPA, "Cacheable", clent::ANNOTATION_CACHEABLE },
		{ clent::DIALECT_JPA, "Id", clent::ANNOTATION_KEY },
		{ clent::DIALECT_JPA, "GeneratedValue", clent::ANNOTATION_GENERATED },
		{ clent::DIALECT_JPA, "Version", clent::ANNOTATION_VERSION },
		{ clent::DIALECT_JPA, "Nullable", clent::ANNOTATION_NULLABLE },
		{ clent::DIALECT_JPA, "Transient", clent::ANNOTATION_TRANSIENT },
		{ clent::DIALECT_JPA, "Basic", clent::ANNOTATION_BASIC },
		{ clent::DIALECT_JPA, "Column", clent::ANNOTATION_COLUMN },
		{ clent::DIALECT_JPA, "OneToOne", clent::ANNOTATION_ONE_TO_ONE },
		{ clent::DIALECT_JPA, "OneToMany", clent::ANNOTATION_ONE_TO_MANY },
		{ clent::DIALECT_JPA, "ManyToOne", clent::ANNOTATION_MANY_TO_ONE },
		{ clent::DIALECT_JPA, "ManyToMany", clent::ANNOTATION_MANY_TO_MANY },
	};
}


clent::AnnotationCatalog::AnnotationCatalog(bool accept_jpa)
	: m_AcceptJpa(accept_jpa)
{
}


clent::AnnotationKind clent::AnnotationCatalog::Classify(const AnnotationInstance& annotation) const
{
	if (annotation.dialect == DIALECT_JPA && !m_AcceptJpa)
		return ANNOTATION_UNKNOWN;

	for (size_t i = 0; i < sizeof(g_Catalog) / sizeof(g_Catalog[0]); i++)
	{
		const CatalogEntry& entry = g_Catalog[i];
		if (entry.dialect == annotation.dialect && annotation.name == entry.name)
			return entry.kind;
	}

	return ANNOTATION_UNKNOWN;
}


const clent::AnnotationInstance* clent::AnnotationCatalog::Find(const AnnotationList& annotations, AnnotationKind kind) const
{
	for (size_t i = 0; i < annotations.size(); i++)
	{
		if (Classify(annotations[i]) == kind)
			return &annotations[i];
	}
	return 0;
}
