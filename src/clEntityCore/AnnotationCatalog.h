
//
// ===============================================================================
// clEntity, AnnotationCatalog.h - Maps the attribute names of both annotation
// dialects onto a closed set of annotation kinds.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#pragma once


#include "Declarations.h"


namespace clent
{
	enum AnnotationKind
	{
		ANNOTATION_UNKNOWN,

		// Type markers
		ANNOTATION_ENTITY,
		ANNOTATION_SUPERCLASS,
		ANNOTATION_EMBEDDABLE,
		ANNOTATION_TABLE,
		ANNOTATION_VIEW,
		ANNOTATION_IMMUTABLE,
		ANNOTATION_READ_ONLY,
		ANNOTATION_CACHEABLE,
		ANNOTATION_PROPERTY_NAME_STYLE,
		ANNOTATION_PROPERTY_VISIBILITY,

		// Member markers
		ANNOTATION_KEY,
		ANNOTATION_GENERATED,
		ANNOTATION_VERSION,
		ANNOTATION_NULLABLE,
		ANNOTATION_TRANSIENT,
		ANNOTATION_LAZY,
		ANNOTATION_BASIC,
		ANNOTATION_COLUMN,
		ANNOTATION_ONE_TO_ONE,
		ANNOTATION_ONE_TO_MANY,
		ANNOTATION_MANY_TO_ONE,
		ANNOTATION_MANY_TO_MANY,
	};


	class AnnotationCatalog
	{
	public:
		// Standard dialect annotations are treated as unknown unless accepted
		explicit AnnotationCatalog(bool accept_jpa);

		AnnotationKind Classify(const AnnotationInstance& annotation) const;

		// First annotation of the given kind, or null
		const AnnotationInstance* Find(const AnnotationList& annotations, AnnotationKind kind) const;

		bool Has(const AnnotationList& annotations, AnnotationKind kind) const
		{
			return Find(annotations, kind) != 0;
		}

		bool AcceptsJpa() const { return m_AcceptJpa; }

	private:
		bool m_AcceptJpa;
	};
}
