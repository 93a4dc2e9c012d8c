
//
// ===============================================================================
// clEntity, AttributeParser.h - A lexer and parser for attributes specified
// in the client C++ code.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#pragma once


#include "Declarations.h"


namespace clent
{
	//
	// Splits raw annotate text such as "attr:key, generated" into its dialect and attribute
	// text. Returns false for annotations that don't belong to clEntity.
	//
	bool SplitAnnotationText(const std::string& annotation, Dialect& dialect, std::string& text);


	//
	// Parses a comma-separated attribute list. Malformed text logs a warning against the
	// given source location and returns whatever attributes were parsed before the error.
	//
	AnnotationList ParseAttributes(Dialect dialect, const char* text, const char* filename, int line);


	// Canonical text for an annotation that ParseAttributes will read back
	std::string FormatAttribute(const AnnotationInstance& annotation);
}
