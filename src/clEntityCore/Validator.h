
//
// ===============================================================================
// clEntity, Validator.h - Structural checks over a frozen entity graph.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "Diagnostics.h"

#include <string>


namespace clent
{
	class EntityGraph;


	//
	// Runs every check independently and returns all findings, ordered by entity name with
	// the relationship edge checks last. The graph is never modified.
	//
	DiagnosticList ValidateGraph(const EntityGraph& graph);


	// Case-insensitive match against the SQL keywords that can't be used unquoted as a table name
	bool IsReservedTableName(const std::string& name);

	bool IsValidIdentifier(const std::string& name);
}
